#pragma once

#include "routelib/core/isolution.hpp"
#include "routelib/core/context.hpp"

namespace routelib::mh {

    /**
     * Method: Heuristic
     * Description: Complete the solution by repeatedly adding greedyAddCandidate().
     */
    template <class C, class M>
    core::SolutionPtr<C, M> Heuristic(const core::ISolution<C, M> &start, core::SearchContext &ctx);

    /**
     * Method: Greedy
     * Description: Complete the solution by repeatedly adding the candidate with the smallest deltaForAdd().
     */
    template <class C, class M>
    core::SolutionPtr<C, M> Greedy(const core::ISolution<C, M> &start, core::SearchContext &ctx);

} // namespace routelib::mh
