#pragma once

#include "routelib/core/isolution.hpp"
#include "routelib/core/context.hpp"

namespace routelib::mh {

    /**
     * Method: ILS
     * Description: Search process of the Iterated Local Search.
     * Perturbs the incumbent with `kick` random moves, descends with FirstImprovement
     * and keeps the result when it improves.
     */
    template <class C, class M>
    core::SolutionPtr<C, M> ILS(const core::ISolution<C, M> &start, double budget, int kick,
                                core::SearchContext &ctx);

} // namespace routelib::mh
