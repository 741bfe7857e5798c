#pragma once

#include "routelib/core/isolution.hpp"
#include "routelib/core/context.hpp"

namespace routelib::mh {

    /**
     * Method: FirstImprovement
     * Description: Apply the first improving move of a randomized neighborhood scan
     * until a local optimum or `budget` seconds.
     */
    template <class C, class M>
    core::SolutionPtr<C, M> FirstImprovement(const core::ISolution<C, M> &start, double budget,
                                             core::SearchContext &ctx);

    /**
     * Method: BestImprovement
     * Description: Apply the best move of the full neighborhood while it improves.
     */
    template <class C, class M>
    core::SolutionPtr<C, M> BestImprovement(const core::ISolution<C, M> &start, double budget,
                                            core::SearchContext &ctx);

    /**
     * Method: RLS
     * Description: Random local search, applies random non-worsening moves until `budget` seconds.
     */
    template <class C, class M>
    core::SolutionPtr<C, M> RLS(const core::ISolution<C, M> &start, double budget,
                                core::SearchContext &ctx);

} // namespace routelib::mh
