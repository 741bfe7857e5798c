#pragma once

#include "routelib/core/isolution.hpp"
#include "routelib/core/context.hpp"

namespace routelib::mh {

    /**
     * Method: GRASP
     * Description: Greedy randomized adaptive search. Each construction picks uniformly
     * from the candidates with delta <= min + alpha * (max - min); when lsBudget > 0 the
     * constructed solution is improved by FirstImprovement. Repeats until `budget` seconds.
     */
    template <class C, class M>
    core::SolutionPtr<C, M> GRASP(const core::ISolution<C, M> &start, double budget, double alpha,
                                  double lsBudget, core::SearchContext &ctx);

} // namespace routelib::mh
