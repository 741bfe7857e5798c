#pragma once

#include "routelib/core/isolution.hpp"
#include "routelib/core/context.hpp"

namespace routelib::mh {

    /**
     * Method: SA
     * Description: Search process of the Simulated Annealing (SA).
     * Random moves are accepted with the Metropolis criterion; the temperature
     * decreases linearly from T0 to zero over the time budget.
     */
    template <class C, class M>
    core::SolutionPtr<C, M> SA(const core::ISolution<C, M> &start, double budget, double T0,
                               core::SearchContext &ctx);

} // namespace routelib::mh
