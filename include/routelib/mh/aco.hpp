#pragma once

#include "routelib/core/isolution.hpp"
#include "routelib/core/context.hpp"

namespace routelib::mh {

    /**
     * Method: AS
     * Description: Ant System. Every iteration completes each ant from its start solution
     * (in parallel, one generator per ant), evaporates the pheromone by rho and lets every
     * ant deposit 1 / objective on its components.
     */
    template <class C, class M>
    core::SolutionPtr<C, M> AS(const std::vector<core::SolutionPtr<C, M>> &ants, double budget,
                               double beta, double rho, double tau0, double lsBudget,
                               core::SearchContext &ctx);

    /**
     * Method: MMAS
     * Description: MAX-MIN Ant System. Only one ant deposits per iteration: the best so far
     * with probability globalRatio, otherwise the iteration best. Pheromone is kept in
     * [tauMax / (2 n), tauMax] where n is the number of components of a solution.
     */
    template <class C, class M>
    core::SolutionPtr<C, M> MMAS(const std::vector<core::SolutionPtr<C, M>> &ants, double budget,
                                 double beta, double rho, double tauMax, double globalRatio,
                                 double lsBudget, core::SearchContext &ctx);

} // namespace routelib::mh
