#pragma once

#include "routelib/core/isolution.hpp"
#include "routelib/core/context.hpp"

namespace routelib::mh {

    /**
     * Method: BeamSearch
     * Description: Level-by-level construction keeping the `width` partial solutions
     * with the smallest lower bound. Candidates whose bound already reaches the best
     * complete objective are pruned.
     */
    template <class C, class M>
    core::SolutionPtr<C, M> BeamSearch(const core::ISolution<C, M> &start, int width, core::SearchContext &ctx);

} // namespace routelib::mh
