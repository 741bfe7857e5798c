#pragma once

#include "routelib/problems/waste_collection.hpp"
#include "routelib/problems/tsp.hpp"

namespace routelib::utils {

    /**
     * Reads a waste collection instance: n, two entry rows, two exit rows and
     * four n x n blocks in the order 00, 01, 11, 10.
     * Throws core::ParseError on malformed input.
     */
    problems::WasteCollectionProblem ReadWasteCollection(std::istream &in);

    /**
     * Reads a TSP instance: n followed by n lines of two coordinates.
     * Throws core::ParseError on malformed input.
     */
    problems::TspProblem ReadTsp(std::istream &in);

    /**
     * One "<unit + 1> <orientation>" line per visited container.
     */
    void WriteSolution(std::ostream &out,
                       const core::ISolution<problems::WasteComponent, problems::WasteMove> &s);

    /**
     * One line per visited point, start first, closing duplicate omitted.
     */
    void WriteSolution(std::ostream &out,
                       const core::ISolution<problems::TspComponent, problems::TspMove> &s);

} // namespace routelib::utils
