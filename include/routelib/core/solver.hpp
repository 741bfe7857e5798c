/**
 * routelib - Solver Front End
 * Reads one instance, runs the selected construction and local search drivers
 */

#pragma once

#include "routelib/core/data.hpp"
#include "routelib/core/context.hpp"
#include "routelib/problems/waste_collection.hpp"
#include "routelib/problems/tsp.hpp"

namespace routelib {

    /**
    * @brief Command line driver of the library
    */
    class RouteSolver {
    public:
        // init() result meaning "arguments accepted, call run()"
        static constexpr int kContinue = -1;

        RouteSolver() = default;

        // -------------------------------------------------------------------------
        // PUBLIC INTERFACE
        // -------------------------------------------------------------------------

        // parses the command line and loads the instance; returns kContinue or an exit status
        int init(int argc, char* argv[]);

        // returns the process exit status
        int run();

    private:
        void openStreams();
        void loadDriverParams();
        void loadProblemData();

        template <class P>
        void solve(const P &problem);

        // -------------------------------------------------------------------------
        // MEMBER VARIABLES
        // -------------------------------------------------------------------------
        core::TRunData runData_;
        core::TDriverParams params_;

        std::ofstream logFile_;
        std::ofstream outFile_;
        std::unique_ptr<core::SearchContext> ctx_;

        std::unique_ptr<problems::WasteCollectionProblem> waste_;
        std::unique_ptr<problems::TspProblem> tsp_;
    };

} // namespace routelib
