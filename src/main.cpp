#include "routelib/core/solver.hpp"

int main(int argc, char *argv[]) {
    routelib::RouteSolver solver;

    // reads the command line, the parameter file and the instance
    int status = solver.init(argc, argv);

    // --help, invalid arguments or unreadable input
    if (status != routelib::RouteSolver::kContinue) return status;

    return solver.run();
}
