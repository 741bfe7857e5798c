#pragma once

#include "routelib/core/common.hpp"

namespace routelib::core {

    //--------------------------------------------------------------------------
    // Enum: LogLevel
    // Description: severity of a log message (higher is more verbose)
    //--------------------------------------------------------------------------
    enum class LogLevel { Critical = 0, Error, Warning, Info, Debug };

    //--------------------------------------------------------------------------
    // Struct: TRunData
    // Description: Configuration variables for the search process
    //--------------------------------------------------------------------------
    struct TRunData
    {
        std::string problem;                    // problem variant ("waste" or "tsp")
        std::string instancePath;               // input file ("" reads stdin)
        std::string outputPath;                 // output file ("" writes stdout)
        std::string logPath;                    // log file ("" writes stderr)
        std::string paramPath = "config/params.yaml"; // driver parameters
        std::string csearch = "none";           // construction driver
        std::string lsearch = "none";           // local search driver
        double cbudget = 5.0;                   // time budget of the construction (seconds)
        double lbudget = 5.0;                   // time budget of the local search (seconds)
        long long seed = -1;                    // RNG seed (-1: clock based)
        LogLevel logLevel = LogLevel::Warning;  // most verbose level written to the log
        bool verify = false;                    // check running costs after every mutation
    };

    //--------------------------------------------------------------------------
    // Struct: TDriverParams
    // Description: parameters of the drivers; the initializers are the waste collection
    //              defaults, DefaultDriverParams adjusts them per problem variant
    //--------------------------------------------------------------------------
    struct TDriverParams
    {
        int beamWidth = 10;                     // BEAM: partial solutions kept per level

        double graspAlpha = 0.01;               // GRASP: greediness of the restricted candidate list
        double graspLsBudget = 0.0;             // GRASP: first-improvement budget per construction

        int asAnts = 100;                       // AS: ants per iteration
        double asBeta = 5.0;                    // AS: weight of the heuristic information
        double asRho = 0.5;                     // AS: evaporation rate
        double asTau0 = 1.0 / 3000.0;           // AS: initial pheromone
        double asLsBudget = 0.0;                // AS: first-improvement budget per iteration, split over the ants

        int mmasAnts = 100;                     // MMAS: ants per iteration
        double mmasBeta = 5.0;                  // MMAS: weight of the heuristic information
        double mmasRho = 0.02;                  // MMAS: evaporation rate
        double mmasTauMax = 1.0 / 3000.0;       // MMAS: maximum pheromone
        double mmasGlobalRatio = 0.5;           // MMAS: probability of depositing with the global best
        double mmasLsBudget = 0.0;              // MMAS: first-improvement budget per iteration, split over the ants

        int ilsKick = 3;                        // ILS: random moves per perturbation
        double saTemperature = 30.0;            // SA: initial temperature
    };

} // namespace routelib::core
