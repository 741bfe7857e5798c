#include "routelib/core/solver.hpp"
#include "routelib/core/method.hpp"
#include "routelib/utils/io.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>

// Drivers
#include "routelib/mh/construction.hpp"
#include "routelib/mh/beam.hpp"
#include "routelib/mh/grasp.hpp"
#include "routelib/mh/aco.hpp"
#include "routelib/mh/descent.hpp"
#include "routelib/mh/ils.hpp"
#include "routelib/mh/sa.hpp"

namespace routelib {

    using namespace routelib::core;

    namespace {

        // identical copies of the empty route, the depot is the only start
        std::vector<SolutionPtr<problems::WasteComponent, problems::WasteMove>>
        MakeAnts(const problems::WasteCollectionProblem &problem, int count, bool verify)
        {
            std::vector<SolutionPtr<problems::WasteComponent, problems::WasteMove>> ants;
            for (int k = 0; k < count; k++) {
                ants.push_back(problem.emptySolution());
                ants.back()->setVerification(verify);
            }
            return ants;
        }

        // one ant per start point
        std::vector<SolutionPtr<problems::TspComponent, problems::TspMove>>
        MakeAnts(const problems::TspProblem &problem, int, bool verify)
        {
            std::vector<SolutionPtr<problems::TspComponent, problems::TspMove>> ants;
            for (int start = 0; start < problem.getDimension(); start++) {
                ants.push_back(problem.emptySolutionWithStart(start));
                ants.back()->setVerification(verify);
            }
            return ants;
        }

    } // namespace

    int RouteSolver::init(int argc, char* argv[]) {
        CLI::App app{"routelib - construction and local search for routing problems"};

        std::string logLevel = "warning";

        app.add_option("-p,--problem", runData_.problem, "Problem variant")
           ->required()
           ->check(CLI::IsMember({"waste", "tsp"}));
        app.add_option("-i,--input-file", runData_.instancePath, "Instance file (default: stdin)")
           ->check(CLI::ExistingFile);
        app.add_option("-o,--output-file", runData_.outputPath, "Solution file (default: stdout)");
        app.add_option("--csearch", runData_.csearch, "Construction driver")
           ->check(CLI::IsMember({"beam", "grasp", "greedy", "heuristic", "as", "mmas", "none"}));
        app.add_option("--cbudget", runData_.cbudget, "Construction time budget (seconds)")
           ->check(CLI::NonNegativeNumber);
        app.add_option("--lsearch", runData_.lsearch, "Local search driver")
           ->check(CLI::IsMember({"bi", "fi", "ils", "rls", "sa", "none"}));
        app.add_option("--lbudget", runData_.lbudget, "Local search time budget (seconds)")
           ->check(CLI::NonNegativeNumber);
        app.add_option("-c,--config", runData_.paramPath, "Driver parameter file (YAML)");
        app.add_option("-s,--seed", runData_.seed, "RNG Seed (default: random)");
        app.add_option("--log-level", logLevel, "Most verbose level written to the log")
           ->check(CLI::IsMember({"critical", "error", "warning", "info", "debug"}));
        app.add_option("--log-file", runData_.logPath, "Log file (default: stderr)");
        app.add_flag("--verify", runData_.verify, "Check the running cost after every mutation");

        try {
            CLI11_PARSE(app, argc, argv);
            runData_.logLevel = parseLogLevel(logLevel);
            openStreams();
            loadDriverParams();
            loadProblemData();
            return kContinue;
        } catch (const std::exception &e) {
            std::cerr << "Initialization Error: " << e.what() << std::endl;
            return 1;
        }
    }

    void RouteSolver::openStreams() {
        if (!runData_.logPath.empty()) {
            logFile_.open(runData_.logPath);
            if (!logFile_.is_open()) throw ConfigError("Cannot open log file: " + runData_.logPath);
        }
        if (!runData_.outputPath.empty()) {
            outFile_.open(runData_.outputPath);
            if (!outFile_.is_open()) throw ConfigError("Cannot open output file: " + runData_.outputPath);
        }

        unsigned int seed = (runData_.seed < 0)
            ? static_cast<unsigned int>(std::chrono::steady_clock::now().time_since_epoch().count())
            : static_cast<unsigned int>(runData_.seed);

        std::ostream &log = logFile_.is_open() ? static_cast<std::ostream&>(logFile_) : std::cerr;
        ctx_ = std::make_unique<SearchContext>(seed, log, runData_.logLevel);
    }

    void RouteSolver::loadDriverParams() {
        params_ = DefaultDriverParams(runData_.problem);
        if (!std::filesystem::exists(runData_.paramPath)) {
            LogMessage(*ctx_, LogLevel::Warning,
                       "Parameter file " + runData_.paramPath + " not found, using default driver parameters");
            return;
        }
        params_ = LoadDriverParams(runData_.paramPath, runData_.problem);
    }

    void RouteSolver::loadProblemData() {
        std::ifstream file;
        if (!runData_.instancePath.empty()) {
            file.open(runData_.instancePath);
            if (!file.is_open()) throw ParseError("Cannot open instance file: " + runData_.instancePath);
        }
        std::istream &in = file.is_open() ? static_cast<std::istream&>(file) : std::cin;

        if (runData_.problem == "waste")
            waste_ = std::make_unique<problems::WasteCollectionProblem>(utils::ReadWasteCollection(in));
        else
            tsp_ = std::make_unique<problems::TspProblem>(utils::ReadTsp(in));
    }

    int RouteSolver::run() {
        try {
            if (waste_) solve(*waste_);
            else solve(*tsp_);
            return 0;
        } catch (const std::exception &e) {
            LogMessage(*ctx_, LogLevel::Critical, e.what());
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    template <class P>
    void RouteSolver::solve(const P &problem) {
        using Solution = typename P::Solution;
        using Ptr = std::unique_ptr<Solution>;
        using Driver = std::function<Ptr(const Solution&)>;

        SearchContext &ctx = *ctx_;
        const TRunData &rd = runData_;
        const TDriverParams &par = params_;

        // construction drivers ("none" keeps the empty solution)
        const std::map<std::string, Driver> constructions = {
            {"heuristic", [&](const Solution &s) { return mh::Heuristic(s, ctx); }},
            {"greedy",    [&](const Solution &s) { return mh::Greedy(s, ctx); }},
            {"beam",      [&](const Solution &s) { return mh::BeamSearch(s, par.beamWidth, ctx); }},
            {"grasp",     [&](const Solution &s) {
                return mh::GRASP(s, rd.cbudget, par.graspAlpha, par.graspLsBudget, ctx); }},
            {"as",        [&](const Solution &) {
                auto ants = MakeAnts(problem, par.asAnts, rd.verify);
                return mh::AS(ants, rd.cbudget, par.asBeta, par.asRho, par.asTau0,
                              par.asLsBudget / ants.size(), ctx); }},
            {"mmas",      [&](const Solution &) {
                auto ants = MakeAnts(problem, par.mmasAnts, rd.verify);
                return mh::MMAS(ants, rd.cbudget, par.mmasBeta, par.mmasRho, par.mmasTauMax,
                                par.mmasGlobalRatio, par.mmasLsBudget / ants.size(), ctx); }}
        };

        // local search drivers
        const std::map<std::string, Driver> localSearches = {
            {"bi",  [&](const Solution &s) { return mh::BestImprovement(s, rd.lbudget, ctx); }},
            {"fi",  [&](const Solution &s) { return mh::FirstImprovement(s, rd.lbudget, ctx); }},
            {"rls", [&](const Solution &s) { return mh::RLS(s, rd.lbudget, ctx); }},
            {"ils", [&](const Solution &s) { return mh::ILS(s, rd.lbudget, par.ilsKick, ctx); }},
            {"sa",  [&](const Solution &s) { return mh::SA(s, rd.lbudget, par.saTemperature, ctx); }}
        };

        Ptr s = problem.emptySolution();
        s->setVerification(rd.verify);

        double start = get_time_in_seconds();
        ctx.resetStopFlag();

        if (auto it = constructions.find(rd.csearch); s && it != constructions.end())
            s = it->second(*s);

        if (auto it = localSearches.find(rd.lsearch); s && it != localSearches.end())
            s = it->second(*s);

        double end = get_time_in_seconds();

        std::ostringstream msg;
        msg << std::fixed << std::setprecision(3);
        if (s) {
            std::ostream &out = outFile_.is_open() ? static_cast<std::ostream&>(outFile_) : std::cout;
            utils::WriteSolution(out, *s);
            out.flush();

            if (std::optional<double> ofv = s->objective())
                msg << "Objective: " << *ofv;
            else
                msg << "Objective: None";
        }
        else {
            msg << "Objective: no solution found";
        }
        LogMessage(ctx, LogLevel::Info, msg.str());

        std::ostringstream elapsed;
        elapsed << std::fixed << std::setprecision(4) << "Elapsed solving time: " << (end - start);
        LogMessage(ctx, LogLevel::Info, elapsed.str());
    }

} // namespace routelib
