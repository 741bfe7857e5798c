#include "routelib/core/method.hpp"
#include "routelib/core/errors.hpp"

#include <yaml-cpp/yaml.h>
#include <type_traits>

namespace routelib::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    double randomico(std::mt19937 &rng, double min, double max)
    {
        return std::uniform_real_distribution<double>(min, max)(rng);
    }

    int irandomico(std::mt19937 &rng, int min, int max)
    {
        return std::uniform_int_distribution<int>(min, max)(rng);
    }

    double get_time_in_seconds() {
        #if defined(_WIN32) || defined(_WIN64)
            LARGE_INTEGER frequency;
            LARGE_INTEGER timeCur;
            QueryPerformanceFrequency(&frequency);
            QueryPerformanceCounter(&timeCur);
            return static_cast<double>(timeCur.QuadPart) / frequency.QuadPart;
        #else
            struct timespec timeCur;
            clock_gettime(CLOCK_MONOTONIC, &timeCur);
            return timeCur.tv_sec + timeCur.tv_nsec / 1e9;
        #endif
    }

    std::size_t LazyPermutation::slot(std::size_t i) const
    {
        auto it = swapped_.find(i);
        return it == swapped_.end() ? i : it->second;
    }

    std::optional<std::size_t> LazyPermutation::next(std::mt19937 &rng)
    {
        if (remaining_ == 0) return std::nullopt;

        std::size_t k = std::uniform_int_distribution<std::size_t>(0, remaining_ - 1)(rng);
        std::size_t last = remaining_ - 1;
        std::size_t value = slot(k);

        // move the tail element into the drawn slot, the tail slot is never read again
        if (k != last) swapped_[k] = slot(last);
        swapped_.erase(last);
        remaining_--;
        return value;
    }

    // -----------------------------------------------------------------------------
    // Logging
    // -----------------------------------------------------------------------------

    const char* logLevelName(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::Critical: return "CRITICAL";
            case LogLevel::Error:    return "ERROR";
            case LogLevel::Warning:  return "WARNING";
            case LogLevel::Info:     return "INFO";
            default:                 return "DEBUG";
        }
    }

    LogLevel parseLogLevel(const std::string &name)
    {
        static const std::map<std::string, LogLevel> levels = {
            {"critical", LogLevel::Critical}, {"error", LogLevel::Error},
            {"warning", LogLevel::Warning},   {"info", LogLevel::Info},
            {"debug", LogLevel::Debug}
        };

        auto it = levels.find(name);
        if (it == levels.end())
            throw ConfigError("Unknown log level: " + name);
        return it->second;
    }

    void LogMessage(SearchContext &ctx, LogLevel level, const std::string &message)
    {
        if (!ctx.logEnabled(level)) return;

        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        #if defined(_WIN32) || defined(_WIN64)
            localtime_s(&local, &now);
        #else
            localtime_r(&now, &local);
        #endif

        // drivers may log from OpenMP worker threads
        #pragma omp critical(routelib_log)
        {
            ctx.logStream() << logLevelName(level) << ';'
                            << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ';'
                            << message << '\n';
        }
    }

    // -----------------------------------------------------------------------------
    // IO / Config
    // -----------------------------------------------------------------------------

    void readParametersYaml(const std::string &paramFile, const char* method,
                            std::vector<std::vector<double>> &parameters, int numPar,
                            const char* section)
    {
        parameters.assign(numPar, {});

        try {
            YAML::Node config = YAML::LoadFile(paramFile);

            // an absent section or method keeps its defaults
            if (section && !config[section]) return;
            YAML::Node scope = section ? config[section] : config;
            if (scope.IsNull()) return;
            if (!scope.IsMap())
                throw ConfigError(std::string("Expected a map of methods") +
                                  (section ? std::string(" in section ") + section : std::string()) + " in " + paramFile);
            if (!scope[method]) return;

            const YAML::Node& methodNode = scope[method];

            if (!methodNode.IsSequence())
                throw ConfigError(std::string("Invalid format for method ") + method + " (expected a list of lists) in " + paramFile);

            int limit = std::min(numPar, static_cast<int>(methodNode.size()));

            for (int i = 0; i < limit; i++) {
                if (!methodNode[i].IsSequence()) continue;

                for (const auto& val : methodNode[i]) {
                    parameters[i].push_back(val.as<double>());
                }
            }

        } catch (const YAML::BadFile&) {
            throw ConfigError("Cannot open parameter file: " + paramFile);
        } catch (const YAML::ParserException& e) {
            throw ConfigError(std::string("YAML syntax error: ") + e.what());
        } catch (const YAML::BadConversion& e) {
            throw ConfigError(std::string("Non-numeric parameter for method ") + method + ": " + e.what());
        }
    }

    TDriverParams DefaultDriverParams(const std::string &problem)
    {
        TDriverParams p;

        if (problem == "tsp") {
            p.graspLsBudget = 0.1;
            p.asLsBudget = 1.0;
            p.mmasRho = 0.05;
            p.mmasGlobalRatio = 0.1;
            p.mmasLsBudget = 1.0;
            p.saTemperature = 10.0;
        }
        return p;
    }

    TDriverParams LoadDriverParams(const std::string &paramFile, const std::string &problem)
    {
        TDriverParams p = DefaultDriverParams(problem);
        std::vector<std::vector<double>> parameters;

        // first value of list i, when present
        auto pick = [&parameters](int i, auto &target) {
            if (i < (int)parameters.size() && !parameters[i].empty())
                target = static_cast<std::remove_reference_t<decltype(target)>>(parameters[i][0]);
        };

        // top level keys first, then the section named after the problem variant
        for (const char* section : {static_cast<const char*>(nullptr), problem.c_str()}) {
            readParametersYaml(paramFile, "BEAM", parameters, 1, section);
            pick(0, p.beamWidth);

            readParametersYaml(paramFile, "GRASP", parameters, 2, section);
            pick(0, p.graspAlpha);
            pick(1, p.graspLsBudget);

            readParametersYaml(paramFile, "AS", parameters, 5, section);
            pick(0, p.asAnts);
            pick(1, p.asBeta);
            pick(2, p.asRho);
            pick(3, p.asTau0);
            pick(4, p.asLsBudget);

            readParametersYaml(paramFile, "MMAS", parameters, 6, section);
            pick(0, p.mmasAnts);
            pick(1, p.mmasBeta);
            pick(2, p.mmasRho);
            pick(3, p.mmasTauMax);
            pick(4, p.mmasGlobalRatio);
            pick(5, p.mmasLsBudget);

            readParametersYaml(paramFile, "ILS", parameters, 1, section);
            pick(0, p.ilsKick);

            readParametersYaml(paramFile, "SA", parameters, 1, section);
            pick(0, p.saTemperature);
        }

        if (p.beamWidth < 1 || p.asAnts < 1 || p.mmasAnts < 1)
            throw ConfigError("Beam width and ant counts must be positive in " + paramFile);
        if (p.asRho < 0 || p.asRho > 1 || p.mmasRho < 0 || p.mmasRho > 1)
            throw ConfigError("Evaporation rates must lie in [0, 1] in " + paramFile);

        return p;
    }

} // namespace routelib::core
