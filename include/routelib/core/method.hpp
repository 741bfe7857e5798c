#pragma once

#include "routelib/core/data.hpp"
#include "routelib/core/context.hpp"

namespace routelib::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------
    double randomico(std::mt19937 &rng, double min, double max);
    int irandomico(std::mt19937 &rng, int min, int max);
    double get_time_in_seconds();

    /**
     * @brief Wall-clock budget polled cooperatively by the drivers
     */
    class TimeBudget {
        public:
            explicit TimeBudget(double seconds)
                : start_(get_time_in_seconds()), seconds_(seconds) {}

            double elapsed() const { return get_time_in_seconds() - start_; }
            double remaining() const { return std::max(0.0, seconds_ - elapsed()); }
            double fraction() const { return seconds_ > 0 ? std::min(1.0, elapsed() / seconds_) : 1.0; }
            bool expired() const { return elapsed() >= seconds_; }

        private:
            double start_;
            double seconds_;
    };

    /**
     * @brief Random permutation of [0, size) drawn one element at a time
     *
     * Fisher-Yates over a virtual array: only the swapped slots are stored,
     * so drawing k elements costs O(k) memory regardless of size.
     */
    class LazyPermutation {
        public:
            explicit LazyPermutation(std::size_t size) : remaining_(size) {}

            std::optional<std::size_t> next(std::mt19937 &rng);

        private:
            std::size_t slot(std::size_t i) const;

            std::size_t remaining_;
            std::unordered_map<std::size_t, std::size_t> swapped_;
    };

    // -----------------------------------------------------------------------------
    // Logging
    // -----------------------------------------------------------------------------
    const char* logLevelName(LogLevel level);
    LogLevel parseLogLevel(const std::string &name);

    /**
     * Method: LogMessage
     * Description: write "LEVEL;timestamp;message" to the context log if the level is enabled
     */
    void LogMessage(SearchContext &ctx, LogLevel level, const std::string &message);

    // -----------------------------------------------------------------------------
    // IO / Config
    // -----------------------------------------------------------------------------
    // reads config[method], or config[section][method] when a section is given
    void readParametersYaml(const std::string &paramFile, const char* method,
                            std::vector<std::vector<double>> &parameters, int numPar,
                            const char* section = nullptr);

    // driver defaults of a problem variant ("waste" or "tsp")
    TDriverParams DefaultDriverParams(const std::string &problem);

    /**
     * Method: LoadDriverParams
     * Description: read the parameter file of the drivers for one problem variant.
     * Top level keys apply to every variant, keys under the variant's section
     * override them, and values missing from both keep DefaultDriverParams(problem).
     */
    TDriverParams LoadDriverParams(const std::string &paramFile, const std::string &problem);

} // namespace routelib::core
