/**
 * routelib - Search Context
 * Per-run state handed explicitly to every driver
 */

#pragma once

#include "routelib/core/data.hpp"

namespace routelib::core {

    /**
    * @brief Holds the random generator, stop flag and log sink of one search
    *
    * Owned by the caller and passed by reference, so independent searches
    * (ensemble members, tests) never share random state.
    */
    class SearchContext {
      public:
          explicit SearchContext(unsigned int seed = 0,
                                 std::ostream &log = std::clog,
                                 LogLevel level = LogLevel::Warning)
              : rng_(seed), stopExecution_(false), log_(&log), level_(level)
          {}

          SearchContext(const SearchContext&) = delete;
          SearchContext& operator=(const SearchContext&) = delete;

          // -------------------------------------------------------------------------
          // SHARED STATE ACCESSORS
          // -------------------------------------------------------------------------

          std::mt19937& getRng() { return rng_; }

          void resetStopFlag() { stopExecution_.store(false); }

          void signalStop() { stopExecution_.store(true); }

          bool shouldStop() const { return stopExecution_.load(); }

          // -------------------------------------------------------------------------
          // LOGGING
          // -------------------------------------------------------------------------

          bool logEnabled(LogLevel level) const { return level <= level_; }

          std::ostream& logStream() { return *log_; }

      private:
          std::mt19937 rng_;
          std::atomic<bool> stopExecution_;
          std::ostream *log_;
          LogLevel level_;
      };

} // namespace routelib::core
