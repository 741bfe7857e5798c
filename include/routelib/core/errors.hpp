#pragma once

#include <source_location>
#include <stdexcept>
#include <string>

namespace routelib::core {

    // Programming error: an operation was called in a state where it is not defined
    class PreconditionError : public std::logic_error {
        public:
            using std::logic_error::logic_error;
    };

    // Running cost or bookkeeping disagrees with a full recomputation
    class ConsistencyError : public std::logic_error {
        public:
            using std::logic_error::logic_error;
    };

    // Malformed problem description
    class ParseError : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
    };

    // Invalid run configuration or parameter file
    class ConfigError : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
    };

    // Throws PreconditionError naming the calling function when cond is false
    inline void Require(bool cond, const std::string &msg,
                        std::source_location loc = std::source_location::current())
    {
        if (!cond)
            throw PreconditionError(std::string(loc.function_name()) + ": " + msg);
    }

} // namespace routelib::core
