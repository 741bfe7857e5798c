#pragma once
#include "routelib/core/isolution.hpp"

namespace routelib::core {

    // Abstract interface of an immutable problem instance
    template <class TComponent, class TLocalMove>
    class IProblem {
        public:
            using Solution = ISolution<TComponent, TLocalMove>;

            // virtual destructor is required for safe polymorphism
            virtual ~IProblem() = default;

            virtual int getDimension() const = 0;

            // Solutions keep a pointer to the problem: it must outlive them
            virtual std::unique_ptr<Solution> emptySolution() const = 0;
        };

}
