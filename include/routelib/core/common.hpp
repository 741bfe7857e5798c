#pragma once

// -------------------------------------------------------------------------
// 1. SYSTEM HEADERS
// -------------------------------------------------------------------------
#if defined(_WIN32) || defined(_WIN64)
    #define NOMINMAX // avoid clashes with std::min/std::max on Windows
    #include <windows.h>
#else
    #include <sys/time.h>
    #include <ctime>
#endif

// -------------------------------------------------------------------------
// 2. STANDARD C++ LIBRARY (Commonly used across the project)
// -------------------------------------------------------------------------
// Containers
#include <vector>
#include <array>
#include <string>
#include <map>
#include <set>
#include <unordered_map>
#include <optional>
#include <utility> // std::pair
#include <ranges>
#include <functional> // std::function

// Math & Algorithms
#include <cmath>
#include <algorithm>
#include <numeric> // std::iota, std::accumulate
#include <limits>  // std::numeric_limits

// IO & Strings
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <cstdint>
#include <cstdlib>

// Concurrency & Randoms
#include <atomic>
#include <random>
#include <chrono>

#include <memory> // std::unique_ptr

// -------------------------------------------------------------------------
// 3. GLOBAL CONSTANTS
// -------------------------------------------------------------------------
namespace routelib::core {

    inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

    // relative tolerance used when comparing a running cost against a full recomputation
    inline constexpr double kCostTolerance = 1e-9;

    // smallest decrease accepted as an improvement by the descent drivers
    inline constexpr double kImprovementEpsilon = 1e-9;

    inline bool nearlyEqual(double a, double b, double tol = kCostTolerance) {
        double scale = std::max({1.0, std::abs(a), std::abs(b)});
        return std::abs(a - b) <= tol * scale;
    }

} // namespace routelib::core
