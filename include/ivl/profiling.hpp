// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef IVL_PROFILING_HPP
#define IVL_PROFILING_HPP

// Optional scoped profiler for interval tree operations.
//
// Define IVL_ENABLE_PROFILING before including this header to log the time
// spent in find, split and balancing passes to std::clog, together with the
// number of rotations a balancing pass performed.  When the macro is not
// defined the profiler compiles to a zero-cost no-op.

#include <cstddef>
#include <string_view>

#ifdef IVL_ENABLE_PROFILING

#include <chrono>
#include <iostream>
#include <string>

namespace ivl {
class profiler {
public:
    explicit profiler(std::string_view label)
        : _label(label), _start(std::chrono::steady_clock::now()) {}

    profiler(const profiler&) = delete;
    profiler& operator=(const profiler&) = delete;

    ~profiler() {
        auto end = std::chrono::steady_clock::now();
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(end - _start).count();
        std::clog << "[ivl::profiler] " << _label << " took " << us << " us";
        if (_rotations != 0)
            std::clog << " (" << _rotations << " rotations)";
        std::clog << '\n';
    }

    void add_rotations(std::size_t n) noexcept { _rotations += n; }

private:
    std::string _label;
    std::chrono::steady_clock::time_point _start;
    std::size_t _rotations = 0;
};
}

#else  // IVL_ENABLE_PROFILING

namespace ivl {
class profiler {
public:
    constexpr explicit profiler(const char*) noexcept {}
    constexpr explicit profiler(std::string_view) noexcept {}
    constexpr void add_rotations(std::size_t) noexcept {}
};
}

#endif  // IVL_ENABLE_PROFILING

#endif  // IVL_PROFILING_HPP
