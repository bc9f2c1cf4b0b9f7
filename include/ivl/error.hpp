// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef IVL_ERROR_HPP
#define IVL_ERROR_HPP

// Error types raised by interval trees.
//
// position_out_of_range is an ordinary, recoverable failure: the caller asked
// for a position outside the tree.  violated_invariant means the tree itself
// can no longer be trusted (a structural precondition failed); it is raised
// after a diagnostic has been written to stderr and is never caught inside
// the library.

#include "ivl/config.hpp"
#include <cstddef>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace ivl {

class position_out_of_range : public std::out_of_range {
public:
    position_out_of_range(const char* where, std::size_t position,
                          std::size_t first, std::size_t last)
        : std::out_of_range(std::string(where) + ": position " + std::to_string(position) +
                            " outside [" + std::to_string(first) + ", " +
                            std::to_string(last) + "]"),
          _position(position), _first(first), _last(last) {}

    // The rejected position, in the caller's coordinates.
    [[nodiscard]] std::size_t position() const noexcept { return _position; }
    // Bounds of the accepted range, inclusive, in the caller's coordinates.
    [[nodiscard]] std::size_t first() const noexcept { return _first; }
    [[nodiscard]] std::size_t last() const noexcept { return _last; }

private:
    std::size_t _position;
    std::size_t _first;
    std::size_t _last;
};

class violated_invariant : public std::logic_error {
public:
    explicit violated_invariant(const char* what)
        : std::logic_error(std::string("ivl: violated invariant: ") + what) {}
};

namespace detail {

    [[noreturn]] inline void throw_violated_invariant(const char* what) {
        throw violated_invariant(what);
    }

} // namespace detail

} // namespace ivl

#ifndef IVL_INVARIANT_FAILURE
#define IVL_INVARIANT_FAILURE(what) ::ivl::detail::throw_violated_invariant(what)
#endif

namespace ivl::detail {

    [[noreturn]] inline void report_violated_invariant(const char* what, const char* expr,
                                                       const char* location) {
        std::fprintf(stderr, "ivl: violated invariant at %s: %s (%s)\n",
                     location ? location : "unknown", what, expr);
        IVL_INVARIANT_FAILURE(what);
        // IVL_INVARIANT_FAILURE may be overridden by something that returns.
        throw violated_invariant(what);
    }

} // namespace ivl::detail

// Structural precondition check.  Always on: a failed check means the tree is
// corrupt, and continuing would corrupt it further.
#define IVL_INVARIANT(cond, what)                                               \
    do {                                                                       \
        if (IVL_UNLIKELY(!(cond)))                                             \
            ::ivl::detail::report_violated_invariant((what), #cond, IVL_SOURCE_LOC); \
    } while (0)

#endif  // IVL_ERROR_HPP
