// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef IVL_DEBUG_THREAD_SAFETY_HPP
#define IVL_DEBUG_THREAD_SAFETY_HPP

// Debug-only exclusive-access diagnostics for interval trees.
//
// Every operation on an interval tree may read or write nodes arbitrarily far
// up the tree, so a tree is one resource: a mutating operation must not
// overlap any other access to the same container.  When
// IVL_DEBUG_THREAD_SAFETY is enabled each text container embeds an
// access_tracker and its facade operations open a read or write session on
// it.  Overlapping sessions are reported with a diagnostic before aborting.
//
// In release builds the tracker compiles down to an empty stub.

#include "ivl/config.hpp"

#if IVL_DEBUG_THREAD_SAFETY

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <thread>

namespace ivl::debug {

enum class session_kind : std::uint8_t {
    none  = 0,
    read  = 1,
    write = 2
};

inline const char* session_name(session_kind k) noexcept {
    switch (k) {
        case session_kind::none:  return "none";
        case session_kind::read:  return "read";
        case session_kind::write: return "write";
    }
    return "unknown";
}

// One entry of the diagnostic ring buffer.
struct session_record {
    std::thread::id thread_id{};
    session_kind kind = session_kind::none;
    const char* location = nullptr;
};

// Per-container detector of overlapping tree access.
//
// State word layout:
//
//     [open sessions : 31 bits][writer bit : 1 bit]
//
// A read session is admitted while the writer bit is clear.  A write session
// is admitted only when the word is zero, i.e. the tree is idle.
class access_tracker {
    static constexpr std::uint32_t WRITER_BIT = 1u;
    static constexpr std::uint32_t SESSION_UNIT = 2u;

public:
    access_tracker() = default;
    access_tracker(const access_tracker&) = delete;
    access_tracker& operator=(const access_tracker&) = delete;

    // Closes its session on destruction.
    class session {
    public:
        session(const session&) = delete;
        session& operator=(const session&) = delete;
        session(session&& other) noexcept
            : _tracker(other._tracker), _kind(other._kind) {
            other._tracker = nullptr;
        }
        ~session() {
            if (_tracker) _tracker->_close(_kind);
        }

    private:
        friend class access_tracker;
        session(const access_tracker* tracker, session_kind kind) noexcept
            : _tracker(tracker), _kind(kind) {}

        const access_tracker* _tracker;
        session_kind _kind;
    };

    [[nodiscard]] session open_read(const char* location) const {
        std::uint32_t state = _state.load(std::memory_order_acquire);
        for (;;) {
            if (state & WRITER_BIT)
                _report(session_kind::read, state, location);
            if (_state.compare_exchange_weak(state, state + SESSION_UNIT,
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire))
                break;
        }
        _record(session_kind::read, location);
        return session(this, session_kind::read);
    }

    [[nodiscard]] session open_write(const char* location) const {
        std::uint32_t expected = 0;
        if (!_state.compare_exchange_strong(expected, SESSION_UNIT | WRITER_BIT,
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire))
            _report(session_kind::write, expected, location);
        _record(session_kind::write, location);
        return session(this, session_kind::write);
    }

private:
    void _close(session_kind kind) const noexcept {
        if (kind == session_kind::write) {
            _state.store(0, std::memory_order_release);
            return;
        }
        _state.fetch_sub(SESSION_UNIT, std::memory_order_acq_rel);
    }

    void _record(session_kind kind, const char* location) const {
#if IVL_DEBUG_THREAD_SAFETY_HISTORY > 0
        std::lock_guard<std::mutex> lock(_history_mutex);
        _history[_history_next % _history.size()] =
            session_record{std::this_thread::get_id(), kind, location};
        ++_history_next;
#else
        (void)kind; (void)location;
#endif
    }

    [[noreturn]] void _report(session_kind attempted, std::uint32_t state,
                              const char* location) const {
        std::lock_guard<std::mutex> lock(_history_mutex);

        std::fprintf(stderr,
            "\n"
            "ivl: overlapping interval tree access detected\n"
            "  attempted: %s session on thread %zu at %s\n"
            "  active:    %u session(s), writer %s\n",
            session_name(attempted),
            std::hash<std::thread::id>{}(std::this_thread::get_id()),
            location ? location : "unknown",
            state / SESSION_UNIT,
            (state & WRITER_BIT) ? "open" : "closed");

#if IVL_DEBUG_THREAD_SAFETY_HISTORY > 0
        const std::size_t n = _history_next < _history.size() ? _history_next : _history.size();
        if (n != 0) {
            std::fprintf(stderr, "  recent sessions (oldest first):\n");
            for (std::size_t i = _history_next - n; i < _history_next; ++i) {
                const session_record& rec = _history[i % _history.size()];
                std::fprintf(stderr, "    - thread %zu: %s at %s\n",
                    std::hash<std::thread::id>{}(rec.thread_id),
                    session_name(rec.kind),
                    rec.location ? rec.location : "unknown");
            }
        }
#endif
        std::fprintf(stderr,
            "  an interval tree must be mutated by one writer with no other\n"
            "  reader or writer active on the same container.\n\n");

        IVL_THREAD_SAFETY_ABORT();
    }

    mutable std::atomic<std::uint32_t> _state{0};
    mutable std::mutex _history_mutex;
#if IVL_DEBUG_THREAD_SAFETY_HISTORY > 0
    mutable std::array<session_record, IVL_DEBUG_THREAD_SAFETY_HISTORY> _history{};
#endif
    mutable std::size_t _history_next = 0;
};

} // namespace ivl::debug

#else // !IVL_DEBUG_THREAD_SAFETY

namespace ivl::debug {

// Stub used when IVL_DEBUG_THREAD_SAFETY is disabled.  Mirrors the real
// interface so containers need no preprocessor conditionals of their own.
class access_tracker {
public:
    struct session {
        session() noexcept = default;
    };

    [[nodiscard]] session open_read(const char*) const noexcept { return {}; }
    [[nodiscard]] session open_write(const char*) const noexcept { return {}; }
};

} // namespace ivl::debug

#endif // IVL_DEBUG_THREAD_SAFETY

#endif // IVL_DEBUG_THREAD_SAFETY_HPP
