// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef IVL_TEXT_HPP
#define IVL_TEXT_HPP

// Text containers owning an interval tree.
//
// basic_text<BeginOffset> stores its characters in a std::string and owns the
// interval tree describing their properties.  Two flavours exist:
//
//   text_buffer  -- buffer-like, positions start at 1
//   text_string  -- string-like, positions start at 0
//
// The whole tree is a single resource.  Every facade operation opens a read
// or write session on the container's access tracker for its duration; with
// IVL_DEBUG_THREAD_SAFETY enabled, overlapping sessions are reported.  The
// tree itself never opens sessions, so calling back into attach_root() and
// detach_root() from inside a tree operation is fine.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include "ivl/config.hpp"
#include "ivl/container.hpp"
#include "ivl/debug/thread_safety.hpp"
#include "ivl/error.hpp"
#include "ivl/interval.hpp"
#include "ivl/profiling.hpp"

namespace ivl {

template <std::size_t BeginOffset>
class basic_text final : public container {
public:
    basic_text() = default;
    explicit basic_text(std::string_view text) : _text(text) {}
    ~basic_text() override = default;

    // ========== Container contract ==========

    [[nodiscard]] size_type begin_offset() const noexcept override { return BeginOffset; }
    [[nodiscard]] size_type length() const noexcept override { return _text.size(); }

    void attach_root(std::unique_ptr<interval> root) override {
        if (root) root->set_owner(this);
        _intervals = std::move(root);
    }

    [[nodiscard]] std::unique_ptr<interval> detach_root() noexcept override {
        return std::move(_intervals);
    }

    [[nodiscard]] interval* root() noexcept override { return _intervals.get(); }
    [[nodiscard]] const interval* root() const noexcept override { return _intervals.get(); }

    // ========== Text ==========

    [[nodiscard]] std::string_view text() const {
        [[maybe_unused]] auto session = _access.open_read(IVL_LOC);
        return _text;
    }

    [[nodiscard]] size_type size() const noexcept { return _text.size(); }
    [[nodiscard]] bool empty() const noexcept { return _text.empty(); }

    // ========== Intervals ==========

    // The root interval, created on first use.  nullptr while the text is
    // empty.
    interval* intervals() {
        [[maybe_unused]] auto session = _access.open_write(IVL_LOC);
        return _ensure_intervals();
    }

    // The interval containing `position` (absolute, from begin_offset()).
    // The end position maps to the last interval.
    interval& find_interval(size_type position) {
        [[maybe_unused]] auto session = _access.open_write(IVL_LOC);
        interval* tree = _ensure_intervals();
        if (!tree)
            throw position_out_of_range("basic_text::find_interval", position,
                                        BeginOffset, BeginOffset);
        interval& found = tree->find(position);
        _verify();
        return found;
    }

    // Weight-balances the whole tree.  Returns the number of rotations.
    std::size_t balance_intervals() {
        [[maybe_unused]] auto session = _access.open_write(IVL_LOC);
        if (!_intervals) return 0;

        ivl::profiler prof("basic_text::balance_intervals");
        const std::size_t rotations = interval::balance(_intervals);
        prof.add_rotations(rotations);
        _verify();
        return rotations;
    }

    // Visits every interval left to right with fresh position caches.
    template <typename Fn>
    void traverse_intervals(Fn&& fn) {
        [[maybe_unused]] auto session = _access.open_write(IVL_LOC);
        if (_intervals) _intervals->traverse(BeginOffset, std::forward<Fn>(fn));
    }

    // Full structural check: the root is tagged with this container, covers
    // the whole text, and every node satisfies interval::check_invariants().
    void check_intervals() const {
        [[maybe_unused]] auto session = _access.open_read(IVL_LOC);
        _check();
    }

private:
    interval* _ensure_intervals() {
        if (!_intervals && !_text.empty()) interval::create_root(*this);
        return _intervals.get();
    }

    void _verify() const {
#if IVL_CHECK_INVARIANTS
        _check();
#endif
    }

    void _check() const {
        if (!_intervals) return;
        IVL_INVARIANT(_intervals->owner() == this, "root is not linked to its container");
        IVL_INVARIANT(_intervals->total_length() == _text.size(), "tree does not cover the text");
        _intervals->check_invariants();
    }

    std::string _text;
    std::unique_ptr<interval> _intervals;
    debug::access_tracker _access;
};

using text_buffer = basic_text<1>;
using text_string = basic_text<0>;

} // namespace ivl

#endif  // IVL_TEXT_HPP
