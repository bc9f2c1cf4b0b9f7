// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef IVL_INTERVAL_HPP
#define IVL_INTERVAL_HPP

// Weighted, self-balancing interval tree attaching property lists to
// contiguous spans of a text sequence.

#include <cstddef>
#include <cstdlib>
#include <memory>
#include <utility>
#include <variant>
#include <vector>
#include "ivl/config.hpp"
#include "ivl/container.hpp"
#include "ivl/error.hpp"
#include "ivl/profiling.hpp"
#include "ivl/property_list.hpp"

namespace ivl {

// One node of an interval tree.
//
// Each node owns a span of the sequence (its "own" range) plus everything in
// its two subtrees.  Only the cumulative weight is stored:
//
//   length() == total_length() - left_total_length() - right_total_length()
//
// An in-order walk yields the spans left to right, covering the sequence with
// no gaps or overlaps.  Every node still in a tree has length() > 0.
//
// Ownership is strictly hierarchical: a node owns its children, and the root
// is owned by its container.  The parent link is a non-owning back-reference
// tagged as either a node or the container (only the root carries the
// container tag).  It is re-pointed on every reattachment.
//
// position() is a cache of the absolute start of the own range.  It is fresh
// on a node just returned by find(), next(), prev(), update() or a split, and
// may be stale on any other node.  Ordering never depends on it.
//
// Structural invariant violations raise ivl::violated_invariant; positions
// outside the tree raise ivl::position_out_of_range.
//
// Example usage:
//   ivl::text_buffer buf("hello world");
//   ivl::interval& word = buf.find_interval(7);   // whole buffer, 1-based
//   ivl::interval& tail = word.split_right(5);    // [1,6) and [6,12)
//   tail.plist().put("face", "bold");
class interval {
public:
    using size_type = std::size_t;

    interval() noexcept = default;
    explicit interval(size_type total_length) noexcept { _data.total_length = total_length; }

    // Back-references point at nodes, so a node never changes address.
    interval(const interval&) = delete;
    interval& operator=(const interval&) = delete;
    ~interval() = default;

    // Creates the root interval of `owner`, covering its whole current
    // length, and attaches it.  An empty container has no intervals.
    static interval& create_root(container& owner) {
        IVL_INVARIANT(owner.root() == nullptr, "create_root: container already has intervals");
        IVL_INVARIANT(owner.length() > 0, "create_root: container is empty");
        auto root = std::make_unique<interval>(owner.length());
        root->_data.position = owner.begin_offset();
        interval& created = *root;
        owner.attach_root(std::move(root));
        return created;
    }

    // ========== Lengths ==========

    [[nodiscard]] size_type total_length() const noexcept { return _data.total_length; }

    [[nodiscard]] size_type left_total_length() const noexcept {
        return _left ? _left->_data.total_length : 0;
    }

    [[nodiscard]] size_type right_total_length() const noexcept {
        return _right ? _right->_data.total_length : 0;
    }

    // Size of the own range, excluding both subtrees.
    [[nodiscard]] size_type length() const noexcept {
        return _data.total_length - left_total_length() - right_total_length();
    }

    [[nodiscard]] size_type position() const noexcept { return _data.position; }
    [[nodiscard]] size_type end_position() const noexcept { return _data.position + length(); }

    // ========== Topology ==========

    [[nodiscard]] bool has_left() const noexcept { return _left != nullptr; }
    [[nodiscard]] bool has_right() const noexcept { return _right != nullptr; }
    [[nodiscard]] bool has_children() const noexcept { return _left || _right; }
    [[nodiscard]] bool has_both_children() const noexcept { return _left && _right; }

    // True if the parent link names another node.
    [[nodiscard]] bool has_parent() const noexcept { return parent() != nullptr; }

    // True if the parent link names the owning container.
    [[nodiscard]] bool is_root() const noexcept { return owner() != nullptr; }

    // Neither parent node nor children: the sole interval of its tree.
    [[nodiscard]] bool is_only() const noexcept { return !has_parent() && !has_children(); }

    [[nodiscard]] bool is_left_child() const noexcept {
        const interval* p = parent();
        return p && p->_left.get() == this;
    }

    [[nodiscard]] bool is_right_child() const noexcept {
        const interval* p = parent();
        return p && p->_right.get() == this;
    }

    [[nodiscard]] bool is_default() const noexcept { return _data.plist.empty(); }

    // ========== Links ==========

    [[nodiscard]] interval* left() noexcept { return _left.get(); }
    [[nodiscard]] const interval* left() const noexcept { return _left.get(); }
    [[nodiscard]] interval* right() noexcept { return _right.get(); }
    [[nodiscard]] const interval* right() const noexcept { return _right.get(); }

    [[nodiscard]] interval* parent() noexcept {
        interval** p = std::get_if<interval*>(&_up);
        return p ? *p : nullptr;
    }

    [[nodiscard]] const interval* parent() const noexcept {
        interval* const* p = std::get_if<interval*>(&_up);
        return p ? *p : nullptr;
    }

    [[nodiscard]] container* owner() noexcept {
        container** c = std::get_if<container*>(&_up);
        return c ? *c : nullptr;
    }

    [[nodiscard]] const container* owner() const noexcept {
        container* const* c = std::get_if<container*>(&_up);
        return c ? *c : nullptr;
    }

    // Installs `child` (which may be null) as the left child and points its
    // back-reference here.  Returns the previous left child, detached.
    std::unique_ptr<interval> set_left(std::unique_ptr<interval> child) noexcept {
        if (child) child->_up = this;
        _left.swap(child);
        if (child) child->_up = std::monostate{};
        return child;
    }

    std::unique_ptr<interval> set_right(std::unique_ptr<interval> child) noexcept {
        if (child) child->_up = this;
        _right.swap(child);
        if (child) child->_up = std::monostate{};
        return child;
    }

    // Detaches the left child.  Its parent link is left unset until it is
    // installed somewhere else.
    [[nodiscard]] std::unique_ptr<interval> take_left() noexcept {
        std::unique_ptr<interval> child = std::move(_left);
        if (child) child->_up = std::monostate{};
        return child;
    }

    [[nodiscard]] std::unique_ptr<interval> take_right() noexcept {
        std::unique_ptr<interval> child = std::move(_right);
        if (child) child->_up = std::monostate{};
        return child;
    }

    // Tags this node as the root of `owner`.  Called by containers from
    // attach_root().
    void set_owner(container* owner) noexcept {
        if (owner)
            _up = owner;
        else
            _up = std::monostate{};
    }

    // ========== Properties ==========

    [[nodiscard]] bool write_protect() const noexcept { return _data.write_protect; }
    [[nodiscard]] bool visible() const noexcept { return _data.visible; }
    [[nodiscard]] bool front_sticky() const noexcept { return _data.front_sticky; }
    [[nodiscard]] bool rear_sticky() const noexcept { return _data.rear_sticky; }

    void set_write_protect(bool v) noexcept { _data.write_protect = v; }
    void set_visible(bool v) noexcept { _data.visible = v; }
    void set_front_sticky(bool v) noexcept { _data.front_sticky = v; }
    void set_rear_sticky(bool v) noexcept { _data.rear_sticky = v; }

    [[nodiscard]] const property_list& plist() const noexcept { return _data.plist; }
    [[nodiscard]] property_list& plist() noexcept { return _data.plist; }
    void set_plist(property_list plist) noexcept { _data.plist = std::move(plist); }

    // Copies the four flags and a deep copy of the property list.  Nothing
    // happens when both intervals are default.
    void copy_properties(const interval& source) {
        if (is_default() && source.is_default()) return;
        _data.write_protect = source._data.write_protect;
        _data.visible = source._data.visible;
        _data.front_sticky = source._data.front_sticky;
        _data.rear_sticky = source._data.rear_sticky;
        _data.plist = source._data.plist;
    }

    // Back to the default, zero-length, childless, unlinked state.  Releases
    // both subtrees.
    void reset() noexcept {
        _left.reset();
        _right.reset();
        _up = std::monostate{};
        _data = payload{};
    }

    // ========== Navigation ==========

    // Returns the interval whose own range contains `position`.
    //
    // Called on a container root, `position` is absolute (the container's
    // begin offset is subtracted) and the root is rebalanced first, so the
    // search may start from a different node than *this.  Called on a
    // detached subtree, `position` is relative to the subtree.  The end
    // position itself maps to the last interval.
    //
    // Refreshes the position cache of the returned interval.  O(depth).
    [[nodiscard]] interval& find(size_type position) {
        ivl::profiler prof("interval::find");

        interval* tree = this;
        size_type relative = position;

        if (container* obj = owner()) {
            const size_type begin = obj->begin_offset();
            if (position < begin)
                throw position_out_of_range("interval::find", position, begin,
                                            begin + _data.total_length);
            relative -= begin;
            tree = &balance_possible_root();
        }

        if (relative > tree->_data.total_length) {
            const size_type base = position - relative;
            throw position_out_of_range("interval::find", position, base,
                                        base + tree->_data.total_length);
        }

        for (;;) {
            if (relative < tree->left_total_length()) {
                tree = tree->_left.get();
                continue;
            }
            const size_type right_start = tree->_data.total_length - tree->right_total_length();
            if (tree->_right && relative >= right_start) {
                relative -= right_start;
                tree = tree->_right.get();
                continue;
            }
            tree->_data.position = position - relative + tree->left_total_length();
            return *tree;
        }
    }

    // In-order successor, or nullptr for the last interval.  The successor's
    // position cache is derived from this one's.
    interval* next() noexcept {
        const size_type next_position = _data.position + length();
        interval* i = this;

        if (i->_right) {
            i = i->_right.get();
            while (i->_left) i = i->_left.get();
            i->_data.position = next_position;
            return i;
        }

        while (interval* p = i->parent()) {
            if (p->_left.get() == i) {
                p->_data.position = next_position;
                return p;
            }
            i = p;
        }
        return nullptr;
    }

    // In-order predecessor, or nullptr for the first interval.
    interval* prev() noexcept {
        const size_type start = _data.position;
        interval* i = this;

        if (i->_left) {
            i = i->_left.get();
            while (i->_right) i = i->_right.get();
            i->_data.position = start - i->length();
            return i;
        }

        while (interval* p = i->parent()) {
            if (p->_right.get() == i) {
                p->_data.position = start - p->length();
                return p;
            }
            i = p;
        }
        return nullptr;
    }

    // Relocates from this interval, whose position cache must be trusted, to
    // the one containing `position`, walking only as far as needed.  Every
    // node passed through gets a fresh cache.  Unlike find(), the end
    // position of the tree is not accepted.
    [[nodiscard]] interval& update(size_type position) {
        interval* i = this;
        for (;;) {
            if (position < i->_data.position) {
                if (position >= i->_data.position - i->left_total_length()) {
                    interval* l = i->_left.get();
                    l->_data.position = i->_data.position - l->_data.total_length + l->left_total_length();
                    i = l;
                } else if (i->has_parent()) {
                    i = i->_ascend();
                } else {
                    _throw_outside(*i, position);
                }
                continue;
            }
            if (position >= i->end_position()) {
                if (position < i->end_position() + i->right_total_length()) {
                    interval* r = i->_right.get();
                    r->_data.position = i->end_position() + r->left_total_length();
                    i = r;
                } else if (i->has_parent()) {
                    i = i->_ascend();
                } else {
                    _throw_outside(*i, position);
                }
                continue;
            }
            return *i;
        }
    }

    [[nodiscard]] interval& leftmost() noexcept {
        interval* i = this;
        while (i->_left) i = i->_left.get();
        return *i;
    }

    [[nodiscard]] interval& rightmost() noexcept {
        interval* i = this;
        while (i->_right) i = i->_right.get();
        return *i;
    }

    // Visits this subtree left to right, assigning position caches from
    // `position` on.  `fn` receives each interval and must not restructure
    // the tree.
    template <typename Fn>
    void traverse(size_type position, Fn&& fn) {
        std::vector<interval*> stack;
        interval* i = this;
        while (i || !stack.empty()) {
            while (i) {
                stack.push_back(i);
                i = i->_left.get();
            }
            i = stack.back();
            stack.pop_back();
            i->_data.position = position;
            position += i->length();
            fn(*i);
            i = i->_right.get();
        }
    }

    // Visits every interval of this subtree in pre-order.  Position caches
    // are left alone.
    template <typename Fn>
    void traverse_unordered(Fn&& fn) {
        std::vector<interval*> stack{this};
        while (!stack.empty()) {
            interval* i = stack.back();
            stack.pop_back();
            if (i->_right) stack.push_back(i->_right.get());
            if (i->_left) stack.push_back(i->_left.get());
            fn(*i);
        }
    }

    // ========== Rotations ==========
    //
    //      A              B
    //     / \            / \
    //    B   e   <=>    a   A
    //   / \                / \
    //  a   c              c   e
    //
    // The in-place variants keep the node at the top of the subtree where it
    // is and exchange payloads (lengths, position cache, flags, properties)
    // with the child instead, so the parent's child pointer never changes.
    // The addresses of the two payloads swap as a consequence.

    // Requires a left child.
    void rotate_right() {
        IVL_INVARIANT(_left, "rotate_right: no left child");
        interval& b = *_left;
        const size_type old_total = _data.total_length;
        const size_type own = length();
        IVL_INVARIANT(old_total > 0 && own > 0, "rotate_right: empty interval");
        IVL_INVARIANT(b.length() > 0, "rotate_right: empty left child");

        std::swap(_data, b._data);
        // this{B, e}, b{a, c}  ->  this{a, B}, b{c, e}
        std::swap(_left, _right);
        std::swap(_left, b._left);
        std::swap(b._left, b._right);
        if (_left) _left->_up = this;
        if (b._right) b._right->_up = &b;

        b._data.total_length = own + b.left_total_length() + b.right_total_length();
        _data.total_length = old_total;
        IVL_INVARIANT(length() > 0 && b.length() > 0, "rotate_right: lengths diverged");
    }

    // Requires a right child.
    void rotate_left() {
        IVL_INVARIANT(_right, "rotate_left: no right child");
        interval& b = *_right;
        const size_type old_total = _data.total_length;
        const size_type own = length();
        IVL_INVARIANT(old_total > 0 && own > 0, "rotate_left: empty interval");
        IVL_INVARIANT(b.length() > 0, "rotate_left: empty right child");

        std::swap(_data, b._data);
        // this{a, B}, b{c, e}  ->  this{B, e}, b{a, c}
        std::swap(_left, _right);
        std::swap(_right, b._right);
        std::swap(b._left, b._right);
        if (_right) _right->_up = this;
        if (b._left) b._left->_up = &b;

        b._data.total_length = own + b.left_total_length() + b.right_total_length();
        _data.total_length = old_total;
        IVL_INVARIANT(length() > 0 && b.length() > 0, "rotate_left: lengths diverged");
    }

    // Ownership-transferring variants: consume the subtree root and return the
    // new one, which inherits the consumed node's parent link.  Nodes keep
    // their identity.  The caller puts the result back in the original slot.
    [[nodiscard]] static std::unique_ptr<interval> rotate_right_owned(std::unique_ptr<interval> a) {
        IVL_INVARIANT(a && a->_left, "rotate_right: no left child");
        const size_type old_total = a->_data.total_length;
        IVL_INVARIANT(old_total > 0 && a->length() > 0, "rotate_right: empty interval");
        IVL_INVARIANT(a->_left->length() > 0, "rotate_right: empty left child");

        const parent_link up = a->_up;
        std::unique_ptr<interval> b = a->take_left();
        a->set_left(b->take_right());
        a->_data.total_length -= b->_data.total_length - a->left_total_length();
        b->_data.total_length = old_total;
        b->set_right(std::move(a));
        b->_up = up;

        IVL_INVARIANT(b->length() > 0 && b->_right->length() > 0, "rotate_right: lengths diverged");
        return b;
    }

    [[nodiscard]] static std::unique_ptr<interval> rotate_left_owned(std::unique_ptr<interval> a) {
        IVL_INVARIANT(a && a->_right, "rotate_left: no right child");
        const size_type old_total = a->_data.total_length;
        IVL_INVARIANT(old_total > 0 && a->length() > 0, "rotate_left: empty interval");
        IVL_INVARIANT(a->_right->length() > 0, "rotate_left: empty right child");

        const parent_link up = a->_up;
        std::unique_ptr<interval> b = a->take_right();
        a->set_right(b->take_left());
        a->_data.total_length -= b->_data.total_length - a->right_total_length();
        b->_data.total_length = old_total;
        b->set_left(std::move(a));
        b->_up = up;

        IVL_INVARIANT(b->length() > 0 && b->_left->length() > 0, "rotate_left: lengths diverged");
        return b;
    }

    // ========== Balancing ==========

    // Rotates at `slot` while a single rotation strictly reduces
    // |left_total - right_total|, rebalancing every node that moves down.
    // Assumes both subtrees are already balanced.  Returns the number of
    // rotations performed.  Only the occupant of `slot` changes.
    static std::size_t balance_self(std::unique_ptr<interval>& slot) {
        IVL_INVARIANT(slot, "balance: empty slot");
        IVL_INVARIANT(slot->length() > 0, "balance: empty interval");

        // |diff| shrinks with every rotation at this slot, so this bounds the
        // loop.  Rotations further down are not counted against it.
        const size_type budget = slot->_data.total_length;
        std::size_t rotations = 0;
        size_type steps = 0;

        for (;;) {
            const interval& i = *slot;
            const std::ptrdiff_t total = static_cast<std::ptrdiff_t>(i._data.total_length);
            const std::ptrdiff_t old_diff = static_cast<std::ptrdiff_t>(i.left_total_length()) -
                                            static_cast<std::ptrdiff_t>(i.right_total_length());
            if (old_diff == 0) break;

            IVL_INVARIANT(steps < budget, "balance: no fixpoint reached");
            ++steps;

            if (old_diff > 0) {
                const interval& l = *i._left;
                const std::ptrdiff_t new_diff = total - static_cast<std::ptrdiff_t>(l._data.total_length) +
                                                static_cast<std::ptrdiff_t>(l.right_total_length()) -
                                                static_cast<std::ptrdiff_t>(l.left_total_length());
                if (std::abs(new_diff) >= old_diff) break;
                slot = rotate_right_owned(std::move(slot));
                rotations += 1 + balance_self(slot->_right);
            } else {
                const interval& r = *i._right;
                const std::ptrdiff_t new_diff = total - static_cast<std::ptrdiff_t>(r._data.total_length) +
                                                static_cast<std::ptrdiff_t>(r.left_total_length()) -
                                                static_cast<std::ptrdiff_t>(r.right_total_length());
                if (std::abs(new_diff) >= -old_diff) break;
                slot = rotate_left_owned(std::move(slot));
                rotations += 1 + balance_self(slot->_left);
            }
        }
        return rotations;
    }

    // Balances the whole subtree in `slot`, children before parents.  Running
    // it twice performs no rotations the second time.
    static std::size_t balance(std::unique_ptr<interval>& slot) {
        if (!slot) return 0;

        // Post-order over slots.  A slot's occupant only changes when the
        // slot itself is balanced, after all of its descendants.
        struct pending {
            std::unique_ptr<interval>* slot;
            bool children_done;
        };
        std::vector<pending> stack{{&slot, false}};
        std::size_t rotations = 0;

        while (!stack.empty()) {
            pending top = stack.back();
            stack.pop_back();
            std::unique_ptr<interval>& s = *top.slot;
            if (top.children_done) {
                rotations += balance_self(s);
                continue;
            }
            stack.push_back({top.slot, true});
            if (s->_right) stack.push_back({&s->_right, false});
            if (s->_left) stack.push_back({&s->_left, false});
        }
        return rotations;
    }

    // Rebalances at the root if this interval is a container root, handing
    // the result back to the container.  Returns the interval now at the root
    // (or *this, untouched, for any other node).
    interval& balance_possible_root() {
        container* obj = owner();
        if (!obj) return *this;
        IVL_INVARIANT(obj->root() == this, "balance_possible_root: container holds another root");

        ivl::profiler prof("interval::balance_possible_root");
        std::unique_ptr<interval> root = obj->detach_root();
        try {
            prof.add_rotations(balance_self(root));
        } catch (...) {
            obj->attach_root(std::move(root));
            throw;
        }
        interval& result = *root;
        obj->attach_root(std::move(root));
        return result;
    }

    // ========== Split / merge ==========

    // Splits the own range at `offset`.  A new default interval takes the
    // first `offset` units and adopts the current left subtree; this interval
    // keeps the rest, at the same address.  Returns the new interval.  Both
    // position caches are refreshed from this one's.
    interval& split_left(size_type offset) {
        IVL_INVARIANT(offset > 0 && offset < length(), "split_left: offset outside the interval");
        ivl::profiler prof("interval::split_left");

        auto piece = std::make_unique<interval>(offset + left_total_length());
        interval& created = *piece;
        created._data.position = _data.position;
        _data.position += offset;

        created.set_left(take_left());
        set_left(std::move(piece));
        if (created._left) prof.add_rotations(balance_self(_left));

        balance_possible_root();
        return created;
    }

    // Splits the own range at `offset`.  This interval keeps the first
    // `offset` units; a new default interval takes the rest and adopts the
    // current right subtree.  Returns the new interval.
    interval& split_right(size_type offset) {
        IVL_INVARIANT(offset > 0 && offset < length(), "split_right: offset outside the interval");
        ivl::profiler prof("interval::split_right");

        auto piece = std::make_unique<interval>(length() - offset + right_total_length());
        interval& created = *piece;
        created._data.position = _data.position + offset;

        created.set_right(take_right());
        set_right(std::move(piece));
        if (created._right) prof.add_rotations(balance_self(_right));

        balance_possible_root();
        return created;
    }

    // Removes `node` from its tree and destroys it, putting the merge of its
    // children in its place.  Its properties are discarded and its own span
    // goes to the in-order successor, or to the predecessor when `node` is
    // the last interval.  Every other interval keeps its characters, so
    // removing the piece made by split_left() restores the original.
    // Removing the only interval empties the tree.
    static void remove(interval& node) {
        IVL_INVARIANT(node.is_root() || node.has_parent(), "remove: interval is not part of a tree");
        if (node._right || node._has_ancestor_on(&interval::is_left_child))
            (void)node.merge_right();
        else if (node._left || node._has_ancestor_on(&interval::is_right_child))
            (void)node.merge_left();
        else
            node._unlink();
    }

    // Hands this interval's span to its predecessor, whose properties win,
    // and removes this interval.  Returns the predecessor with a fresh
    // position cache.
    interval& merge_left() {
        const size_type absorb = length();
        const size_type start = _data.position;

        if (_left) {
            interval* pred = _left.get();
            while (pred->_right) {
                pred->_data.total_length += absorb;
                pred = pred->_right.get();
            }
            pred->_data.total_length += absorb;
            pred->_data.position = start - (pred->length() - absorb);
            _unlink();
            return *pred;
        }

        IVL_INVARIANT(_has_ancestor_on(&interval::is_right_child), "merge_left: first interval");

        // The predecessor is an ancestor: empty this node, shrink every
        // ancestor below the predecessor, and the predecessor's own range
        // grows by the same amount.
        _data.total_length -= absorb;
        interval* i = this;
        for (;;) {
            interval* p = i->parent();
            if (p->_right.get() == i) {
                p->_data.position = start - (p->length() - absorb);
                _unlink();
                return *p;
            }
            i = p;
            i->_data.total_length -= absorb;
        }
    }

    // Hands this interval's span to its successor, whose properties win, and
    // removes this interval.  Returns the successor, now starting where this
    // interval started.
    interval& merge_right() {
        const size_type absorb = length();
        const size_type start = _data.position;

        if (_right) {
            interval* succ = _right.get();
            while (succ->_left) {
                succ->_data.total_length += absorb;
                succ = succ->_left.get();
            }
            succ->_data.total_length += absorb;
            succ->_data.position = start;
            _unlink();
            return *succ;
        }

        IVL_INVARIANT(_has_ancestor_on(&interval::is_left_child), "merge_right: last interval");

        _data.total_length -= absorb;
        interval* i = this;
        for (;;) {
            interval* p = i->parent();
            if (p->_left.get() == i) {
                p->_data.position = start;
                _unlink();
                return *p;
            }
            i = p;
            i->_data.total_length -= absorb;
        }
    }

    // ========== Verification ==========

    // Walks this subtree and checks that every interval has a positive own
    // length and that every child links back to its parent.  Only the
    // subtree top may carry a container link.
    void check_invariants() const {
        std::vector<const interval*> stack{this};
        while (!stack.empty()) {
            const interval* i = stack.back();
            stack.pop_back();

            IVL_INVARIANT(i->_data.total_length > i->left_total_length() + i->right_total_length(),
                          "interval with an empty own range");
            IVL_INVARIANT(i == this || !i->is_root(), "container link below the root");

            if (i->_left) {
                IVL_INVARIANT(i->_left->parent() == i, "stale back-reference in left child");
                stack.push_back(i->_left.get());
            }
            if (i->_right) {
                IVL_INVARIANT(i->_right->parent() == i, "stale back-reference in right child");
                stack.push_back(i->_right.get());
            }
        }
    }

private:
    using parent_link = std::variant<std::monostate, interval*, container*>;

    // Everything a node carries apart from its links.  In-place rotations
    // exchange whole payloads.
    struct payload {
        size_type total_length = 0;
        size_type position = 0;
        bool write_protect = false;
        bool visible = false;
        bool front_sticky = false;
        bool rear_sticky = false;
        property_list plist;
    };

    // Moves to the parent, deriving its position cache from this node's.
    interval* _ascend() noexcept {
        interval* p = parent();
        if (p->_left.get() == this)
            p->_data.position = end_position() + right_total_length();
        else
            p->_data.position = _data.position - left_total_length() - p->length();
        return p;
    }

    [[noreturn]] static void _throw_outside(const interval& top, size_type position) {
        const size_type first = top._data.position - top.left_total_length();
        const size_type end = top.end_position() + top.right_total_length();
        throw position_out_of_range("interval::update", position, first, end - 1);
    }

    bool _has_ancestor_on(bool (interval::*side)() const noexcept) const noexcept {
        for (const interval* i = this; i->has_parent(); i = i->parent()) {
            if ((i->*side)()) return true;
        }
        return false;
    }

    // Replaces this interval with the merge of its children and destroys it.
    // Ancestors keep their totals, so this interval must not own any span
    // unless it is the sole interval of its tree.
    void _unlink() {
        IVL_INVARIANT(length() == 0 || is_only(), "remove: interval still owns a span");
        if (container* obj = owner()) {
            IVL_INVARIANT(obj->root() == this, "remove: container holds another root");
            std::unique_ptr<interval> self = obj->detach_root();
            obj->attach_root(self->_merge_children());
            return;
        }

        interval* p = parent();
        IVL_INVARIANT(p != nullptr, "remove: interval is not part of a tree");
        if (p->_left.get() == this)
            p->set_left(_merge_children());
        else
            p->set_right(_merge_children());
    }

    // Detaches both children and returns them joined into one subtree: the
    // left subtree is grafted below the leftmost node of the right one.
    [[nodiscard]] std::unique_ptr<interval> _merge_children() noexcept {
        if (!_left) return take_right();
        if (!_right) return take_left();

        std::unique_ptr<interval> migrate = take_left();
        const size_type amount = migrate->_data.total_length;
        interval* i = _right.get();
        i->_data.total_length += amount;
        while (i->_left) {
            i = i->_left.get();
            i->_data.total_length += amount;
        }
        i->set_left(std::move(migrate));
        return take_right();
    }

    std::unique_ptr<interval> _left;
    std::unique_ptr<interval> _right;
    parent_link _up;
    payload _data;
};

} // namespace ivl

#endif  // IVL_INTERVAL_HPP
