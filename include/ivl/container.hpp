// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef IVL_CONTAINER_HPP
#define IVL_CONTAINER_HPP

// The owner of an interval tree: a buffer-like or string-like sequence.
//
// The tree consumes this interface; it does not implement it.  The container
// owns the root node and with it the whole tree.  Whenever a rebalance may
// have changed which node sits at the root, the tree hands the root back
// through attach_root(), so a container must never cache the root's address
// across a mutating tree operation.

#include <cstddef>
#include <memory>

namespace ivl {

class interval;

class container {
public:
    using size_type = std::size_t;

    container() = default;
    container(const container&) = delete;
    container& operator=(const container&) = delete;
    virtual ~container() = default;

    // 1 for buffer-like containers, 0 for string-like ones.
    [[nodiscard]] virtual size_type begin_offset() const noexcept = 0;

    // Current sequence length.
    [[nodiscard]] virtual size_type length() const noexcept = 0;

    // Installs `root` as the interval tree and tags it with this container as
    // its parent.  A null `root` clears the tree.
    virtual void attach_root(std::unique_ptr<interval> root) = 0;

    // Releases ownership of the root.  Its parent tag still names this
    // container until it is attached again.
    [[nodiscard]] virtual std::unique_ptr<interval> detach_root() noexcept = 0;

    [[nodiscard]] virtual interval* root() noexcept = 0;
    [[nodiscard]] virtual const interval* root() const noexcept = 0;
};

} // namespace ivl

#endif  // IVL_CONTAINER_HPP
