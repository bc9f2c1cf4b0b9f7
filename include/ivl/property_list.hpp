// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef IVL_PROPERTY_LIST_HPP
#define IVL_PROPERTY_LIST_HPP

// Property list attached to an interval.
//
// The tree treats a property list as an opaque value: it only asks whether it
// is empty (an interval with an empty list is a "default" interval) and copies
// it.  Keys and values are plain strings; their meaning belongs to whoever
// hosts the tree.

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ivl {

class property_list {
    using map_type = std::map<std::string, std::string, std::less<>>;

public:
    using size_type = map_type::size_type;
    using const_iterator = map_type::const_iterator;

    property_list() = default;
    property_list(std::initializer_list<std::pair<const std::string, std::string>> init)
        : _props(init) {}

    [[nodiscard]] bool empty() const noexcept { return _props.empty(); }
    [[nodiscard]] size_type size() const noexcept { return _props.size(); }

    [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const {
        auto it = _props.find(key);
        if (it == _props.end()) return std::nullopt;
        return std::string_view(it->second);
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        return _props.find(key) != _props.end();
    }

    // Inserts or overwrites.
    void put(std::string_view key, std::string_view value) {
        auto it = _props.find(key);
        if (it != _props.end()) {
            it->second.assign(value);
            return;
        }
        _props.emplace(std::string(key), std::string(value));
    }

    bool remove(std::string_view key) {
        auto it = _props.find(key);
        if (it == _props.end()) return false;
        _props.erase(it);
        return true;
    }

    void clear() noexcept { _props.clear(); }

    const_iterator begin() const noexcept { return _props.begin(); }
    const_iterator end() const noexcept { return _props.end(); }

    friend bool operator==(const property_list&, const property_list&) = default;

private:
    map_type _props;
};

} // namespace ivl

#endif  // IVL_PROPERTY_LIST_HPP
