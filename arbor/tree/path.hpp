// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <arbor/core/config.hpp>

#include <compare>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

ARBOR_NAMESPACE_BEGIN

// Hierarchical address of a tree node. The root is the empty path.
class Path
{
    std::vector<std::string> args_;

public:
    static constexpr std::string_view WILDCARD = "*";

    Path() = default;
    explicit Path(std::vector<std::string> args);
    Path(std::initializer_list<std::string_view> args);

    // "/a/b" -> {a, b}; empty segments are ignored
    static Path parse(std::string_view);

    std::vector<std::string> const &args() const noexcept
    {
        return args_;
    }

    size_t size() const noexcept
    {
        return args_.size();
    }

    bool is_root() const noexcept
    {
        return args_.empty();
    }

    std::string const &last() const;

    Path child(std::string_view arg) const;
    Path parent() const;

    bool starts_with(Path const &prefix) const noexcept;

    bool has_wildcard() const noexcept;

    std::string to_string() const;

    friend bool operator==(Path const &, Path const &) = default;
    friend std::strong_ordering
    operator<=>(Path const &, Path const &) = default;
};

// True when path has the same length as pattern and every argument is equal
// to the pattern's argument or the pattern's argument is a wildcard
bool matches(Path const &pattern, Path const &path) noexcept;

ARBOR_NAMESPACE_END
