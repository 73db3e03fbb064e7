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

#include <arbor/core/byte_string.hpp>
#include <arbor/core/config.hpp>
#include <arbor/tree/path.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

ARBOR_NAMESPACE_BEGIN

class Node;

using NodePtr = std::shared_ptr<Node const>;

// Immutable tree node. Updates copy the path from the root down to the
// changed node, so untouched subtrees keep their identity across versions.
class Node final
{
public:
    using Children = std::map<std::string, NodePtr, std::less<>>;

private:
    byte_string value_;
    Children children_;

public:
    Node(byte_string value, Children children);

    static NodePtr make(byte_string value = {}, Children children = {});
    static NodePtr leaf(std::string_view value);

    byte_string const &value() const noexcept
    {
        return value_;
    }

    Children const &children() const noexcept
    {
        return children_;
    }

    NodePtr child(std::string_view name) const;

    NodePtr with_child(std::string_view name, NodePtr child) const;
    NodePtr without_child(std::string_view name) const;

    friend bool operator==(Node const &, Node const &);
};

// Structural equality, nullptr only equal to nullptr
bool equal(NodePtr const &, NodePtr const &);

NodePtr find_node(NodePtr const &root, Path const &);

// Value taken from update, children merged recursively into current
NodePtr merge_node(NodePtr const &current, NodePtr const &update);

ARBOR_NAMESPACE_END
