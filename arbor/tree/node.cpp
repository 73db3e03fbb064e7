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

#include <arbor/core/byte_string.hpp>
#include <arbor/core/config.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

ARBOR_NAMESPACE_BEGIN

Node::Node(byte_string value, Children children)
    : value_{std::move(value)}
    , children_{std::move(children)}
{
}

NodePtr Node::make(byte_string value, Children children)
{
    return std::make_shared<Node const>(std::move(value), std::move(children));
}

NodePtr Node::leaf(std::string_view const value)
{
    return make(to_byte_string(value));
}

NodePtr Node::child(std::string_view const name) const
{
    auto const it = children_.find(name);
    return it == children_.end() ? nullptr : it->second;
}

NodePtr Node::with_child(std::string_view const name, NodePtr child) const
{
    auto children = children_;
    children.insert_or_assign(std::string{name}, std::move(child));
    return make(value_, std::move(children));
}

NodePtr Node::without_child(std::string_view const name) const
{
    auto children = children_;
    if (auto const it = children.find(name); it != children.end()) {
        children.erase(it);
    }
    return make(value_, std::move(children));
}

bool operator==(Node const &a, Node const &b)
{
    if (&a == &b) {
        return true;
    }
    return a.value_ == b.value_ &&
           std::ranges::equal(
               a.children_, b.children_, [](auto const &x, auto const &y) {
                   return x.first == y.first && equal(x.second, y.second);
               });
}

bool equal(NodePtr const &a, NodePtr const &b)
{
    if (a == b) {
        return true;
    }
    if (!a || !b) {
        return false;
    }
    return *a == *b;
}

NodePtr find_node(NodePtr const &root, Path const &path)
{
    NodePtr node = root;
    for (auto const &arg : path.args()) {
        if (!node) {
            return nullptr;
        }
        node = node->child(arg);
    }
    return node;
}

NodePtr merge_node(NodePtr const &current, NodePtr const &update)
{
    if (!current || !update) {
        return update;
    }
    auto children = current->children();
    for (auto const &[name, child] : update->children()) {
        auto const it = children.find(name);
        if (it == children.end()) {
            children.emplace(name, child);
        }
        else {
            it->second = merge_node(it->second, child);
        }
    }
    return Node::make(update->value(), std::move(children));
}

ARBOR_NAMESPACE_END
