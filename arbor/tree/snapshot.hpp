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
#include <arbor/tree/modification.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <utility>

ARBOR_NAMESPACE_BEGIN

// Immutable point in time view of a tree
class DataTreeSnapshot
{
    NodePtr root_;

public:
    explicit DataTreeSnapshot(NodePtr root)
        : root_{std::move(root)}
    {
    }

    NodePtr const &root() const noexcept
    {
        return root_;
    }

    NodePtr read_node(Path const &path) const
    {
        return find_node(root_, path);
    }

    bool exists(Path const &path) const
    {
        return read_node(path) != nullptr;
    }

    DataTreeModification new_modification() const
    {
        return DataTreeModification{root_};
    }
};

ARBOR_NAMESPACE_END
