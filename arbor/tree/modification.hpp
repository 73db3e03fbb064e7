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
#include <arbor/core/result.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <cstdint>
#include <vector>

ARBOR_NAMESPACE_BEGIN

enum class OperationType : uint8_t
{
    Write,
    Merge,
    Delete,
};

struct TreeOperation
{
    OperationType type;
    Path path;
    NodePtr data;
};

// Isolated overlay over a base tree. Operations are recorded in order and
// replayed against a target tree by apply_to. Reads observe the overlay.
class DataTreeModification
{
    NodePtr base_;
    NodePtr root_;
    std::vector<TreeOperation> operations_;
    bool sealed_{false};

public:
    explicit DataTreeModification(NodePtr base);

    void write(Path const &, NodePtr);
    void merge(Path const &, NodePtr);
    void remove(Path const &);

    NodePtr read_node(Path const &) const;
    bool exists(Path const &) const;

    void seal();

    bool is_sealed() const noexcept
    {
        return sealed_;
    }

    NodePtr const &base() const noexcept
    {
        return base_;
    }

    NodePtr const &root() const noexcept
    {
        return root_;
    }

    std::vector<TreeOperation> const &operations() const noexcept
    {
        return operations_;
    }

    // Replays the recorded operations on target. A write or delete whose
    // node in target is not the node the modification was based on fails
    // with ConflictingModification; a write or merge under a missing parent
    // fails with ParentMissing. The offending path is stored in conflict.
    Result<NodePtr> apply_to(NodePtr const &target, Path *conflict = nullptr) const;
};

// Replaces the node at path, nullptr removes it. Missing ancestors are
// created as empty nodes.
NodePtr put_node(NodePtr const &root, Path const &, NodePtr);

ARBOR_NAMESPACE_END
