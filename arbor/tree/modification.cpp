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

#include <arbor/core/assert.h>
#include <arbor/core/config.hpp>
#include <arbor/core/result.hpp>
#include <arbor/tree/modification.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>
#include <arbor/tree/tree_error.hpp>

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

namespace
{
    NodePtr put_node_impl(
        NodePtr const &node, Path const &path, size_t const depth,
        NodePtr &&value)
    {
        if (depth == path.size()) {
            return std::move(value);
        }
        NodePtr const current = node ? node : Node::make();
        auto const &arg = path.args()[depth];
        auto child = put_node_impl(
            current->child(arg), path, depth + 1, std::move(value));
        if (!child) {
            return current->without_child(arg);
        }
        return current->with_child(arg, std::move(child));
    }

    // nullopt when the parent of path does not exist in root
    std::optional<NodePtr> put_node_strict(
        NodePtr const &root, Path const &path, NodePtr value)
    {
        if (!path.is_root() && !find_node(root, path.parent())) {
            return std::nullopt;
        }
        return put_node(root, path, std::move(value));
    }

    bool covered_by(
        std::vector<TreeOperation> const &operations, size_t const index)
    {
        auto const &path = operations[index].path;
        for (size_t i = 0; i < index; ++i) {
            auto const &op = operations[i];
            if (op.type != OperationType::Merge && path.starts_with(op.path)) {
                return true;
            }
        }
        return false;
    }
}

NodePtr put_node(NodePtr const &root, Path const &path, NodePtr value)
{
    auto result = put_node_impl(root, path, 0, std::move(value));
    return result ? result : Node::make();
}

DataTreeModification::DataTreeModification(NodePtr base)
    : base_{base ? std::move(base) : Node::make()}
    , root_{base_}
{
}

void DataTreeModification::write(Path const &path, NodePtr data)
{
    ARBOR_ASSERT(!sealed_);
    ARBOR_ASSERT(data);
    root_ = put_node(root_, path, data);
    operations_.push_back({OperationType::Write, path, std::move(data)});
}

void DataTreeModification::merge(Path const &path, NodePtr data)
{
    ARBOR_ASSERT(!sealed_);
    ARBOR_ASSERT(data);
    root_ = put_node(root_, path, merge_node(find_node(root_, path), data));
    operations_.push_back({OperationType::Merge, path, std::move(data)});
}

void DataTreeModification::remove(Path const &path)
{
    ARBOR_ASSERT(!sealed_);
    if (find_node(root_, path)) {
        root_ = put_node(root_, path, nullptr);
    }
    operations_.push_back({OperationType::Delete, path, nullptr});
}

NodePtr DataTreeModification::read_node(Path const &path) const
{
    return find_node(root_, path);
}

bool DataTreeModification::exists(Path const &path) const
{
    return read_node(path) != nullptr;
}

void DataTreeModification::seal()
{
    ARBOR_ASSERT(!sealed_);
    sealed_ = true;
}

Result<NodePtr>
DataTreeModification::apply_to(NodePtr const &target, Path *const conflict) const
{
    NodePtr result = target ? target : Node::make();
    for (size_t i = 0; i < operations_.size(); ++i) {
        auto const &op = operations_[i];
        if (op.type != OperationType::Merge && !covered_by(operations_, i) &&
            find_node(base_, op.path) != find_node(target, op.path)) {
            if (conflict) {
                *conflict = op.path;
            }
            return TreeError::ConflictingModification;
        }
        switch (op.type) {
        case OperationType::Delete:
            if (find_node(result, op.path)) {
                result = put_node(result, op.path, nullptr);
            }
            break;
        case OperationType::Write:
        case OperationType::Merge: {
            auto data = op.type == OperationType::Write
                            ? op.data
                            : merge_node(find_node(result, op.path), op.data);
            auto next = put_node_strict(result, op.path, std::move(data));
            if (!next.has_value()) {
                if (conflict) {
                    *conflict = op.path.parent();
                }
                return TreeError::ParentMissing;
            }
            result = std::move(next.value());
            break;
        }
        }
    }
    return result;
}

ARBOR_NAMESPACE_END
