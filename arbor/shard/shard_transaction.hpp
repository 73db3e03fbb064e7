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
#include <arbor/shard/transaction_id.hpp>
#include <arbor/tree/modification.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>
#include <arbor/tree/snapshot.hpp>

#include <cstdint>
#include <utility>

ARBOR_NAMESPACE_BEGIN

class ReadOnlyShardTransaction
{
    TransactionId id_;
    DataTreeSnapshot snapshot_;

public:
    ReadOnlyShardTransaction(TransactionId const &id, NodePtr root)
        : id_{id}
        , snapshot_{std::move(root)}
    {
    }

    TransactionId const &id() const noexcept
    {
        return id_;
    }

    DataTreeSnapshot const &snapshot() const noexcept
    {
        return snapshot_;
    }

    NodePtr read_node(Path const &path) const
    {
        return snapshot_.read_node(path);
    }

    bool exists(Path const &path) const
    {
        return snapshot_.exists(path);
    }
};

class ReadWriteShardTransaction
{
    TransactionId id_;
    DataTreeModification modification_;
    // transaction of the same history sent to this shard before this one
    uint64_t previous_{0};

public:
    ReadWriteShardTransaction(TransactionId const &id, NodePtr root)
        : id_{id}
        , modification_{std::move(root)}
    {
    }

    TransactionId const &id() const noexcept
    {
        return id_;
    }

    DataTreeModification &modification() noexcept
    {
        return modification_;
    }

    DataTreeModification const &modification() const noexcept
    {
        return modification_;
    }

    uint64_t previous() const noexcept
    {
        return previous_;
    }

    void set_previous(uint64_t const previous) noexcept
    {
        previous_ = previous;
    }

    NodePtr read_node(Path const &path) const
    {
        return modification_.read_node(path);
    }

    bool exists(Path const &path) const
    {
        return modification_.exists(path);
    }

    void write(Path const &path, NodePtr data)
    {
        modification_.write(path, std::move(data));
    }

    void merge(Path const &path, NodePtr data)
    {
        modification_.merge(path, std::move(data));
    }

    void remove(Path const &path)
    {
        modification_.remove(path);
    }
};

ARBOR_NAMESPACE_END
