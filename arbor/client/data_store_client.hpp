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

#include <arbor/client/shard_strategy.hpp>
#include <arbor/core/config.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/tree/path.hpp>

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

ARBOR_NAMESPACE_BEGIN

class ClientHistory;
class ClientTransaction;
class Shard;

// Entry point of the client side: resolves paths to shards and hands out
// histories and transactions. The shards outlive the client.
class DataStoreClient final
{
    ShardStrategy strategy_;
    ankerl::unordered_dense::map<ShardId, Shard *> shards_;
    std::atomic<uint64_t> next_history_{1};

public:
    DataStoreClient(ShardStrategy, std::vector<Shard *> const &shards);

    DataStoreClient(DataStoreClient const &) = delete;
    DataStoreClient &operator=(DataStoreClient const &) = delete;

    ShardStrategy const &strategy() const noexcept
    {
        return strategy_;
    }

    Shard &shard(ShardId) const;
    Shard &shard_for(Path const &) const;

    std::shared_ptr<ClientHistory> create_local_history();
    // Free standing transaction on a history of its own
    std::shared_ptr<ClientTransaction> create_transaction();
};

ARBOR_NAMESPACE_END
