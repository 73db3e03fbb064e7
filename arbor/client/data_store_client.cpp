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

#include <arbor/client/client_history.hpp>
#include <arbor/client/client_transaction.hpp>
#include <arbor/client/data_store_client.hpp>
#include <arbor/client/shard_strategy.hpp>
#include <arbor/core/assert.h>
#include <arbor/core/config.hpp>
#include <arbor/shard/shard.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/tree/path.hpp>

#include <fmt/format.h>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <memory>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

DataStoreClient::DataStoreClient(
    ShardStrategy strategy, std::vector<Shard *> const &shards)
    : strategy_{std::move(strategy)}
{
    for (auto *const shard : shards) {
        ARBOR_ASSERT(shard != nullptr);
        bool const inserted =
            shards_.emplace(shard->config().id, shard).second;
        ARBOR_ASSERT(inserted);
    }
    ARBOR_ASSERT_PRINTF(
        shards_.contains(strategy_.default_shard()),
        "%s",
        fmt::format("default shard {} missing", strategy_.default_shard())
            .c_str());
}

Shard &DataStoreClient::shard(ShardId const id) const
{
    auto const it = shards_.find(id);
    ARBOR_ASSERT_PRINTF(
        it != shards_.end(), "%s", fmt::format("unknown shard {}", id).c_str());
    return *it->second;
}

Shard &DataStoreClient::shard_for(Path const &path) const
{
    return shard(strategy_.shard_for(path));
}

std::shared_ptr<ClientHistory> DataStoreClient::create_local_history()
{
    auto const id = next_history_.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG("Created history {}", id);
    return std::make_shared<ClientHistory>(*this, id);
}

std::shared_ptr<ClientTransaction> DataStoreClient::create_transaction()
{
    return create_local_history()->create_transaction();
}

ARBOR_NAMESPACE_END
