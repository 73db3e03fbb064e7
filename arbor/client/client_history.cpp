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
#include <arbor/core/assert.h>
#include <arbor/core/config.hpp>
#include <arbor/shard/fmt/transaction_id_fmt.hpp>
#include <arbor/shard/shard.hpp>
#include <arbor/shard/transaction_id.hpp>

#include <fmt/format.h>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

ClientHistory::ClientHistory(DataStoreClient &client, uint64_t const id)
    : client_{client}
    , id_{id}
{
}

bool ClientHistory::is_closed() const
{
    std::lock_guard const lock{mutex_};
    return closed_;
}

std::shared_ptr<ClientTransaction> ClientHistory::create_transaction()
{
    TransactionId id;
    {
        std::lock_guard const lock{mutex_};
        ARBOR_ASSERT_PRINTF(
            !closed_, "%s", fmt::format("History {} is closed", id_).c_str());
        ARBOR_ASSERT_PRINTF(
            !open_.has_value(),
            "%s",
            fmt::format(
                "History {} has open transaction {}", id_, open_.value_or(0))
                .c_str());
        id = TransactionId{id_, next_transaction_++};
        open_ = id.transaction;
    }
    LOG_DEBUG("Opened transaction {}", id);
    return std::make_shared<ClientTransaction>(shared_from_this(), id);
}

uint64_t
ClientHistory::on_proxy_sealed(ShardId const shard, uint64_t const transaction)
{
    std::lock_guard const lock{mutex_};
    auto &last = last_sent_[shard];
    ARBOR_ASSERT(transaction > last);
    return std::exchange(last, transaction);
}

void ClientHistory::on_transaction_ready(TransactionId const &id)
{
    std::lock_guard const lock{mutex_};
    ARBOR_ASSERT(open_ == id.transaction);
    open_.reset();
}

void ClientHistory::on_transaction_aborted(TransactionId const &id)
{
    std::lock_guard const lock{mutex_};
    if (open_ == id.transaction) {
        open_.reset();
    }
}

void ClientHistory::close()
{
    std::vector<ShardId> shards;
    {
        std::lock_guard const lock{mutex_};
        if (closed_) {
            return;
        }
        ARBOR_ASSERT_PRINTF(
            !open_.has_value(),
            "%s",
            fmt::format("History {} closed with an open transaction", id_)
                .c_str());
        closed_ = true;
        for (auto const &[shard, last] : last_sent_) {
            shards.push_back(shard);
        }
    }
    LOG_DEBUG("Closing history {} on {} shards", id_, shards.size());
    for (auto const shard : shards) {
        client_.shard(shard).purge_history(id_);
    }
}

ARBOR_NAMESPACE_END
