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
#include <arbor/shard/shard_config.hpp>
#include <arbor/shard/transaction_id.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

ARBOR_NAMESPACE_BEGIN

class ClientTransaction;
class DataStoreClient;

// Ordered sequence of transactions of one client. Ids are allocated in
// submission order; at most one transaction is open at a time, readied
// ones may still be committing. The client outlives its histories.
class ClientHistory final : public std::enable_shared_from_this<ClientHistory>
{
    DataStoreClient &client_;
    uint64_t const id_;

    mutable std::mutex mutex_;
    uint64_t next_transaction_{1};
    std::optional<uint64_t> open_;
    // last transaction handed to each shard
    ankerl::unordered_dense::map<ShardId, uint64_t> last_sent_;
    bool closed_{false};

public:
    ClientHistory(DataStoreClient &, uint64_t id);

    ClientHistory(ClientHistory const &) = delete;
    ClientHistory &operator=(ClientHistory const &) = delete;

    uint64_t id() const noexcept
    {
        return id_;
    }

    DataStoreClient &client() const noexcept
    {
        return client_;
    }

    bool is_closed() const;

    std::shared_ptr<ClientTransaction> create_transaction();

    // Records that transaction is sent to shard; returns the transaction
    // sent to it before, 0 for the first
    uint64_t on_proxy_sealed(ShardId, uint64_t transaction);

    void on_transaction_ready(TransactionId const &);
    void on_transaction_aborted(TransactionId const &);

    // Purges the history on every shard it reached
    void close();
};

ARBOR_NAMESPACE_END
