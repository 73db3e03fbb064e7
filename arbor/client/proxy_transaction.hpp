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
#include <arbor/shard/shard_cohort.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/shard/shard_transaction.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <cstdint>
#include <functional>
#include <memory>

ARBOR_NAMESPACE_BEGIN

class Shard;

// Client side delegate of one transaction on one shard. Operations are
// recorded locally until the proxy is sealed; sealing hands the
// transaction to the shard and every phase after that runs on the shard
// executor.
class ProxyTransaction final
    : public std::enable_shared_from_this<ProxyTransaction>
{
public:
    using Callback = ShardCommitCohort::Callback;

private:
    Shard &shard_;
    TransactionId const id_;
    // moved to the shard when sealed
    ReadWriteShardTransaction transaction_;
    bool sealed_{false};
    // only touched on the shard executor
    std::shared_ptr<ShardCommitCohort> cohort_;

    using Step = void (ShardCommitCohort::*)(Callback);
    void run(Step, char const *name, Callback);

public:
    ProxyTransaction(Shard &, TransactionId const &);

    ProxyTransaction(ProxyTransaction const &) = delete;
    ProxyTransaction &operator=(ProxyTransaction const &) = delete;

    TransactionId const &id() const noexcept
    {
        return id_;
    }

    ShardId shard_id() const noexcept;

    bool is_sealed() const noexcept
    {
        return sealed_;
    }

    bool exists(Path const &) const;
    NodePtr read(Path const &) const;
    void write(Path const &, NodePtr);
    void merge(Path const &, NodePtr);
    void remove(Path const &);

    // previous is the transaction of the same history sent to this shard
    // before this one
    void seal(uint64_t previous);

    // Callbacks are invoked on the shard executor
    void can_commit(Callback);
    void pre_commit(Callback);
    void commit(Callback);
    // An unsealed proxy never reached the shard and is just dropped
    void abort(Callback);
};

ARBOR_NAMESPACE_END
