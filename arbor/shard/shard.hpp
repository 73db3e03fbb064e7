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

#include <arbor/core/byte_string.hpp>
#include <arbor/core/config.hpp>
#include <arbor/core/result.hpp>
#include <arbor/fiber/serial_executor.hpp>
#include <arbor/shard/local_replication.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/shard/shard_data_tree.hpp>
#include <arbor/shard/shard_transaction.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/shard/tree_change_listener.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <boost/fiber/future.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

ARBOR_NAMESPACE_BEGIN

// One shard: a ShardDataTree owned by a serial executor. Pipeline steps run
// on the executor thread; transactions can be opened from any thread
// against the last published authoritative root.
class Shard final
{
    ShardConfig const config_;
    fiber::SerialExecutor executor_;
    LocalReplication replication_;
    ShardDataTree tree_;

    mutable std::mutex root_mutex_;
    NodePtr published_root_;

    std::atomic<uint64_t> read_only_created_{0};
    std::atomic<uint64_t> read_write_created_{0};

public:
    explicit Shard(ShardConfig);
    ~Shard();

    Shard(Shard const &) = delete;
    Shard &operator=(Shard const &) = delete;

    ShardConfig const &config() const noexcept
    {
        return config_;
    }

    NodePtr root() const;

    ReadOnlyShardTransaction new_read_only_transaction(TransactionId const &);
    ReadWriteShardTransaction
    new_read_write_transaction(TransactionId const &);

    // Runs fn on the shard executor; false once the shard is stopped
    bool execute(std::function<void(ShardDataTree &)> fn);

    bool in_executor() const noexcept
    {
        return executor_.in_worker();
    }

    // stats, snapshots and listener registration need a running shard
    boost::fibers::future<ShardStats> stats();

    // Initial state is the current content of path, delivered before any
    // change. Closing the registration is forwarded to the executor.
    boost::fibers::future<ListenerRegistration> register_tree_change_listener(
        Path const &, std::shared_ptr<TreeChangeListener>,
        bool deliver_initial_state = false);

    boost::fibers::future<byte_string> take_state_snapshot();
    boost::fibers::future<Result<void>> apply_snapshot(byte_string);

    void purge_history(uint64_t history);

    // Drains queued steps and stops the executor
    void stop();
};

ARBOR_NAMESPACE_END
