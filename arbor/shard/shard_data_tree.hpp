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
#include <arbor/shard/frontend_history.hpp>
#include <arbor/shard/replication.hpp>
#include <arbor/shard/shard_cohort.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/shard_transaction.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/shard/tree_change_listener.hpp>
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

ARBOR_NAMESPACE_BEGIN

struct ShardStats
{
    uint64_t read_only_transactions{0};
    uint64_t read_write_transactions{0};
    uint64_t committed{0};
    uint64_t aborted{0};
    uint64_t failed{0};
    uint64_t follower_applied{0};
    uint64_t snapshots_applied{0};
};

// Authoritative tree of one shard and the pipeline of transactions
// committing against it. Single threaded: the owner serializes all calls.
//
// A finished transaction moves through three queues:
//   pending_transactions_ until preCommit,
//   pending_commits_ until its payload is appended for replication,
//   pending_finish_ until replication confirms it.
// tip_ is the authoritative tree with every preCommitted effect applied;
// canCommit and preCommit validate against it.
class ShardDataTree
{
    friend class ShardCommitCohort;

    static constexpr size_t MAX_PURGED_HISTORIES = 1024;

    using CohortPtr = std::shared_ptr<ShardCommitCohort>;

    ShardConfig config_;
    ReplicationBoundary *replication_;
    NodePtr root_;
    NodePtr tip_;
    std::deque<CohortPtr> pending_transactions_;
    std::deque<CohortPtr> pending_commits_;
    std::deque<CohortPtr> pending_finish_;
    bool committing_{false};
    TreeChangePublisher publisher_;
    ankerl::unordered_dense::map<uint64_t, FrontendHistory> histories_;
    // most recent purges; a late transaction of an older one fails the
    // history order check instead, its client sent at least one before
    ankerl::unordered_dense::set<uint64_t> purged_histories_;
    std::deque<uint64_t> purge_order_;
    std::function<void(NodePtr const &)> on_root_changed_;
    ShardStats stats_;

    size_t in_flight() const noexcept;

    void set_root(NodePtr);
    void notify(Candidate const &);

    // steps invoked by ShardCommitCohort
    void start_can_commit(ShardCommitCohort &);
    void start_pre_commit(ShardCommitCohort &);
    void start_commit(ShardCommitCohort &);
    Result<void> start_abort(ShardCommitCohort &);

    void process_next_pending_transaction();
    void process_next_pending_commit();

    // Rebuilds tip_ from the unconfirmed appends and revalidates the
    // preCommitted transactions on top of it. Returns the ones that no
    // longer apply, already marked failed but not yet completed.
    std::vector<CohortPtr> rebase_pending_commits();

    void fail_cohort(CohortPtr const &, ShardError);

public:
    explicit ShardDataTree(
        ShardConfig, ReplicationBoundary * = nullptr, NodePtr root = nullptr);

    ShardDataTree(ShardDataTree const &) = delete;
    ShardDataTree &operator=(ShardDataTree const &) = delete;

    ShardConfig const &config() const noexcept
    {
        return config_;
    }

    void set_replication(ReplicationBoundary *replication) noexcept
    {
        replication_ = replication;
    }

    // invoked whenever the authoritative tree changes
    void set_root_observer(std::function<void(NodePtr const &)>);

    NodePtr const &root() const noexcept
    {
        return root_;
    }

    NodePtr const &tip() const noexcept
    {
        return tip_;
    }

    ShardStats const &stats() const noexcept
    {
        return stats_;
    }

    size_t pending_count() const noexcept
    {
        return in_flight();
    }

    size_t purged_history_count() const noexcept
    {
        return purge_order_.size();
    }

    ReadOnlyShardTransaction new_read_only_transaction(TransactionId const &);
    ReadWriteShardTransaction new_read_write_transaction(TransactionId const &);

    // Seals the transaction and queues its cohort behind every transaction
    // finished before it
    std::shared_ptr<ShardCommitCohort>
    finish_transaction(ReadWriteShardTransaction);

    // Confirmation from replication. For an id this shard never queued the
    // payload is applied as a follower.
    Result<void> apply_replicated_payload(
        TransactionId const &, byte_string_view payload);

    // Replication rejected an append issued for id
    void fail_replication(TransactionId const &, ShardError);

    Result<void> apply_snapshot(byte_string_view);
    byte_string take_state_snapshot() const;

    void register_tree_change_listener(
        Path const &, std::shared_ptr<TreeChangeListener>,
        std::optional<Candidate> initial_state,
        std::function<void(ListenerRegistration)> on_registered);

    // Forgets a closed client history
    void purge_history(uint64_t history);
};

ARBOR_NAMESPACE_END
