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
#include <arbor/core/byte_string.hpp>
#include <arbor/core/config.hpp>
#include <arbor/core/likely.h>
#include <arbor/core/result.hpp>
#include <arbor/shard/commit_payload.hpp>
#include <arbor/shard/fmt/transaction_id_fmt.hpp>
#include <arbor/shard/replication.hpp>
#include <arbor/shard/shard_cohort.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/shard/shard_data_tree.hpp>
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/shard_transaction.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/shard/tree_change_listener.hpp>
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/fmt/path_fmt.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>
#include <arbor/tree/serialize.hpp>

#include <boost/outcome/success_failure.hpp>

#include <fmt/format.h>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <algorithm>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

namespace
{
    template <class Queue>
    auto find_cohort(Queue &queue, ShardCommitCohort const *const cohort)
    {
        return std::ranges::find_if(
            queue, [cohort](auto const &c) { return c.get() == cohort; });
    }

    template <class Queue>
    bool contains_id(Queue const &queue, TransactionId const &id)
    {
        return std::ranges::any_of(
            queue, [&id](auto const &c) { return c->id() == id; });
    }
}

ShardDataTree::ShardDataTree(
    ShardConfig config, ReplicationBoundary *const replication, NodePtr root)
    : config_{std::move(config)}
    , replication_{replication}
    , root_{root ? std::move(root) : Node::make()}
    , tip_{root_}
{
}

void ShardDataTree::set_root_observer(
    std::function<void(NodePtr const &)> observer)
{
    on_root_changed_ = std::move(observer);
    if (on_root_changed_) {
        on_root_changed_(root_);
    }
}

size_t ShardDataTree::in_flight() const noexcept
{
    return pending_transactions_.size() + pending_commits_.size() +
           pending_finish_.size();
}

void ShardDataTree::set_root(NodePtr root)
{
    root_ = std::move(root);
    if (on_root_changed_) {
        on_root_changed_(root_);
    }
}

void ShardDataTree::notify(Candidate const &candidate)
{
    if (candidate.root.type != ModificationType::Unmodified) {
        publisher_.publish(candidate);
    }
}

ReadOnlyShardTransaction
ShardDataTree::new_read_only_transaction(TransactionId const &id)
{
    ++stats_.read_only_transactions;
    return ReadOnlyShardTransaction{id, root_};
}

ReadWriteShardTransaction
ShardDataTree::new_read_write_transaction(TransactionId const &id)
{
    ++stats_.read_write_transactions;
    return ReadWriteShardTransaction{id, root_};
}

std::shared_ptr<ShardCommitCohort>
ShardDataTree::finish_transaction(ReadWriteShardTransaction transaction)
{
    auto const id = transaction.id();
    auto &modification = transaction.modification();
    if (!modification.is_sealed()) {
        modification.seal();
    }
    auto const cohort = std::make_shared<ShardCommitCohort>(
        *this, id, std::move(modification));

    if (ARBOR_UNLIKELY(purged_histories_.contains(id.history))) {
        LOG_WARNING(
            "{}: transaction {} belongs to a closed history", config_.name, id);
        cohort->failure_ = ShardError::HistoryClosed;
        return cohort;
    }
    // the id is consumed even when the queue turns the transaction away,
    // the client already counts it as sent
    auto const [history, inserted] = histories_.try_emplace(id.history);
    if (ARBOR_UNLIKELY(
            !history->second.accept(id.transaction, transaction.previous()))) {
        LOG_WARNING(
            "{}: transaction {} out of order, previous {}, last accepted {}",
            config_.name,
            id,
            transaction.previous(),
            history->second.last_accepted());
        if (inserted) {
            histories_.erase(history);
        }
        cohort->failure_ = ShardError::OutOfOrderTransaction;
        return cohort;
    }
    if (ARBOR_UNLIKELY(in_flight() >= config_.commit_queue_capacity)) {
        LOG_WARNING(
            "{}: commit queue full ({} in flight), rejecting {}",
            config_.name,
            in_flight(),
            id);
        cohort->failure_ = ShardError::CommitQueueFull;
        return cohort;
    }

    cohort->compute(tip_);
    pending_transactions_.push_back(cohort);
    LOG_DEBUG("{}: transaction {} ready", config_.name, id);
    return cohort;
}

void ShardDataTree::start_can_commit(ShardCommitCohort &cohort)
{
    if (ARBOR_UNLIKELY(cohort.failure_.has_value())) {
        cohort.fail(cohort.failure_.value());
        ++stats_.failed;
        cohort.complete(cohort.failure_.value());
        return;
    }
    process_next_pending_transaction();
}

void ShardDataTree::process_next_pending_transaction()
{
    while (!pending_transactions_.empty()) {
        auto const cohort = pending_transactions_.front();
        if (cohort->state_ != CohortState::CanCommitPending) {
            return;
        }
        if (cohort->computed_on_ != tip_) {
            LOG_DEBUG(
                "{}: revalidating {} against the current tip",
                config_.name,
                cohort->id_);
            cohort->compute(tip_);
        }
        if (!cohort->after_) {
            pending_transactions_.pop_front();
            LOG_WARNING(
                "{}: transaction {} failed validation at {}",
                config_.name,
                cohort->id_,
                cohort->failure_path_.value_or(Path{}));
            fail_cohort(cohort, ShardError::ValidationConflict);
            continue;
        }
        cohort->state_ = CohortState::CanCommitComplete;
        LOG_DEBUG("{}: canCommit {} complete", config_.name, cohort->id_);
        cohort->complete(success());
        return;
    }
}

void ShardDataTree::start_pre_commit(ShardCommitCohort &c)
{
    ARBOR_ASSERT(
        !pending_transactions_.empty() &&
        pending_transactions_.front().get() == &c);
    auto const cohort = pending_transactions_.front();

    if (cohort->computed_on_ != tip_ && !cohort->compute(tip_)) {
        pending_transactions_.pop_front();
        LOG_WARNING(
            "{}: rebase of {} failed at {}",
            config_.name,
            cohort->id_,
            cohort->failure_path_.value_or(Path{}));
        fail_cohort(cohort, ShardError::RebaseFailed);
        process_next_pending_transaction();
        return;
    }

    pending_transactions_.pop_front();
    tip_ = cohort->after_;
    cohort->state_ = CohortState::PreCommitComplete;
    pending_commits_.push_back(cohort);
    LOG_DEBUG("{}: preCommit {} complete", config_.name, cohort->id_);
    cohort->complete(success());
    process_next_pending_transaction();
}

void ShardDataTree::start_commit(ShardCommitCohort &cohort)
{
    ARBOR_ASSERT(find_cohort(pending_commits_, &cohort) != pending_commits_.end());
    if (pending_commits_.front().get() != &cohort) {
        LOG_DEBUG(
            "{}: transaction {} scheduled for commit", config_.name, cohort.id_);
    }
    process_next_pending_commit();
}

void ShardDataTree::process_next_pending_commit()
{
    if (committing_) {
        return;
    }
    committing_ = true;
    while (!pending_commits_.empty()) {
        auto const cohort = pending_commits_.front();
        if (cohort->state_ != CohortState::CommitPending) {
            break;
        }
        // successors committing immediately join this append's batch
        process_next_pending_transaction();
        if (pending_commits_.empty() || pending_commits_.front() != cohort) {
            continue;
        }

        bool const batch_hint =
            pending_commits_.size() > 1 &&
            pending_commits_[1]->state_ == CohortState::CommitPending;
        pending_commits_.pop_front();
        pending_finish_.push_back(cohort);
        cohort->appended_ = true;

        LOG_DEBUG(
            "{}: appending {} for replication, batch hint {}",
            config_.name,
            cohort->id_,
            batch_hint);
        ARBOR_ASSERT(replication_ != nullptr);
        auto const result = replication_->append_for_replication(
            cohort->id_,
            encode_commit_payload(cohort->id_, cohort->candidate_.value()),
            batch_hint);
        if (ARBOR_UNLIKELY(result.has_error())) {
            LOG_ERROR(
                "{}: append of {} rejected: {}",
                config_.name,
                cohort->id_,
                result.error().message().c_str());
            fail_replication(cohort->id_, ShardError::ReplicationFailed);
        }
    }
    committing_ = false;
}

std::vector<std::shared_ptr<ShardCommitCohort>>
ShardDataTree::rebase_pending_commits()
{
    NodePtr base =
        pending_finish_.empty() ? root_ : pending_finish_.back()->after_;
    std::deque<CohortPtr> kept;
    std::vector<CohortPtr> failed;
    for (auto const &cohort : pending_commits_) {
        if (cohort->computed_on_ != base && !cohort->compute(base)) {
            LOG_WARNING(
                "{}: rebase of {} failed at {}",
                config_.name,
                cohort->id_,
                cohort->failure_path_.value_or(Path{}));
            cohort->fail(ShardError::RebaseFailed);
            ++stats_.failed;
            failed.push_back(cohort);
            continue;
        }
        base = cohort->after_;
        kept.push_back(cohort);
    }
    pending_commits_ = std::move(kept);
    tip_ = base;
    return failed;
}

void ShardDataTree::fail_cohort(CohortPtr const &cohort, ShardError const error)
{
    cohort->fail(error);
    ++stats_.failed;
    cohort->complete(error);
}

Result<void> ShardDataTree::start_abort(ShardCommitCohort &cohort)
{
    switch (cohort.state_) {
    case CohortState::Aborted:
    case CohortState::Failed:
        return success();
    case CohortState::Committed:
        return ShardError::CommitInProgress;
    default:
        break;
    }
    if (cohort.appended_) {
        LOG_WARNING(
            "{}: cannot abort {}, its commit is in progress",
            config_.name,
            cohort.id_);
        return ShardError::CommitInProgress;
    }

    LOG_DEBUG(
        "{}: aborting {} in state {}",
        config_.name,
        cohort.id_,
        to_string(cohort.state_));
    ++stats_.aborted;

    if (auto const it = find_cohort(pending_transactions_, &cohort);
        it != pending_transactions_.end()) {
        auto const keep_alive = *it;
        pending_transactions_.erase(it);
        cohort.state_ = CohortState::Aborted;
        cohort.complete(ShardError::Aborted);
        process_next_pending_transaction();
        return success();
    }

    if (auto const it = find_cohort(pending_commits_, &cohort);
        it != pending_commits_.end()) {
        auto const keep_alive = *it;
        pending_commits_.erase(it);
        cohort.state_ = CohortState::Aborted;
        auto const failed = rebase_pending_commits();
        cohort.complete(ShardError::Aborted);
        for (auto const &f : failed) {
            f->complete(ShardError::RebaseFailed);
        }
        process_next_pending_transaction();
        process_next_pending_commit();
        return success();
    }

    // rejected before it entered the pipeline
    cohort.state_ = CohortState::Aborted;
    cohort.complete(ShardError::Aborted);
    return success();
}

void ShardDataTree::fail_replication(
    TransactionId const &id, ShardError const error)
{
    auto const it = std::ranges::find_if(
        pending_finish_, [&id](auto const &c) { return c->id_ == id; });
    ARBOR_ASSERT_PRINTF(
        it != pending_finish_.end(),
        "%s",
        fmt::format("replication failure for {} which is not replicating", id)
            .c_str());

    // everything appended after the failed transaction was built on it
    std::vector<CohortPtr> const failed(it, pending_finish_.end());
    pending_finish_.erase(it, pending_finish_.end());
    for (auto const &cohort : failed) {
        LOG_ERROR("{}: replication of {} failed", config_.name, cohort->id_);
        cohort->fail(error);
        ++stats_.failed;
    }
    auto const rebase_failed = rebase_pending_commits();
    for (auto const &cohort : failed) {
        cohort->complete(error);
    }
    for (auto const &cohort : rebase_failed) {
        cohort->complete(ShardError::RebaseFailed);
    }
    process_next_pending_transaction();
    process_next_pending_commit();
}

Result<void> ShardDataTree::apply_replicated_payload(
    TransactionId const &id, byte_string_view const payload)
{
    if (!pending_finish_.empty() && pending_finish_.front()->id_ == id) {
        auto const cohort = pending_finish_.front();
        pending_finish_.pop_front();
        ARBOR_ASSERT(cohort->computed_on_ == root_);

        set_root(cohort->after_);
        cohort->state_ = CohortState::Committed;
        ++stats_.committed;
        LOG_DEBUG("{}: transaction {} committed", config_.name, id);
        notify(cohort->candidate_.value());
        cohort->complete(success());
        return success();
    }

    ARBOR_ASSERT_PRINTF(
        !contains_id(pending_finish_, id) &&
            !contains_id(pending_commits_, id) &&
            !contains_id(pending_transactions_, id),
        "%s",
        fmt::format("transaction {} confirmed out of order", id).c_str());

    // a transaction committed by another member
    ARBOR_ASSERT(pending_commits_.empty() && pending_finish_.empty());
    auto const decoded = BOOST_OUTCOME_TRYX(decode_commit_payload(payload));
    auto const before = root_;
    set_root(apply_candidate(root_, decoded.candidate));
    tip_ = root_;
    ++stats_.follower_applied;
    LOG_DEBUG("{}: applied replicated transaction {}", config_.name, id);
    notify(compute_candidate(before, root_));
    return success();
}

Result<void> ShardDataTree::apply_snapshot(byte_string_view const snapshot)
{
    ARBOR_ASSERT(pending_finish_.empty());
    auto new_root = BOOST_OUTCOME_TRYX(decode_tree(snapshot));

    auto const candidate = compute_candidate(root_, new_root);
    set_root(std::move(new_root));
    auto const failed = rebase_pending_commits();
    ++stats_.snapshots_applied;
    LOG_INFO(
        "{}: applied snapshot, {} preCommitted transactions rebased",
        config_.name,
        pending_commits_.size());
    notify(candidate);
    for (auto const &cohort : failed) {
        cohort->complete(ShardError::RebaseFailed);
    }
    return success();
}

byte_string ShardDataTree::take_state_snapshot() const
{
    return encode_tree(root_);
}

void ShardDataTree::register_tree_change_listener(
    Path const &path, std::shared_ptr<TreeChangeListener> listener,
    std::optional<Candidate> initial_state,
    std::function<void(ListenerRegistration)> on_registered)
{
    auto const id = publisher_.add(path, listener);
    if (initial_state.has_value()) {
        listener->on_tree_changed({std::move(initial_state).value()});
    }
    if (on_registered) {
        on_registered(ListenerRegistration{[this, id] { publisher_.remove(id); }});
    }
}

void ShardDataTree::purge_history(uint64_t const history)
{
    LOG_DEBUG("{}: purging history {}", config_.name, history);
    histories_.erase(history);
    if (!purged_histories_.insert(history).second) {
        return;
    }
    purge_order_.push_back(history);
    if (purge_order_.size() > MAX_PURGED_HISTORIES) {
        purged_histories_.erase(purge_order_.front());
        purge_order_.pop_front();
    }
}

ARBOR_NAMESPACE_END
