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
#include <arbor/shard/fmt/transaction_id_fmt.hpp>
#include <arbor/shard/shard_cohort.hpp>
#include <arbor/shard/shard_data_tree.hpp>
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/modification.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <boost/outcome/success_failure.hpp>

#include <fmt/format.h>

#include <utility>

ARBOR_NAMESPACE_BEGIN

char const *to_string(CohortState const state)
{
    switch (state) {
    case CohortState::Ready:
        return "ready";
    case CohortState::CanCommitPending:
        return "can-commit-pending";
    case CohortState::CanCommitComplete:
        return "can-commit-complete";
    case CohortState::PreCommitComplete:
        return "pre-commit-complete";
    case CohortState::CommitPending:
        return "commit-pending";
    case CohortState::Committed:
        return "committed";
    case CohortState::Aborted:
        return "aborted";
    case CohortState::Failed:
        return "failed";
    }
    return "unknown";
}

ShardCommitCohort::ShardCommitCohort(
    ShardDataTree &tree, TransactionId const &id,
    DataTreeModification modification)
    : tree_{tree}
    , id_{id}
    , modification_{std::move(modification)}
{
}

bool ShardCommitCohort::compute(NodePtr const &tip)
{
    computed_on_ = tip;
    Path conflict;
    auto result = modification_.apply_to(tip, &conflict);
    if (result.has_error()) {
        after_ = nullptr;
        candidate_.reset();
        failure_path_ = std::move(conflict);
        return false;
    }
    after_ = std::move(result).value();
    candidate_ = compute_candidate(tip, after_);
    failure_path_.reset();
    return true;
}

void ShardCommitCohort::complete(Result<void> result)
{
    if (callback_) {
        auto callback = std::move(callback_);
        callback_ = nullptr;
        callback(std::move(result));
    }
}

void ShardCommitCohort::fail(ShardError const error)
{
    state_ = CohortState::Failed;
    failure_ = error;
}

void ShardCommitCohort::can_commit(Callback callback)
{
    if (state_ == CohortState::Failed || state_ == CohortState::Aborted) {
        callback(failure_.value_or(ShardError::Aborted));
        return;
    }
    ARBOR_ASSERT_PRINTF(
        state_ == CohortState::Ready,
        "%s",
        fmt::format("canCommit of {} in state {}", id_, to_string(state_))
            .c_str());
    state_ = CohortState::CanCommitPending;
    callback_ = std::move(callback);
    tree_.start_can_commit(*this);
}

void ShardCommitCohort::pre_commit(Callback callback)
{
    if (state_ == CohortState::Failed || state_ == CohortState::Aborted) {
        callback(failure_.value_or(ShardError::Aborted));
        return;
    }
    ARBOR_ASSERT_PRINTF(
        state_ == CohortState::CanCommitComplete,
        "%s",
        fmt::format("preCommit of {} in state {}", id_, to_string(state_))
            .c_str());
    callback_ = std::move(callback);
    tree_.start_pre_commit(*this);
}

void ShardCommitCohort::commit(Callback callback)
{
    if (state_ == CohortState::Failed || state_ == CohortState::Aborted) {
        callback(failure_.value_or(ShardError::Aborted));
        return;
    }
    ARBOR_ASSERT_PRINTF(
        state_ == CohortState::PreCommitComplete,
        "%s",
        fmt::format("commit of {} in state {}", id_, to_string(state_))
            .c_str());
    state_ = CohortState::CommitPending;
    callback_ = std::move(callback);
    tree_.start_commit(*this);
}

void ShardCommitCohort::abort(Callback callback)
{
    auto result = tree_.start_abort(*this);
    if (callback) {
        callback(std::move(result));
    }
}

ARBOR_NAMESPACE_END
