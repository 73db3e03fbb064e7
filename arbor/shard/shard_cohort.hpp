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
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/modification.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <cstdint>
#include <functional>
#include <optional>

ARBOR_NAMESPACE_BEGIN

class ShardDataTree;

enum class CohortState : uint8_t
{
    Ready,
    CanCommitPending,
    CanCommitComplete,
    PreCommitComplete,
    CommitPending,
    Committed,
    Aborted,
    Failed,
};

char const *to_string(CohortState);

// Three phase commit handle of one transaction on one shard. Every method
// runs on the shard's executor; callbacks are invoked on it as well.
class ShardCommitCohort final
{
public:
    using Callback = std::function<void(Result<void>)>;

private:
    friend class ShardDataTree;

    ShardDataTree &tree_;
    TransactionId id_;
    DataTreeModification modification_;
    CohortState state_{CohortState::Ready};
    Callback callback_;
    // tree the candidate was computed against
    NodePtr computed_on_;
    NodePtr after_;
    std::optional<Candidate> candidate_;
    std::optional<Path> failure_path_;
    std::optional<ShardError> failure_;
    bool appended_{false};

    // false on a validation failure, recorded in failure_path_
    bool compute(NodePtr const &tip);
    void complete(Result<void>);
    void fail(ShardError);

public:
    ShardCommitCohort(
        ShardDataTree &, TransactionId const &, DataTreeModification);

    ShardCommitCohort(ShardCommitCohort const &) = delete;
    ShardCommitCohort &operator=(ShardCommitCohort const &) = delete;

    void can_commit(Callback);
    void pre_commit(Callback);
    void commit(Callback);
    void abort(Callback);

    TransactionId const &id() const noexcept
    {
        return id_;
    }

    CohortState state() const noexcept
    {
        return state_;
    }

    std::optional<Candidate> const &candidate() const noexcept
    {
        return candidate_;
    }

    // path that failed validation
    std::optional<Path> const &failure_path() const noexcept
    {
        return failure_path_;
    }
};

ARBOR_NAMESPACE_END
