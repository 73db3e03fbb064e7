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
#include <arbor/core/result.hpp>
#include <arbor/shard/replication.hpp>
#include <arbor/shard/shard_cohort.hpp>
#include <arbor/shard/shard_data_tree.hpp>
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/shard/tree_change_listener.hpp>
#include <arbor/tree/candidate.hpp>

#include <boost/outcome/success_failure.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <utility>
#include <vector>

namespace arbor::test
{
    // Records appends; optionally confirms each one before returning
    struct RecordingReplication final : public ReplicationBoundary
    {
        struct Append
        {
            TransactionId id;
            byte_string payload;
            bool batch_hint;
        };

        std::vector<Append> appends;
        ShardDataTree *confirm{nullptr};
        std::optional<ShardError> reject;

        Result<void> append_for_replication(
            TransactionId const &id, byte_string payload,
            bool const batch_hint) override
        {
            appends.push_back(Append{id, std::move(payload), batch_hint});
            if (reject.has_value()) {
                return reject.value();
            }
            if (confirm != nullptr) {
                auto const res =
                    confirm->apply_replicated_payload(id, appends.back().payload);
                EXPECT_FALSE(res.has_error());
            }
            return BOOST_OUTCOME_V2_NAMESPACE::success();
        }
    };

    struct RecordingListener final : public TreeChangeListener
    {
        std::vector<std::vector<Candidate>> batches;

        void on_tree_changed(std::vector<Candidate> const &changes) override
        {
            batches.push_back(changes);
        }
    };

    struct PhaseResult
    {
        std::optional<Result<void>> result;

        ShardCommitCohort::Callback callback()
        {
            return [this](Result<void> r) {
                EXPECT_FALSE(result.has_value());
                result.emplace(std::move(r));
            };
        }

        bool done() const
        {
            return result.has_value();
        }

        bool succeeded() const
        {
            return result.has_value() && result->has_value();
        }
    };
}
