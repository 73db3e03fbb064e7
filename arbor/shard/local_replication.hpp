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
#include <arbor/shard/replication.hpp>
#include <arbor/shard/transaction_id.hpp>

ARBOR_NAMESPACE_BEGIN

class ShardDataTree;

// Single node replication: every append is confirmed by a task queued on
// the shard executor, after the step that issued it.
class LocalReplication final : public ReplicationBoundary
{
    fiber::SerialExecutor &executor_;
    ShardDataTree *tree_{nullptr};

public:
    explicit LocalReplication(fiber::SerialExecutor &);

    void attach(ShardDataTree &tree) noexcept
    {
        tree_ = &tree;
    }

    Result<void> append_for_replication(
        TransactionId const &, byte_string payload, bool batch_hint) override;
};

ARBOR_NAMESPACE_END
