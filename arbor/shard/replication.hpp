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
#include <arbor/shard/transaction_id.hpp>

ARBOR_NAMESPACE_BEGIN

// Hands committed payloads to the consensus log. Confirmation arrives later
// through ShardDataTree::apply_replicated_payload, a rejection through
// ShardDataTree::fail_replication or an error returned here.
class ReplicationBoundary
{
public:
    virtual ~ReplicationBoundary() = default;

    // batch_hint is set when another append follows immediately
    virtual Result<void> append_for_replication(
        TransactionId const &, byte_string payload, bool batch_hint) = 0;
};

ARBOR_NAMESPACE_END
