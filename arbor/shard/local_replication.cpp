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
#include <arbor/fiber/serial_executor.hpp>
#include <arbor/shard/fmt/transaction_id_fmt.hpp>
#include <arbor/shard/local_replication.hpp>
#include <arbor/shard/shard_data_tree.hpp>
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/transaction_id.hpp>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <utility>

ARBOR_NAMESPACE_BEGIN

LocalReplication::LocalReplication(fiber::SerialExecutor &executor)
    : executor_{executor}
{
}

Result<void> LocalReplication::append_for_replication(
    TransactionId const &id, byte_string payload, bool const batch_hint)
{
    ARBOR_ASSERT(tree_ != nullptr);
    LOG_DEBUG("local append of {}, batch hint {}", id, batch_hint);
    bool const submitted = executor_.submit(
        [tree = tree_, id, payload = std::move(payload)] {
            auto const res = tree->apply_replicated_payload(id, payload);
            if (ARBOR_UNLIKELY(res.has_error())) {
                LOG_ERROR(
                    "confirmation of {} rejected: {}",
                    id,
                    res.error().message().c_str());
            }
        });
    if (ARBOR_UNLIKELY(!submitted)) {
        return ShardError::ReplicationFailed;
    }
    return BOOST_OUTCOME_V2_NAMESPACE::success();
}

ARBOR_NAMESPACE_END
