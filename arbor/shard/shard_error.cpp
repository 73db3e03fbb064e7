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

#include <arbor/shard/shard_error.hpp>

#include <boost/outcome/config.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<arbor::ShardError>::mapping> const &
quick_status_code_from_enum<arbor::ShardError>::value_mappings()
{
    using arbor::ShardError;

    static std::initializer_list<mapping> const v = {
        {ShardError::Success, "success", {errc::success}},
        {ShardError::ValidationConflict, "validation conflict", {}},
        {ShardError::RebaseFailed, "rebase failed", {}},
        {ShardError::ReplicationFailed, "replication failed", {}},
        {ShardError::Aborted, "aborted", {errc::operation_canceled}},
        {ShardError::CommitInProgress, "commit in progress", {}},
        {ShardError::OutOfOrderTransaction, "out of order transaction", {}},
        {ShardError::HistoryClosed, "history closed", {}},
        {ShardError::CommitQueueFull,
         "commit queue full",
         {errc::resource_unavailable_try_again}},
        {ShardError::MalformedPayload, "malformed payload", {}}};

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
