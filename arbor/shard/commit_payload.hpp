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
#include <arbor/tree/candidate.hpp>

ARBOR_NAMESPACE_BEGIN

struct CommitPayload
{
    TransactionId id;
    Candidate candidate;
};

byte_string encode_commit_payload(TransactionId const &, Candidate const &);

Result<CommitPayload> decode_commit_payload(byte_string_view);

ARBOR_NAMESPACE_END
