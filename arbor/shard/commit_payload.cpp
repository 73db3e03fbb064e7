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

#include <arbor/core/byte_string.hpp>
#include <arbor/core/config.hpp>
#include <arbor/core/result.hpp>
#include <arbor/shard/commit_payload.hpp>
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/serialize.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <utility>

ARBOR_NAMESPACE_BEGIN

byte_string
encode_commit_payload(TransactionId const &id, Candidate const &candidate)
{
    nlohmann::json j;
    j["id"]["history"] = id.history;
    j["id"]["transaction"] = id.transaction;
    j["candidate"] = candidate_to_json(candidate);
    return encode_json(j);
}

Result<CommitPayload> decode_commit_payload(byte_string_view const bytes)
{
    auto const j = BOOST_OUTCOME_TRYX(decode_json(bytes));
    if (!j.is_object() || !j.contains("id") || !j.contains("candidate")) {
        return ShardError::MalformedPayload;
    }
    auto const &id = j["id"];
    if (!id.contains("history") || !id.contains("transaction") ||
        !id["history"].is_number_unsigned() ||
        !id["transaction"].is_number_unsigned()) {
        return ShardError::MalformedPayload;
    }
    auto candidate = BOOST_OUTCOME_TRYX(candidate_from_json(j["candidate"]));
    return CommitPayload{
        TransactionId{
            id["history"].get<uint64_t>(), id["transaction"].get<uint64_t>()},
        std::move(candidate)};
}

ARBOR_NAMESPACE_END
