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
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/node.hpp>

#include <nlohmann/json.hpp>

ARBOR_NAMESPACE_BEGIN

// Nodes are encoded as {"value": "<hex>", "children": {"<name>": node}}

nlohmann::json node_to_json(NodePtr const &);
Result<NodePtr> node_from_json(nlohmann::json const &);

nlohmann::json candidate_to_json(Candidate const &);
Result<Candidate> candidate_from_json(nlohmann::json const &);

byte_string encode_json(nlohmann::json const &);
Result<nlohmann::json> decode_json(byte_string_view);

byte_string encode_tree(NodePtr const &);
Result<NodePtr> decode_tree(byte_string_view);

ARBOR_NAMESPACE_END
