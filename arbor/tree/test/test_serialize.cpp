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
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/decode_error.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>
#include <arbor/tree/serialize.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

using namespace arbor;

namespace
{
    NodePtr sample_tree()
    {
        auto const list = Node::make()
                              ->with_child("altima", Node::leaf("red"))
                              ->with_child("optima", Node::leaf("\x01\xff"));
        return Node::make()->with_child(
            "cars", Node::make()->with_child("car-list", list));
    }
}

TEST(Serialize, tree)
{
    auto const root = sample_tree();
    auto const decoded = decode_tree(encode_tree(root));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(equal(decoded.value(), root));
}

TEST(Serialize, node_json_layout)
{
    auto const j = node_to_json(Node::leaf("ab"));
    EXPECT_EQ(j["value"], "6162");
    EXPECT_TRUE(j["children"].empty());
}

TEST(Serialize, candidate)
{
    auto const before = sample_tree();
    auto const after = before->without_child("cars");
    auto const candidate = compute_candidate(before, after);
    auto const decoded = candidate_from_json(candidate_to_json(candidate));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), candidate);
    EXPECT_EQ(
        decoded.value().root.child("cars")->type, ModificationType::Delete);
}

TEST(Serialize, malformed_input)
{
    auto const not_json = decode_tree(to_byte_string("{not json"));
    ASSERT_TRUE(not_json.has_error());
    EXPECT_EQ(not_json.error(), DecodeError::InvalidDocument);

    auto const bad_hex = decode_tree(to_byte_string(R"({"value": "zz"})"));
    ASSERT_TRUE(bad_hex.has_error());
    EXPECT_EQ(bad_hex.error(), DecodeError::InvalidHex);

    auto const missing = node_from_json(nlohmann::json::object());
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.error(), DecodeError::MissingField);

    nlohmann::json bad_type = candidate_to_json(
        compute_candidate(Node::make(), sample_tree()));
    bad_type["root"]["type"] = "bogus";
    auto const unknown = candidate_from_json(bad_type);
    ASSERT_TRUE(unknown.has_error());
    EXPECT_EQ(unknown.error(), DecodeError::UnknownModificationType);
}
