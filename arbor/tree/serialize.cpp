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
#include <arbor/core/hex.hpp>
#include <arbor/core/result.hpp>
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/decode_error.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>
#include <arbor/tree/serialize.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

namespace
{
    char const *to_string(ModificationType const type)
    {
        switch (type) {
        case ModificationType::Unmodified:
            return "unmodified";
        case ModificationType::Write:
            return "write";
        case ModificationType::Delete:
            return "delete";
        case ModificationType::SubtreeModified:
            return "subtree-modified";
        }
        return "unknown";
    }

    Result<ModificationType> type_from_string(std::string const &s)
    {
        for (auto const type :
             {ModificationType::Unmodified,
              ModificationType::Write,
              ModificationType::Delete,
              ModificationType::SubtreeModified}) {
            if (s == to_string(type)) {
                return type;
            }
        }
        return DecodeError::UnknownModificationType;
    }

    Result<NodePtr> optional_node_from_json(nlohmann::json const &j)
    {
        if (j.is_null()) {
            return NodePtr{};
        }
        return node_from_json(j);
    }

    nlohmann::json candidate_node_to_json(CandidateNode const &node)
    {
        nlohmann::json j;
        j["name"] = node.name;
        j["type"] = to_string(node.type);
        j["before"] = node.before ? node_to_json(node.before) : nullptr;
        j["after"] = node.after ? node_to_json(node.after) : nullptr;
        auto &children = j["children"] = nlohmann::json::array();
        for (auto const &child : node.children) {
            children.push_back(candidate_node_to_json(child));
        }
        return j;
    }

    Result<CandidateNode> candidate_node_from_json(nlohmann::json const &j)
    {
        if (!j.is_object() || !j.contains("name") || !j.contains("type") ||
            !j.contains("children")) {
            return DecodeError::MissingField;
        }
        if (!j["name"].is_string() || !j["type"].is_string() ||
            !j["children"].is_array()) {
            return DecodeError::InvalidDocument;
        }
        CandidateNode node;
        node.name = j["name"].get<std::string>();
        node.type =
            BOOST_OUTCOME_TRYX(type_from_string(j["type"].get<std::string>()));
        node.before = BOOST_OUTCOME_TRYX(
            optional_node_from_json(j.value("before", nlohmann::json{})));
        node.after = BOOST_OUTCOME_TRYX(
            optional_node_from_json(j.value("after", nlohmann::json{})));
        for (auto const &child : j["children"]) {
            node.children.push_back(
                BOOST_OUTCOME_TRYX(candidate_node_from_json(child)));
        }
        return node;
    }
}

nlohmann::json node_to_json(NodePtr const &node)
{
    nlohmann::json j;
    j["value"] = to_hex(node->value());
    auto &children = j["children"] = nlohmann::json::object();
    for (auto const &[name, child] : node->children()) {
        children[name] = node_to_json(child);
    }
    return j;
}

Result<NodePtr> node_from_json(nlohmann::json const &j)
{
    if (!j.is_object() || !j.contains("value")) {
        return DecodeError::MissingField;
    }
    if (!j["value"].is_string()) {
        return DecodeError::InvalidDocument;
    }
    auto value = from_hex(j["value"].get<std::string>());
    if (!value.has_value()) {
        return DecodeError::InvalidHex;
    }
    Node::Children children;
    if (j.contains("children")) {
        auto const &c = j["children"];
        if (!c.is_object()) {
            return DecodeError::InvalidDocument;
        }
        for (auto const &[name, child] : c.items()) {
            children.emplace(name, BOOST_OUTCOME_TRYX(node_from_json(child)));
        }
    }
    return Node::make(std::move(value.value()), std::move(children));
}

nlohmann::json candidate_to_json(Candidate const &candidate)
{
    nlohmann::json j;
    j["root_path"] = candidate.root_path.args();
    j["root"] = candidate_node_to_json(candidate.root);
    return j;
}

Result<Candidate> candidate_from_json(nlohmann::json const &j)
{
    if (!j.is_object() || !j.contains("root_path") || !j.contains("root")) {
        return DecodeError::MissingField;
    }
    auto const &path = j["root_path"];
    if (!path.is_array()) {
        return DecodeError::InvalidDocument;
    }
    std::vector<std::string> args;
    for (auto const &arg : path) {
        if (!arg.is_string()) {
            return DecodeError::InvalidDocument;
        }
        args.push_back(arg.get<std::string>());
    }
    auto root = BOOST_OUTCOME_TRYX(candidate_node_from_json(j["root"]));
    return Candidate{Path{std::move(args)}, std::move(root)};
}

byte_string encode_json(nlohmann::json const &j)
{
    return to_byte_string(j.dump());
}

Result<nlohmann::json> decode_json(byte_string_view const bytes)
{
    auto j = nlohmann::json::parse(
        to_string_view(bytes), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return BOOST_OUTCOME_V2_NAMESPACE::failure(DecodeError::InvalidDocument);
    }
    return j;
}

byte_string encode_tree(NodePtr const &root)
{
    return encode_json(node_to_json(root));
}

Result<NodePtr> decode_tree(byte_string_view const bytes)
{
    auto const j = BOOST_OUTCOME_TRYX(decode_json(bytes));
    return node_from_json(j);
}

ARBOR_NAMESPACE_END
