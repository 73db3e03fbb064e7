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
#include <arbor/core/config.hpp>
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/modification.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

namespace
{
    std::vector<CandidateNode>
    diff_children(NodePtr const &before, NodePtr const &after)
    {
        static Node::Children const empty{};
        auto const &b = before ? before->children() : empty;
        auto const &a = after ? after->children() : empty;

        std::vector<CandidateNode> out;
        auto bi = b.begin();
        auto ai = a.begin();
        auto const add = [&out](CandidateNode node) {
            if (node.type != ModificationType::Unmodified) {
                out.push_back(std::move(node));
            }
        };
        while (bi != b.end() || ai != a.end()) {
            if (ai == a.end() || (bi != b.end() && bi->first < ai->first)) {
                add(compute_candidate_node(bi->first, bi->second, nullptr));
                ++bi;
            }
            else if (bi == b.end() || ai->first < bi->first) {
                add(compute_candidate_node(ai->first, nullptr, ai->second));
                ++ai;
            }
            else {
                add(compute_candidate_node(bi->first, bi->second, ai->second));
                ++bi;
                ++ai;
            }
        }
        return out;
    }

    void apply_node(
        DataTreeModification &mod, Path const &path, CandidateNode const &node)
    {
        switch (node.type) {
        case ModificationType::Unmodified:
            break;
        case ModificationType::Write:
            mod.write(path, node.after);
            break;
        case ModificationType::Delete:
            mod.remove(path);
            break;
        case ModificationType::SubtreeModified:
            for (auto const &child : node.children) {
                apply_node(mod, path.child(child.name), child);
            }
            break;
        }
    }

    void match_node(
        CandidateNode const &node, Path const &path, Path const &pattern,
        std::vector<Candidate> &out)
    {
        if (node.type == ModificationType::Unmodified) {
            return;
        }
        if (path.size() == pattern.size()) {
            if (matches(pattern, path)) {
                out.push_back(Candidate{path, node});
            }
            return;
        }
        auto const &arg = pattern.args()[path.size()];
        for (auto const &child : node.children) {
            if (arg == Path::WILDCARD || arg == child.name) {
                match_node(child, path.child(child.name), pattern, out);
            }
        }
    }
}

CandidateNode const *CandidateNode::child(std::string const &name) const
{
    for (auto const &c : children) {
        if (c.name == name) {
            return &c;
        }
    }
    return nullptr;
}

bool operator==(CandidateNode const &a, CandidateNode const &b)
{
    return a.name == b.name && a.type == b.type && equal(a.before, b.before) &&
           equal(a.after, b.after) && a.children == b.children;
}

CandidateNode
compute_candidate_node(std::string name, NodePtr before, NodePtr after)
{
    CandidateNode node{.name = std::move(name)};
    if (before == after) {
        node.before = std::move(before);
        node.after = std::move(after);
        return node;
    }
    node.children = diff_children(before, after);
    if (!after) {
        node.type = ModificationType::Delete;
    }
    else if (!before || before->value() != after->value()) {
        node.type = ModificationType::Write;
    }
    else if (!node.children.empty()) {
        node.type = ModificationType::SubtreeModified;
    }
    node.before = std::move(before);
    node.after = std::move(after);
    return node;
}

Candidate compute_candidate(
    Path root_path, NodePtr const &before, NodePtr const &after)
{
    std::string name = root_path.is_root() ? std::string{} : root_path.last();
    return Candidate{
        std::move(root_path),
        compute_candidate_node(
            std::move(name), find_node(before, root_path),
            find_node(after, root_path))};
}

Candidate compute_candidate(NodePtr const &before, NodePtr const &after)
{
    return compute_candidate(Path{}, before, after);
}

void apply_to_modification(
    DataTreeModification &mod, Candidate const &candidate)
{
    apply_node(mod, candidate.root_path, candidate.root);
}

NodePtr apply_candidate(NodePtr const &root, Candidate const &candidate)
{
    DataTreeModification mod{root};
    apply_to_modification(mod, candidate);
    return mod.root();
}

std::vector<Candidate>
match_candidates(Candidate const &candidate, Path const &pattern)
{
    std::vector<Candidate> out;
    auto const &root_path = candidate.root_path;
    if (root_path.size() > pattern.size()) {
        // the changed subtree lies below the registered path
        Path const prefix{std::vector<std::string>{
            root_path.args().begin(),
            root_path.args().begin() +
                static_cast<std::ptrdiff_t>(pattern.size())}};
        if (matches(pattern, prefix) &&
            candidate.root.type != ModificationType::Unmodified) {
            out.push_back(candidate);
        }
        return out;
    }
    for (size_t i = 0; i < root_path.size(); ++i) {
        auto const &p = pattern.args()[i];
        if (p != Path::WILDCARD && p != root_path.args()[i]) {
            return out;
        }
    }
    match_node(candidate.root, root_path, pattern, out);
    return out;
}

ARBOR_NAMESPACE_END
