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

#include <arbor/core/config.hpp>
#include <arbor/tree/modification.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <cstdint>
#include <string>
#include <vector>

ARBOR_NAMESPACE_BEGIN

enum class ModificationType : uint8_t
{
    Unmodified,
    Write,
    Delete,
    SubtreeModified,
};

// Change record of one node. Children hold only the modified children,
// ordered by name.
struct CandidateNode
{
    std::string name;
    ModificationType type{ModificationType::Unmodified};
    NodePtr before;
    NodePtr after;
    std::vector<CandidateNode> children;

    CandidateNode const *child(std::string const &) const;

    friend bool operator==(CandidateNode const &, CandidateNode const &);
};

// Immutable diff produced by a closed modification
struct Candidate
{
    Path root_path;
    CandidateNode root;

    friend bool operator==(Candidate const &, Candidate const &) = default;
};

CandidateNode
compute_candidate_node(std::string name, NodePtr before, NodePtr after);

Candidate compute_candidate(
    Path root_path, NodePtr const &before, NodePtr const &after);

// Root to root diff of two trees
Candidate compute_candidate(NodePtr const &before, NodePtr const &after);

// Records the candidate's changes as operations on mod. Replaying a
// candidate onto a tree that already reflects it leaves the tree unchanged.
void apply_to_modification(DataTreeModification &, Candidate const &);

// Applies the candidate's after state to root
NodePtr apply_candidate(NodePtr const &root, Candidate const &);

// Sub-candidates rooted at every concrete path matched by pattern whose node
// was modified. Unmodified matches are skipped.
std::vector<Candidate>
match_candidates(Candidate const &, Path const &pattern);

ARBOR_NAMESPACE_END
