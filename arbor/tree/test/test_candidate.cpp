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

#include <arbor/tree/candidate.hpp>
#include <arbor/tree/modification.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace arbor;

namespace
{
    Path const cars{"cars"};
    Path const car_list{"cars", "car-list"};

    NodePtr commit(NodePtr const &root, DataTreeModification const &mod)
    {
        auto res = mod.apply_to(root);
        EXPECT_TRUE(res.has_value());
        return res.value();
    }

    NodePtr add_car(NodePtr const &root, char const *name)
    {
        DataTreeModification mod{root};
        mod.merge(cars, Node::make());
        mod.merge(car_list, Node::make());
        mod.write(car_list.child(name), Node::leaf(name));
        return commit(root, mod);
    }

    NodePtr remove_car(NodePtr const &root, char const *name)
    {
        DataTreeModification mod{root};
        mod.remove(car_list.child(name));
        return commit(root, mod);
    }

    NodePtr replay(NodePtr const &root, std::vector<Candidate> const &candidates)
    {
        DataTreeModification mod{root};
        for (auto const &candidate : candidates) {
            apply_to_modification(mod, candidate);
        }
        return commit(root, mod);
    }
}

TEST(Candidate, classifies_changes)
{
    auto const before = add_car(Node::make(), "altima");
    auto const after = remove_car(add_car(before, "optima"), "altima");
    auto const candidate = compute_candidate(before, after);

    EXPECT_EQ(candidate.root.type, ModificationType::SubtreeModified);
    auto const *list = candidate.root.child("cars")->child("car-list");
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->type, ModificationType::SubtreeModified);
    ASSERT_EQ(list->children.size(), 2);
    EXPECT_EQ(list->child("altima")->type, ModificationType::Delete);
    EXPECT_EQ(list->child("optima")->type, ModificationType::Write);
}

TEST(Candidate, structurally_equal_trees_are_unmodified)
{
    auto const a = add_car(Node::make(), "altima");
    auto const b = add_car(Node::make(), "altima");
    EXPECT_EQ(compute_candidate(a, b).root.type, ModificationType::Unmodified);
}

TEST(Candidate, add_remove_car_once)
{
    auto root = Node::make();
    std::vector<Candidate> candidates;
    auto next = add_car(root, "altima");
    candidates.push_back(compute_candidate(root, next));
    root = next;
    next = remove_car(root, "altima");
    candidates.push_back(compute_candidate(root, next));
    root = next;

    EXPECT_TRUE(equal(replay(root, candidates), root));
}

TEST(Candidate, add_remove_car_twice)
{
    auto root = Node::make();
    std::vector<Candidate> candidates;
    for (int i = 0; i < 2; ++i) {
        auto next = add_car(root, "altima");
        candidates.push_back(compute_candidate(root, next));
        root = next;
        next = remove_car(root, "altima");
        candidates.push_back(compute_candidate(root, next));
        root = next;
    }

    EXPECT_TRUE(equal(replay(root, candidates), root));
}

TEST(Candidate, replay_is_idempotent)
{
    auto const before = Node::make();
    auto const after = add_car(before, "altima");
    auto const candidate = compute_candidate(before, after);

    auto const once = apply_candidate(before, candidate);
    auto const twice = apply_candidate(once, candidate);
    EXPECT_TRUE(equal(once, after));
    EXPECT_TRUE(equal(twice, after));
}

TEST(Candidate, match_wildcard)
{
    auto const before = add_car(Node::make(), "altima");
    auto const after = add_car(add_car(before, "optima"), "murano");
    auto const candidate = compute_candidate(before, after);

    auto const matched =
        match_candidates(candidate, car_list.child(std::string{Path::WILDCARD}));
    ASSERT_EQ(matched.size(), 2);
    EXPECT_EQ(matched[0].root_path, car_list.child("murano"));
    EXPECT_EQ(matched[0].root.type, ModificationType::Write);
    EXPECT_EQ(matched[1].root_path, car_list.child("optima"));

    EXPECT_TRUE(match_candidates(candidate, Path{"people"}).empty());
    EXPECT_TRUE(match_candidates(candidate, car_list.child("altima")).empty());
    EXPECT_EQ(match_candidates(candidate, cars).size(), 1);
}
