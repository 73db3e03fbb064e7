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

#include <arbor/client/shard_strategy.hpp>
#include <arbor/tree/path.hpp>

#include <gtest/gtest.h>

using namespace arbor;

TEST(ShardStrategy, longest_prefix_wins)
{
    ShardStrategy const strategy{
        {ShardRoute{1, Path{"cars"}},
         ShardRoute{2, Path{"cars", "archive"}},
         ShardRoute{3, Path{"people"}}},
        0};
    EXPECT_EQ(strategy.shard_for(Path{"cars"}), 1);
    EXPECT_EQ(strategy.shard_for(Path{"cars", "car-list", "optima"}), 1);
    EXPECT_EQ(strategy.shard_for(Path{"cars", "archive", "1999"}), 2);
    EXPECT_EQ(strategy.shard_for(Path{"people", "bob"}), 3);
    EXPECT_EQ(strategy.shard_for(Path{"carsharing"}), 0);
    EXPECT_EQ(strategy.shard_for(Path{}), 0);
}

TEST(ShardStrategy, default_only)
{
    ShardStrategy const strategy{{}, 4};
    EXPECT_EQ(strategy.shard_for(Path{"anything"}), 4);
    EXPECT_EQ(strategy.default_shard(), 4);
}
