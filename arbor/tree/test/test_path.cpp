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

#include <arbor/tree/fmt/path_fmt.hpp>
#include <arbor/tree/path.hpp>

#include <fmt/format.h>

#include <gtest/gtest.h>

using namespace arbor;

TEST(Path, parse)
{
    EXPECT_TRUE(Path::parse("/").is_root());
    EXPECT_TRUE(Path::parse("").is_root());
    EXPECT_EQ(Path::parse("/cars/car-list"), (Path{"cars", "car-list"}));
    EXPECT_EQ(Path::parse("cars//car-list/"), (Path{"cars", "car-list"}));
}

TEST(Path, to_string)
{
    EXPECT_EQ(Path{}.to_string(), "/");
    EXPECT_EQ((Path{"a", "b"}).to_string(), "/a/b");
    EXPECT_EQ(fmt::format("{}", Path{"people"}), "/people");
}

TEST(Path, child_parent)
{
    auto const p = Path{"a"}.child("b");
    EXPECT_EQ(p, (Path{"a", "b"}));
    EXPECT_EQ(p.parent(), Path{"a"});
    EXPECT_EQ(p.last(), "b");
    EXPECT_TRUE(Path{"a"}.parent().is_root());
}

TEST(Path, starts_with)
{
    Path const p{"a", "b", "c"};
    EXPECT_TRUE(p.starts_with(Path{}));
    EXPECT_TRUE(p.starts_with(Path{"a", "b"}));
    EXPECT_TRUE(p.starts_with(p));
    EXPECT_FALSE(p.starts_with(Path{"a", "c"}));
    EXPECT_FALSE(Path{"a"}.starts_with(p));
}

TEST(Path, wildcard_match)
{
    Path const pattern{"cars", "car-list", "*"};
    EXPECT_TRUE(pattern.has_wildcard());
    EXPECT_TRUE(matches(pattern, Path{"cars", "car-list", "optima"}));
    EXPECT_FALSE(matches(pattern, Path{"cars", "car-list"}));
    EXPECT_FALSE(matches(pattern, Path{"cars", "other", "optima"}));
    EXPECT_TRUE(matches(Path{"a"}, Path{"a"}));
}

TEST(Path, ordering)
{
    EXPECT_LT(Path{"a"}, (Path{"a", "b"}));
    EXPECT_LT((Path{"a", "b"}), Path{"b"});
}
