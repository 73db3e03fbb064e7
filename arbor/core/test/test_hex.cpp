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
#include <arbor/core/hex.hpp>

#include <gtest/gtest.h>

using namespace arbor;

TEST(Hex, to_hex)
{
    EXPECT_EQ(to_hex(byte_string{}), "");
    EXPECT_EQ(to_hex(byte_string{0x00, 0x0f, 0xab, 0xff}), "000fabff");
}

TEST(Hex, from_hex)
{
    EXPECT_EQ(from_hex("000fabff"), (byte_string{0x00, 0x0f, 0xab, 0xff}));
    EXPECT_EQ(from_hex("0xABcd"), (byte_string{0xab, 0xcd}));
    EXPECT_EQ(from_hex(""), byte_string{});
    EXPECT_EQ(from_hex("0x"), byte_string{});
}

TEST(Hex, from_hex_rejects_malformed)
{
    EXPECT_FALSE(from_hex("abc").has_value());
    EXPECT_FALSE(from_hex("zz").has_value());
    EXPECT_FALSE(from_hex("0x1g").has_value());
}
