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

#include <optional>
#include <string>
#include <string_view>

ARBOR_NAMESPACE_BEGIN

namespace
{
    constexpr char hex_digits[] = "0123456789abcdef";

    constexpr int nibble(char const c)
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }
}

std::string to_hex(byte_string_view const bytes)
{
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char const b : bytes) {
        out.push_back(hex_digits[b >> 4]);
        out.push_back(hex_digits[b & 0xf]);
    }
    return out;
}

std::optional<byte_string> from_hex(std::string_view s)
{
    if (s.starts_with("0x")) {
        s.remove_prefix(2);
    }
    if (s.size() % 2) {
        return std::nullopt;
    }
    byte_string out;
    out.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        int const hi = nibble(s[i]);
        int const lo = nibble(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
}

ARBOR_NAMESPACE_END
