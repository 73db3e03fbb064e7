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

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

ARBOR_NAMESPACE_BEGIN

// Transactions of one history are numbered in submission order
struct TransactionId
{
    uint64_t history{0};
    uint64_t transaction{0};

    friend bool operator==(TransactionId const &, TransactionId const &) =
        default;
    friend std::strong_ordering
    operator<=>(TransactionId const &, TransactionId const &) = default;
};

struct TransactionIdHash
{
    size_t operator()(TransactionId const &id) const noexcept
    {
        return std::hash<uint64_t>{}(id.history) * 31 +
               std::hash<uint64_t>{}(id.transaction);
    }
};

ARBOR_NAMESPACE_END
