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

#include <cstdint>

ARBOR_NAMESPACE_BEGIN

// Shard side view of one client history. Transactions arrive in id order;
// each names the transaction of its history sent to this shard before it,
// so ids the client never sent here leave no gap.
class FrontendHistory
{
    uint64_t last_accepted_{0};

public:
    // false unless previous is the last accepted transaction
    bool accept(uint64_t transaction, uint64_t previous) noexcept;

    uint64_t last_accepted() const noexcept
    {
        return last_accepted_;
    }
};

ARBOR_NAMESPACE_END
