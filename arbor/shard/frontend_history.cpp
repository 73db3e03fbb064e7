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

#include <arbor/core/config.hpp>
#include <arbor/shard/frontend_history.hpp>

#include <cstdint>

ARBOR_NAMESPACE_BEGIN

bool FrontendHistory::accept(
    uint64_t const transaction, uint64_t const previous) noexcept
{
    if (transaction <= last_accepted_ || previous != last_accepted_) {
        return false;
    }
    last_accepted_ = transaction;
    return true;
}

ARBOR_NAMESPACE_END
