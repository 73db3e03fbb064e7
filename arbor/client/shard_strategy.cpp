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
#include <arbor/core/config.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/tree/path.hpp>

#include <algorithm>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

ShardStrategy::ShardStrategy(
    std::vector<ShardRoute> routes, ShardId const default_shard)
    : routes_{std::move(routes)}
    , default_shard_{default_shard}
{
    // longest prefix first
    std::ranges::stable_sort(routes_, [](auto const &a, auto const &b) {
        return a.prefix.size() > b.prefix.size();
    });
}

ShardId ShardStrategy::shard_for(Path const &path) const noexcept
{
    for (auto const &route : routes_) {
        if (path.starts_with(route.prefix)) {
            return route.shard;
        }
    }
    return default_shard_;
}

ARBOR_NAMESPACE_END
