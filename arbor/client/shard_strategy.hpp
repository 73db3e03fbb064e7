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
#include <arbor/shard/shard_config.hpp>
#include <arbor/tree/path.hpp>

#include <vector>

ARBOR_NAMESPACE_BEGIN

struct ShardRoute
{
    ShardId shard;
    Path prefix;
};

// Maps a path to the shard owning it: the route with the longest prefix of
// the path wins, paths no route covers belong to the default shard.
class ShardStrategy
{
    std::vector<ShardRoute> routes_;
    ShardId default_shard_;

public:
    explicit ShardStrategy(
        std::vector<ShardRoute> routes = {}, ShardId default_shard = 0);

    ShardId shard_for(Path const &) const noexcept;

    ShardId default_shard() const noexcept
    {
        return default_shard_;
    }
};

ARBOR_NAMESPACE_END
