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

#include <cstddef>
#include <cstdint>
#include <string>

ARBOR_NAMESPACE_BEGIN

using ShardId = uint32_t;

struct ShardConfig
{
    std::string name{"default"};
    ShardId id{0};
    // in-flight transactions, pipeline and replication queues combined
    uint32_t commit_queue_capacity{1000};
    // task queue of the shard executor, a power of two
    size_t executor_capacity{1024};
};

ARBOR_NAMESPACE_END
