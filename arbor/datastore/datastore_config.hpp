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

#include <arbor/client/shard_strategy.hpp>
#include <arbor/core/config.hpp>
#include <arbor/core/result.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/tree/path.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

// Tunables settable through properties, globally or per shard
struct DatastoreProperties
{
    quill::LogLevel log_level{quill::LogLevel::Info};
    uint32_t commit_queue_capacity{1000};
    size_t executor_capacity{1024};
};

struct ShardDefinition
{
    std::string name;
    ShardId id;
    // the default shard owns every path no other prefix covers
    Path prefix;
};

// Immutable datastore configuration. The document is a flat object of
// dash-case properties plus a "shards" table:
//
//   {
//     "name": "operational",
//     "commit-queue-capacity": 500,
//     "operational.log-level": "debug",
//     "cars.commit-queue-capacity": 50,
//     "shards": [{"name": "cars", "id": 1, "prefix": "/cars"}]
//   }
//
// Properties prefixed with the datastore name override global ones;
// properties prefixed with a shard name only apply to that shard.
class DatastoreConfig
{
    std::string name_{"config"};
    std::string default_shard_{"default"};
    DatastoreProperties properties_;
    std::vector<ShardDefinition> shards_;
    // ordered so that datastore specific keys come last
    std::vector<std::pair<std::string, nlohmann::json>> raw_;

    std::vector<std::pair<std::string, nlohmann::json>>
    sorted_properties(nlohmann::json const &) const;

public:
    // one default shard, default properties
    DatastoreConfig();

    static Result<DatastoreConfig> load(nlohmann::json const &);
    static Result<DatastoreConfig> parse(std::string_view document);

    std::string const &name() const noexcept
    {
        return name_;
    }

    std::string const &default_shard() const noexcept
    {
        return default_shard_;
    }

    DatastoreProperties const &properties() const noexcept
    {
        return properties_;
    }

    std::vector<ShardDefinition> const &shards() const noexcept
    {
        return shards_;
    }

    Result<ShardDefinition> shard(std::string_view name) const;

    // Global properties with the shard's own properties applied on top
    Result<ShardConfig> config_for_shard(std::string_view name) const;

    ShardStrategy strategy() const;
};

ARBOR_NAMESPACE_END
