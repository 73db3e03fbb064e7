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

#include <arbor/client/data_store_client.hpp>
#include <arbor/core/config.hpp>
#include <arbor/core/result.hpp>
#include <arbor/datastore/config_error.hpp>
#include <arbor/datastore/datastore.hpp>
#include <arbor/datastore/datastore_config.hpp>
#include <arbor/shard/shard.hpp>
#include <arbor/shard/shard_config.hpp>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <algorithm>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

Datastore::Datastore(DatastoreConfig config)
    : config_{std::move(config)}
{
}

Datastore::~Datastore()
{
    // the client goes before the shards it routes to
    client_.reset();
    shards_.clear();
    LOG_INFO("Datastore {} stopped", config_.name());
}

Result<std::unique_ptr<Datastore>> Datastore::create(DatastoreConfig config)
{
    quill::get_root_logger()->set_log_level(config.properties().log_level);

    // resolve every shard first so a bad property creates nothing
    std::vector<ShardConfig> shard_configs;
    for (auto const &definition : config.shards()) {
        shard_configs.push_back(
            BOOST_OUTCOME_TRYX(config.config_for_shard(definition.name)));
    }

    std::unique_ptr<Datastore> datastore{new Datastore{std::move(config)}};
    std::vector<Shard *> shards;
    for (auto &shard_config : shard_configs) {
        datastore->shards_.push_back(
            std::make_unique<Shard>(std::move(shard_config)));
        shards.push_back(datastore->shards_.back().get());
    }
    datastore->client_ = std::make_unique<DataStoreClient>(
        datastore->config_.strategy(), shards);
    LOG_INFO(
        "Datastore {} created with {} shards",
        datastore->config_.name(),
        shards.size());
    return datastore;
}

Result<Shard *> Datastore::shard(std::string_view const name) const
{
    auto const it = std::ranges::find_if(shards_, [name](auto const &shard) {
        return shard->config().name == name;
    });
    if (it == shards_.end()) {
        return ConfigError::UnknownShard;
    }
    return it->get();
}

ARBOR_NAMESPACE_END
