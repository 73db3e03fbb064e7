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

#include <arbor/client/data_store_client.hpp>
#include <arbor/core/config.hpp>
#include <arbor/core/result.hpp>
#include <arbor/datastore/datastore_config.hpp>
#include <arbor/shard/shard.hpp>

#include <memory>
#include <string_view>
#include <vector>

ARBOR_NAMESPACE_BEGIN

// Shards built from a configuration, each with loopback replication, and
// the client that routes transactions to them. Histories and transactions
// handed out by the client must be closed before the datastore goes away.
class Datastore final
{
    DatastoreConfig const config_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::unique_ptr<DataStoreClient> client_;

    explicit Datastore(DatastoreConfig);

public:
    static Result<std::unique_ptr<Datastore>> create(DatastoreConfig);

    ~Datastore();

    Datastore(Datastore const &) = delete;
    Datastore &operator=(Datastore const &) = delete;

    DatastoreConfig const &config() const noexcept
    {
        return config_;
    }

    DataStoreClient &client() noexcept
    {
        return *client_;
    }

    Result<Shard *> shard(std::string_view name) const;

    std::vector<std::unique_ptr<Shard>> const &shards() const noexcept
    {
        return shards_;
    }
};

ARBOR_NAMESPACE_END
