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

#include <arbor/client/client_transaction.hpp>
#include <arbor/client/commit_cohort.hpp>
#include <arbor/client/data_store_client.hpp>
#include <arbor/core/result.hpp>
#include <arbor/datastore/config_error.hpp>
#include <arbor/datastore/datastore.hpp>
#include <arbor/datastore/datastore_config.hpp>
#include <arbor/shard/shard.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <quill/Quill.h>

#include <gtest/gtest.h>

#include <memory>
#include <utility>

using namespace arbor;

namespace
{
    constexpr auto document = R"({
        "name": "operational",
        "cars.commit-queue-capacity": 8,
        "shards": [{"name": "cars", "id": 1, "prefix": "/cars"}]
    })";

    std::unique_ptr<Datastore> make_datastore(char const *const text)
    {
        auto config = DatastoreConfig::parse(text);
        EXPECT_FALSE(config.has_error());
        auto datastore = Datastore::create(std::move(config).value());
        EXPECT_FALSE(datastore.has_error());
        return std::move(datastore).value();
    }
}

TEST(Datastore, builds_configured_shards)
{
    auto const datastore = make_datastore(document);
    ASSERT_EQ(datastore->shards().size(), 2);

    auto const cars = datastore->shard("cars");
    ASSERT_FALSE(cars.has_error());
    EXPECT_EQ(cars.value()->config().id, 1);
    EXPECT_EQ(cars.value()->config().commit_queue_capacity, 8);

    auto const def = datastore->shard("default");
    ASSERT_FALSE(def.has_error());
    EXPECT_EQ(def.value()->config().commit_queue_capacity, 1000);

    auto const missing = datastore->shard("people");
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.error(), ConfigError::UnknownShard);
}

TEST(Datastore, routes_commits_to_shards)
{
    auto const datastore = make_datastore(document);
    auto const transaction = datastore->client().create_transaction();
    transaction->write(Path{"cars"}, Node::leaf("bmw"));
    transaction->write(Path{"people"}, Node::leaf("bob"));
    auto const cohort = transaction->ready();
    EXPECT_EQ(cohort->participants(), 2);
    ASSERT_FALSE(cohort->can_commit().get().has_error());
    ASSERT_FALSE(cohort->pre_commit().get().has_error());
    ASSERT_FALSE(cohort->commit().get().has_error());

    auto const *const cars = datastore->shard("cars").value();
    auto const *const def = datastore->shard("default").value();
    ASSERT_NE(cars->root()->child("cars"), nullptr);
    EXPECT_EQ(cars->root()->child("people"), nullptr);
    ASSERT_NE(def->root()->child("people"), nullptr);
    EXPECT_EQ(def->root()->child("cars"), nullptr);
}

TEST(Datastore, invalid_shard_property_creates_nothing)
{
    auto config = DatastoreConfig::parse(R"({
        "cars.executor-capacity": 3,
        "shards": [{"name": "cars", "id": 1, "prefix": "/cars"}]
    })");
    ASSERT_FALSE(config.has_error());
    auto const datastore = Datastore::create(std::move(config).value());
    ASSERT_TRUE(datastore.has_error());
    EXPECT_EQ(datastore.error(), ConfigError::InvalidValue);
}

TEST(Datastore, applies_log_level)
{
    auto const previous = quill::get_root_logger()->log_level();
    {
        auto const datastore =
            make_datastore(R"({"name": "ds", "ds.log-level": "warning"})");
        EXPECT_EQ(
            quill::get_root_logger()->log_level(), quill::LogLevel::Warning);
    }
    quill::get_root_logger()->set_log_level(previous);
}
