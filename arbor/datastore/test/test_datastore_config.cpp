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
#include <arbor/datastore/config_error.hpp>
#include <arbor/datastore/datastore_config.hpp>
#include <arbor/tree/path.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <gtest/gtest.h>

using namespace arbor;

TEST(DatastoreConfig, defaults)
{
    DatastoreConfig const config;
    EXPECT_EQ(config.name(), "config");
    EXPECT_EQ(config.default_shard(), "default");
    EXPECT_EQ(config.properties().commit_queue_capacity, 1000);
    EXPECT_EQ(config.properties().log_level, quill::LogLevel::Info);
    ASSERT_EQ(config.shards().size(), 1);
    EXPECT_EQ(config.shards()[0].id, 0);
    EXPECT_TRUE(config.shards()[0].prefix.is_root());
}

TEST(DatastoreConfig, empty_document_has_default_shard)
{
    auto const res = DatastoreConfig::parse("{}");
    ASSERT_FALSE(res.has_error());
    ASSERT_EQ(res.value().shards().size(), 1);
    EXPECT_EQ(res.value().shards()[0].name, "default");
}

TEST(DatastoreConfig, shards_and_overrides)
{
    auto const res = DatastoreConfig::parse(R"({
        "name": "operational",
        "commit-queue-capacity": 500,
        "operational.commit-queue-capacity": "200",
        "operational.log-level": "DEBUG",
        "executor-capacity": 64,
        "cars.commit-queue-capacity": 50,
        "unknown-property": true,
        "shards": [
            {"name": "cars", "id": 1, "prefix": "/cars"},
            {"name": "people", "id": "2", "prefix": "/people/all"}
        ]
    })");
    ASSERT_FALSE(res.has_error());
    auto const &config = res.value();
    EXPECT_EQ(config.name(), "operational");
    EXPECT_EQ(config.properties().commit_queue_capacity, 200);
    EXPECT_EQ(config.properties().executor_capacity, 64);
    EXPECT_EQ(config.properties().log_level, quill::LogLevel::Debug);
    ASSERT_EQ(config.shards().size(), 3);

    auto const cars = config.config_for_shard("cars");
    ASSERT_FALSE(cars.has_error());
    EXPECT_EQ(cars.value().id, 1);
    EXPECT_EQ(cars.value().commit_queue_capacity, 50);
    EXPECT_EQ(cars.value().executor_capacity, 64);

    auto const people = config.config_for_shard("people");
    ASSERT_FALSE(people.has_error());
    EXPECT_EQ(people.value().commit_queue_capacity, 200);

    auto const def = config.shard("default");
    ASSERT_FALSE(def.has_error());
    EXPECT_EQ(def.value().id, 0);

    auto const strategy = config.strategy();
    EXPECT_EQ(strategy.shard_for(Path{"cars", "bmw"}), 1);
    EXPECT_EQ(strategy.shard_for(Path{"people", "all", "bob"}), 2);
    EXPECT_EQ(strategy.shard_for(Path{"people"}), 0);
}

TEST(DatastoreConfig, datastore_properties_override_global_regardless_of_order)
{
    auto const res = DatastoreConfig::parse(R"({
        "name": "ds",
        "ds.commit-queue-capacity": 7,
        "zz-last": 1,
        "commit-queue-capacity": 9
    })");
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().properties().commit_queue_capacity, 7);
}

TEST(DatastoreConfig, custom_default_shard)
{
    auto const res = DatastoreConfig::parse(R"({
        "default-shard": "main",
        "shards": [{"name": "main", "id": 0}, {"name": "cars", "id": 3, "prefix": "/cars"}]
    })");
    ASSERT_FALSE(res.has_error());
    auto const strategy = res.value().strategy();
    EXPECT_EQ(strategy.default_shard(), 0);
    EXPECT_EQ(strategy.shard_for(Path{"cars"}), 3);
}

TEST(DatastoreConfig, invalid_document)
{
    auto const res = DatastoreConfig::parse("{not json");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ConfigError::InvalidDocument);

    auto const array = DatastoreConfig::parse("[1, 2]");
    ASSERT_TRUE(array.has_error());
    EXPECT_EQ(array.error(), ConfigError::InvalidDocument);
}

TEST(DatastoreConfig, invalid_values)
{
    for (auto const *const document :
         {R"({"commit-queue-capacity": 0})",
          R"({"commit-queue-capacity": -5})",
          R"({"commit-queue-capacity": "many"})",
          R"({"executor-capacity": 100})",
          R"({"log-level": "loud"})",
          R"({"log-level": 3})",
          R"({"name": 5})",
          R"({"shards": {"name": "cars"}})",
          R"({"shards": [{"name": "cars"}]})"}) {
        auto const res = DatastoreConfig::parse(document);
        ASSERT_TRUE(res.has_error()) << document;
        EXPECT_EQ(res.error(), ConfigError::InvalidValue) << document;
    }
}

TEST(DatastoreConfig, invalid_shard_value_surfaces_per_shard)
{
    auto const res = DatastoreConfig::parse(R"({
        "cars.commit-queue-capacity": 0,
        "shards": [{"name": "cars", "id": 1, "prefix": "/cars"}]
    })");
    ASSERT_FALSE(res.has_error());
    auto const cars = res.value().config_for_shard("cars");
    ASSERT_TRUE(cars.has_error());
    EXPECT_EQ(cars.error(), ConfigError::InvalidValue);
    EXPECT_FALSE(res.value().config_for_shard("default").has_error());
}

TEST(DatastoreConfig, duplicate_shards)
{
    for (auto const *const document :
         {R"({"shards": [{"name": "a", "id": 1, "prefix": "/a"},
                         {"name": "a", "id": 2, "prefix": "/b"}]})",
          R"({"shards": [{"name": "a", "id": 1, "prefix": "/a"},
                         {"name": "b", "id": 1, "prefix": "/b"}]})",
          R"({"shards": [{"name": "a", "id": 1, "prefix": "/a"},
                         {"name": "b", "id": 2, "prefix": "/a"}]})",
          R"({"shards": [{"name": "a", "id": 0, "prefix": "/a"}]})"}) {
        auto const res = DatastoreConfig::parse(document);
        ASSERT_TRUE(res.has_error()) << document;
        EXPECT_EQ(res.error(), ConfigError::DuplicateShard) << document;
    }
}

TEST(DatastoreConfig, invalid_prefixes)
{
    for (auto const *const document :
         {R"({"shards": [{"name": "a", "id": 1, "prefix": "a"}]})",
          R"({"shards": [{"name": "a", "id": 1, "prefix": "/"}]})",
          R"({"shards": [{"name": "a", "id": 1}]})",
          R"({"shards": [{"name": "a", "id": 1, "prefix": "/a/*"}]})",
          R"({"shards": [{"name": "a", "id": 1, "prefix": 4}]})"}) {
        auto const res = DatastoreConfig::parse(document);
        ASSERT_TRUE(res.has_error()) << document;
        EXPECT_EQ(res.error(), ConfigError::InvalidPrefix) << document;
    }
}

TEST(DatastoreConfig, unknown_shard)
{
    DatastoreConfig const config;
    auto const res = config.config_for_shard("cars");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ConfigError::UnknownShard);
    EXPECT_TRUE(config.shard("cars").has_error());
}

TEST(DatastoreConfig, load_from_json)
{
    nlohmann::json document;
    document["name"] = "from-json";
    document["shards"] = nlohmann::json::array(
        {{{"name", "cars"}, {"id", 4}, {"prefix", "/cars"}}});
    auto const res = DatastoreConfig::load(document);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().name(), "from-json");
    ASSERT_FALSE(res.value().shard("cars").has_error());
    EXPECT_EQ(res.value().shard("cars").value().prefix, Path{"cars"});
}
