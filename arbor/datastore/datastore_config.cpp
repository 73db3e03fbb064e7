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
#include <arbor/core/log_level_map.hpp>
#include <arbor/core/result.hpp>
#include <arbor/datastore/config_error.hpp>
#include <arbor/datastore/datastore_config.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/tree/path.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <algorithm>
#include <bit>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

namespace
{
    // keys of the document that are not properties
    constexpr char NAME_KEY[] = "name";
    constexpr char DEFAULT_SHARD_KEY[] = "default-shard";
    constexpr char SHARDS_KEY[] = "shards";

    // numbers may be given as JSON numbers or decimal strings
    Result<uint64_t> to_unsigned(nlohmann::json const &value)
    {
        if (value.is_number_unsigned()) {
            return value.get<uint64_t>();
        }
        if (value.is_string()) {
            auto const &text = value.get_ref<std::string const &>();
            uint64_t out{};
            auto const *const end = text.data() + text.size();
            auto const [ptr, ec] = std::from_chars(text.data(), end, out);
            if (ec == std::errc{} && ptr == end) {
                return out;
            }
        }
        return ConfigError::InvalidValue;
    }

    // false when key names no property
    Result<bool> apply_property(
        DatastoreProperties &properties, std::string_view const key,
        nlohmann::json const &value)
    {
        if (key == "commit-queue-capacity") {
            auto const capacity = BOOST_OUTCOME_TRYX(to_unsigned(value));
            if (capacity == 0 ||
                capacity > std::numeric_limits<uint32_t>::max()) {
                return ConfigError::InvalidValue;
            }
            properties.commit_queue_capacity = static_cast<uint32_t>(capacity);
            return true;
        }
        if (key == "executor-capacity") {
            auto const capacity = BOOST_OUTCOME_TRYX(to_unsigned(value));
            if (!std::has_single_bit(capacity)) {
                return ConfigError::InvalidValue;
            }
            properties.executor_capacity = static_cast<size_t>(capacity);
            return true;
        }
        if (key == "log-level") {
            if (!value.is_string()) {
                return ConfigError::InvalidValue;
            }
            auto level = value.get<std::string>();
            std::ranges::transform(level, level.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            auto const it = log_level_map.find(level);
            if (it == log_level_map.end()) {
                return ConfigError::InvalidValue;
            }
            properties.log_level = it->second;
            return true;
        }
        return false;
    }

    std::string_view strip_prefix(std::string_view key, std::string const &prefix)
    {
        if (key.starts_with(prefix)) {
            key.remove_prefix(prefix.size());
        }
        return key;
    }

    Result<std::string> to_name(nlohmann::json const &value)
    {
        if (!value.is_string() || value.get_ref<std::string const &>().empty()) {
            return ConfigError::InvalidValue;
        }
        auto name = value.get<std::string>();
        if (name.find('.') != std::string::npos) {
            return ConfigError::InvalidValue;
        }
        return name;
    }
}

DatastoreConfig::DatastoreConfig()
    : shards_{ShardDefinition{default_shard_, 0, Path{}}}
{
}

std::vector<std::pair<std::string, nlohmann::json>>
DatastoreConfig::sorted_properties(nlohmann::json const &document) const
{
    std::vector<std::pair<std::string, nlohmann::json>> properties;
    for (auto const &[key, value] : document.items()) {
        if (key == NAME_KEY || key == DEFAULT_SHARD_KEY || key == SHARDS_KEY) {
            continue;
        }
        properties.emplace_back(key, value);
    }
    auto const prefix = name_ + '.';
    std::ranges::stable_partition(properties, [&prefix](auto const &p) {
        return !p.first.starts_with(prefix);
    });
    return properties;
}

Result<DatastoreConfig> DatastoreConfig::load(nlohmann::json const &document)
{
    if (!document.is_object()) {
        return ConfigError::InvalidDocument;
    }

    DatastoreConfig config;
    config.shards_.clear();
    if (document.contains(NAME_KEY)) {
        config.name_ = BOOST_OUTCOME_TRYX(to_name(document[NAME_KEY]));
    }
    if (document.contains(DEFAULT_SHARD_KEY)) {
        config.default_shard_ =
            BOOST_OUTCOME_TRYX(to_name(document[DEFAULT_SHARD_KEY]));
    }

    auto const datastore_prefix = config.name_ + '.';
    config.raw_ = config.sorted_properties(document);
    for (auto const &[key, value] : config.raw_) {
        auto const property = strip_prefix(key, datastore_prefix);
        if (property.find('.') != std::string_view::npos) {
            // shard specific, applied by config_for_shard
            continue;
        }
        bool const known =
            BOOST_OUTCOME_TRYX(apply_property(config.properties_, property, value));
        if (!known) {
            LOG_DEBUG("Ignoring unknown property {}", key);
        }
    }

    if (document.contains(SHARDS_KEY)) {
        auto const &shards = document[SHARDS_KEY];
        if (!shards.is_array()) {
            return ConfigError::InvalidValue;
        }
        for (auto const &shard : shards) {
            if (!shard.is_object() || !shard.contains("name") ||
                !shard.contains("id")) {
                return ConfigError::InvalidValue;
            }
            ShardDefinition definition;
            definition.name = BOOST_OUTCOME_TRYX(to_name(shard["name"]));
            auto const id = BOOST_OUTCOME_TRYX(to_unsigned(shard["id"]));
            if (id > std::numeric_limits<ShardId>::max()) {
                return ConfigError::InvalidValue;
            }
            definition.id = static_cast<ShardId>(id);
            if (shard.contains("prefix")) {
                auto const &prefix = shard["prefix"];
                if (!prefix.is_string()) {
                    return ConfigError::InvalidPrefix;
                }
                auto const &text = prefix.get_ref<std::string const &>();
                if (!text.starts_with('/')) {
                    return ConfigError::InvalidPrefix;
                }
                definition.prefix = Path::parse(text);
            }
            bool const is_default = definition.name == config.default_shard_;
            if (definition.prefix.has_wildcard() ||
                (definition.prefix.is_root() && !is_default)) {
                LOG_ERROR(
                    "Shard {} has invalid prefix {}",
                    definition.name,
                    definition.prefix.to_string());
                return ConfigError::InvalidPrefix;
            }
            bool const duplicate =
                std::ranges::any_of(config.shards_, [&](auto const &s) {
                    return s.name == definition.name ||
                           s.id == definition.id ||
                           (!is_default && s.prefix == definition.prefix);
                });
            if (duplicate) {
                LOG_ERROR("Shard {} defined twice", definition.name);
                return ConfigError::DuplicateShard;
            }
            config.shards_.push_back(std::move(definition));
        }
    }

    auto const has_default =
        std::ranges::any_of(config.shards_, [&config](auto const &s) {
            return s.name == config.default_shard_;
        });
    if (!has_default) {
        if (std::ranges::any_of(
                config.shards_, [](auto const &s) { return s.id == 0; })) {
            LOG_ERROR(
                "Default shard {} needs id 0, which is taken",
                config.default_shard_);
            return ConfigError::DuplicateShard;
        }
        config.shards_.push_back(
            ShardDefinition{config.default_shard_, 0, Path{}});
    }

    for (auto const &[key, value] : config.raw_) {
        auto const property = strip_prefix(key, datastore_prefix);
        auto const dot = property.find('.');
        if (dot == std::string_view::npos) {
            continue;
        }
        auto const shard = property.substr(0, dot);
        if (std::ranges::none_of(config.shards_, [shard](auto const &s) {
                return s.name == shard;
            })) {
            LOG_DEBUG("Ignoring property {} of unknown shard", key);
        }
    }

    LOG_INFO(
        "Loaded datastore configuration {} with {} shards",
        config.name_,
        config.shards_.size());
    return config;
}

Result<DatastoreConfig> DatastoreConfig::parse(std::string_view const document)
{
    auto const json = nlohmann::json::parse(document, nullptr, false);
    if (json.is_discarded()) {
        return ConfigError::InvalidDocument;
    }
    return load(json);
}

Result<ShardDefinition> DatastoreConfig::shard(std::string_view const name) const
{
    auto const it = std::ranges::find_if(
        shards_, [name](auto const &s) { return s.name == name; });
    if (it == shards_.end()) {
        return ConfigError::UnknownShard;
    }
    return *it;
}

Result<ShardConfig>
DatastoreConfig::config_for_shard(std::string_view const name) const
{
    auto const definition = BOOST_OUTCOME_TRYX(shard(name));
    auto properties = properties_;
    auto const datastore_prefix = name_ + '.';
    auto const shard_prefix = definition.name + '.';
    for (auto const &[key, value] : raw_) {
        auto property = strip_prefix(key, datastore_prefix);
        if (!property.starts_with(shard_prefix)) {
            continue;
        }
        property.remove_prefix(shard_prefix.size());
        bool const known =
            BOOST_OUTCOME_TRYX(apply_property(properties, property, value));
        if (!known) {
            LOG_DEBUG("Ignoring unknown property {}", key);
        }
    }
    return ShardConfig{
        .name = definition.name,
        .id = definition.id,
        .commit_queue_capacity = properties.commit_queue_capacity,
        .executor_capacity = properties.executor_capacity};
}

ShardStrategy DatastoreConfig::strategy() const
{
    std::vector<ShardRoute> routes;
    ShardId default_id = 0;
    for (auto const &shard : shards_) {
        if (shard.name == default_shard_) {
            default_id = shard.id;
            continue;
        }
        routes.push_back(ShardRoute{shard.id, shard.prefix});
    }
    return ShardStrategy{std::move(routes), default_id};
}

ARBOR_NAMESPACE_END
