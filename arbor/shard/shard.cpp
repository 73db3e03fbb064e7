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

#include <arbor/core/assert.h>
#include <arbor/core/byte_string.hpp>
#include <arbor/core/config.hpp>
#include <arbor/core/likely.h>
#include <arbor/core/result.hpp>
#include <arbor/shard/shard.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/shard/shard_data_tree.hpp>
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/shard_transaction.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/shard/tree_change_listener.hpp>
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/fmt/path_fmt.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <boost/fiber/future.hpp>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <memory>
#include <mutex>
#include <optional>
#include <utility>

ARBOR_NAMESPACE_BEGIN

Shard::Shard(ShardConfig config)
    : config_{std::move(config)}
    , executor_{"shard-" + config_.name, config_.executor_capacity}
    , replication_{executor_}
    , tree_{config_, &replication_}
{
    replication_.attach(tree_);
    published_root_ = tree_.root();
    // runs on the executor from here on
    tree_.set_root_observer([this](NodePtr const &root) {
        std::lock_guard const lock{root_mutex_};
        published_root_ = root;
    });
    LOG_INFO("Shard {} ({}) started", config_.name, config_.id);
}

Shard::~Shard()
{
    stop();
}

void Shard::stop()
{
    executor_.shutdown();
}

NodePtr Shard::root() const
{
    std::lock_guard const lock{root_mutex_};
    return published_root_;
}

ReadOnlyShardTransaction
Shard::new_read_only_transaction(TransactionId const &id)
{
    read_only_created_.fetch_add(1, std::memory_order_relaxed);
    return ReadOnlyShardTransaction{id, root()};
}

ReadWriteShardTransaction
Shard::new_read_write_transaction(TransactionId const &id)
{
    read_write_created_.fetch_add(1, std::memory_order_relaxed);
    return ReadWriteShardTransaction{id, root()};
}

bool Shard::execute(std::function<void(ShardDataTree &)> fn)
{
    return executor_.submit(
        [this, fn = std::move(fn)] { fn(tree_); });
}

boost::fibers::future<ShardStats> Shard::stats()
{
    auto promise = std::make_shared<boost::fibers::promise<ShardStats>>();
    auto future = promise->get_future();
    bool const submitted = execute([this, promise](ShardDataTree &tree) {
        auto stats = tree.stats();
        stats.read_only_transactions +=
            read_only_created_.load(std::memory_order_relaxed);
        stats.read_write_transactions +=
            read_write_created_.load(std::memory_order_relaxed);
        promise->set_value(stats);
    });
    ARBOR_ASSERT(submitted);
    return future;
}

boost::fibers::future<ListenerRegistration> Shard::register_tree_change_listener(
    Path const &path, std::shared_ptr<TreeChangeListener> listener,
    bool const deliver_initial_state)
{
    auto promise =
        std::make_shared<boost::fibers::promise<ListenerRegistration>>();
    auto future = promise->get_future();
    bool const submitted = execute([this,
                                    path,
                                    listener = std::move(listener),
                                    deliver_initial_state,
                                    promise](ShardDataTree &tree) mutable {
        std::optional<Candidate> initial_state;
        if (deliver_initial_state && !path.has_wildcard() &&
            find_node(tree.root(), path) != nullptr) {
            initial_state = compute_candidate(path, nullptr, tree.root());
        }
        tree.register_tree_change_listener(
            path,
            std::move(listener),
            std::move(initial_state),
            [this, promise](ListenerRegistration registration) {
                auto const inner = std::make_shared<ListenerRegistration>(
                    std::move(registration));
                promise->set_value(ListenerRegistration{[this, inner] {
                    if (executor_.in_worker()) {
                        inner->close();
                        return;
                    }
                    if (!executor_.submit([inner] { inner->close(); })) {
                        LOG_WARNING("Listener closed after shard shutdown");
                    }
                }});
            });
    });
    ARBOR_ASSERT(submitted);
    return future;
}

boost::fibers::future<byte_string> Shard::take_state_snapshot()
{
    auto promise = std::make_shared<boost::fibers::promise<byte_string>>();
    auto future = promise->get_future();
    bool const submitted = execute([promise](ShardDataTree &tree) {
        promise->set_value(tree.take_state_snapshot());
    });
    ARBOR_ASSERT(submitted);
    return future;
}

boost::fibers::future<Result<void>> Shard::apply_snapshot(byte_string snapshot)
{
    auto promise = std::make_shared<boost::fibers::promise<Result<void>>>();
    auto future = promise->get_future();
    bool const submitted = execute(
        [promise, snapshot = std::move(snapshot)](ShardDataTree &tree) {
            promise->set_value(tree.apply_snapshot(snapshot));
        });
    if (ARBOR_UNLIKELY(!submitted)) {
        promise->set_value(ShardError::Aborted);
    }
    return future;
}

void Shard::purge_history(uint64_t const history)
{
    bool const submitted = execute(
        [history](ShardDataTree &tree) { tree.purge_history(history); });
    if (ARBOR_UNLIKELY(!submitted)) {
        LOG_WARNING(
            "Shard {} stopped, history {} not purged", config_.name, history);
    }
}

ARBOR_NAMESPACE_END
