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

#include <arbor/client/client_history.hpp>
#include <arbor/client/client_transaction.hpp>
#include <arbor/client/commit_cohort.hpp>
#include <arbor/client/data_store_client.hpp>
#include <arbor/client/proxy_transaction.hpp>
#include <arbor/core/assert.h>
#include <arbor/core/config.hpp>
#include <arbor/shard/fmt/transaction_id_fmt.hpp>
#include <arbor/shard/shard.hpp>
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <fmt/format.h>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

ClientTransaction::ClientTransaction(
    std::shared_ptr<ClientHistory> history, TransactionId const &id)
    : history_{std::move(history)}
    , id_{id}
{
}

ClientTransaction::~ClientTransaction()
{
    if (!is_closed()) {
        LOG_DEBUG("Transaction {} dropped while open", id_);
        abort();
    }
}

void ClientTransaction::ensure_open() const
{
    ARBOR_ASSERT_PRINTF(
        !is_closed(),
        "%s",
        fmt::format("Transaction {} is closed", id_).c_str());
}

template <class F>
decltype(auto) ClientTransaction::with_proxy(Path const &path, F &&op)
{
    std::shared_lock const lock{state_mutex_};
    ensure_open();
    auto &client = history_->client();
    auto const shard = client.strategy().shard_for(path);
    ProxyMap::accessor accessor;
    if (proxies_.insert(accessor, shard)) {
        LOG_DEBUG("Transaction {} reaches shard {}", id_, shard);
        accessor->second =
            std::make_shared<ProxyTransaction>(client.shard(shard), id_);
    }
    return std::forward<F>(op)(*accessor->second);
}

bool ClientTransaction::exists(Path const &path)
{
    return with_proxy(
        path, [&path](ProxyTransaction &proxy) { return proxy.exists(path); });
}

NodePtr ClientTransaction::read(Path const &path)
{
    return with_proxy(
        path, [&path](ProxyTransaction &proxy) { return proxy.read(path); });
}

void ClientTransaction::write(Path const &path, NodePtr data)
{
    with_proxy(path, [&path, &data](ProxyTransaction &proxy) {
        proxy.write(path, std::move(data));
    });
}

void ClientTransaction::merge(Path const &path, NodePtr data)
{
    with_proxy(path, [&path, &data](ProxyTransaction &proxy) {
        proxy.merge(path, std::move(data));
    });
}

void ClientTransaction::remove(Path const &path)
{
    with_proxy(
        path, [&path](ProxyTransaction &proxy) { proxy.remove(path); });
}

bool ClientTransaction::close()
{
    std::unique_lock const lock{state_mutex_};
    auto expected = State::Open;
    return state_.compare_exchange_strong(
        expected, State::Closed, std::memory_order_acq_rel);
}

std::shared_ptr<ClientCommitCohort> ClientTransaction::ready()
{
    bool const closed = close();
    ARBOR_ASSERT_PRINTF(
        closed,
        "%s",
        fmt::format("Transaction {} is closed", id_).c_str());

    std::vector<ProxyPtr> proxies;
    for (auto const &[shard, proxy] : proxies_) {
        proxies.push_back(proxy);
    }
    std::ranges::sort(proxies, [](auto const &a, auto const &b) {
        return a->shard_id() < b->shard_id();
    });
    for (auto const &proxy : proxies) {
        proxy->seal(
            history_->on_proxy_sealed(proxy->shard_id(), id_.transaction));
    }
    proxies_.clear();

    ClientCommitCohort::Impl impl;
    switch (proxies.size()) {
    case 0:
        impl = EmptyCommitCohort{};
        break;
    case 1:
        impl = DirectCommitCohort{std::move(proxies.front())};
        break;
    default:
        impl = MultiCommitCohort{std::move(proxies)};
        break;
    }
    history_->on_transaction_ready(id_);
    auto cohort = std::make_shared<ClientCommitCohort>(id_, std::move(impl));
    LOG_DEBUG(
        "Transaction {} ready on {} shards", id_, cohort->participants());
    return cohort;
}

void ClientTransaction::abort_proxies()
{
    for (auto const &[shard, proxy] : proxies_) {
        proxy->abort([id = id_, shard](Result<void> result) {
            if (result.has_error()) {
                LOG_WARNING(
                    "Abort of {} on shard {} failed: {}",
                    id,
                    shard,
                    result.error().message().c_str());
            }
        });
    }
    proxies_.clear();
    history_->on_transaction_aborted(id_);
}

void ClientTransaction::abort()
{
    if (!close()) {
        return;
    }
    LOG_DEBUG("Aborting transaction {}", id_);
    abort_proxies();
}

void ClientTransaction::local_abort(ShardError const error)
{
    if (!close()) {
        return;
    }
    Result<void> const reason{error};
    LOG_WARNING(
        "Transaction {} aborted locally: {}",
        id_,
        reason.error().message().c_str());
    abort_proxies();
}

ARBOR_NAMESPACE_END
