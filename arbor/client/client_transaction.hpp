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

#include <arbor/client/commit_cohort.hpp>
#include <arbor/core/config.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <oneapi/tbb/concurrent_hash_map.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>

ARBOR_NAMESPACE_BEGIN

class ClientHistory;
class ProxyTransaction;

// Caller facing read-write transaction spanning any number of shards.
// A proxy is created the first time a shard's path is touched.
class ClientTransaction final
{
    enum class State : uint8_t
    {
        Open,
        Closed,
    };

    using ProxyMap =
        oneapi::tbb::concurrent_hash_map<ShardId, std::shared_ptr<ProxyTransaction>>;

    std::shared_ptr<ClientHistory> history_;
    TransactionId const id_;
    std::atomic<State> state_{State::Open};
    // shared by operations for their whole run, exclusive while closing, so
    // no operation overlaps ready() or abort()
    mutable std::shared_mutex state_mutex_;
    ProxyMap proxies_;

    void ensure_open() const;
    // holds the proxy's write lock while op runs
    template <class F>
    decltype(auto) with_proxy(Path const &, F &&op);
    bool close();
    void abort_proxies();

public:
    ClientTransaction(std::shared_ptr<ClientHistory>, TransactionId const &);
    ~ClientTransaction();

    ClientTransaction(ClientTransaction const &) = delete;
    ClientTransaction &operator=(ClientTransaction const &) = delete;

    TransactionId const &id() const noexcept
    {
        return id_;
    }

    bool is_closed() const noexcept
    {
        return state_.load(std::memory_order_acquire) == State::Closed;
    }

    size_t proxy_count() const
    {
        return proxies_.size();
    }

    bool exists(Path const &);
    NodePtr read(Path const &);
    void write(Path const &, NodePtr);
    void merge(Path const &, NodePtr);
    void remove(Path const &);

    // Seals every proxy and returns the commit cohort matching the number
    // of shards touched
    std::shared_ptr<ClientCommitCohort> ready();

    void abort();
    // Abort on a backend failure
    void local_abort(ShardError);
};

ARBOR_NAMESPACE_END
