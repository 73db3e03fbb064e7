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
#include <arbor/core/result.hpp>
#include <arbor/shard/transaction_id.hpp>

#include <boost/fiber/future.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

ARBOR_NAMESPACE_BEGIN

class ProxyTransaction;

using ProxyPtr = std::shared_ptr<ProxyTransaction>;

// No shard was touched, nothing to coordinate
struct EmptyCommitCohort
{
};

// Single shard, phases go straight to its proxy
struct DirectCommitCohort
{
    ProxyPtr proxy;
};

// Every phase runs on all participants and succeeds only when all do
struct MultiCommitCohort
{
    std::vector<ProxyPtr> proxies;
};

enum class CommitPhase : uint8_t
{
    CanCommit = 1,
    PreCommit = 2,
    Commit = 4,
    Abort = 8,
};

// Three phase commit handle returned by ClientTransaction::ready. Futures
// are fulfilled from the shard executors; each phase may be requested once.
class ClientCommitCohort final
{
public:
    using Impl =
        std::variant<EmptyCommitCohort, DirectCommitCohort, MultiCommitCohort>;

private:
    TransactionId id_;
    Impl impl_;
    std::atomic<uint8_t> requested_{0};

    void request(CommitPhase);

public:
    ClientCommitCohort(TransactionId const &, Impl);

    ClientCommitCohort(ClientCommitCohort const &) = delete;
    ClientCommitCohort &operator=(ClientCommitCohort const &) = delete;

    TransactionId const &id() const noexcept
    {
        return id_;
    }

    Impl const &impl() const noexcept
    {
        return impl_;
    }

    size_t participants() const noexcept;

    [[nodiscard]] boost::fibers::future<Result<void>> can_commit();
    [[nodiscard]] boost::fibers::future<Result<void>> pre_commit();
    [[nodiscard]] boost::fibers::future<Result<void>> commit();
    [[nodiscard]] boost::fibers::future<Result<void>> abort();
};

ARBOR_NAMESPACE_END
