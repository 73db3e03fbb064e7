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

#include <arbor/client/commit_cohort.hpp>
#include <arbor/client/proxy_transaction.hpp>
#include <arbor/core/assert.h>
#include <arbor/core/config.hpp>
#include <arbor/core/result.hpp>
#include <arbor/shard/fmt/transaction_id_fmt.hpp>
#include <arbor/shard/transaction_id.hpp>

#include <boost/fiber/future.hpp>
#include <boost/outcome/success_failure.hpp>

#include <fmt/format.h>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

ARBOR_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

namespace
{
    using Promise = boost::fibers::promise<Result<void>>;
    using PromisePtr = std::shared_ptr<Promise>;
    using Phase = void (ProxyTransaction::*)(ProxyTransaction::Callback);

    boost::fibers::future<Result<void>> ready_future()
    {
        Promise promise;
        promise.set_value(success());
        return promise.get_future();
    }

    ProxyTransaction::Callback fulfil(PromisePtr promise)
    {
        return [promise = std::move(promise)](Result<void> result) {
            promise->set_value(std::move(result));
        };
    }

    // Runs phase on every proxy; done receives success or the first error
    // once all of them answered
    void run_all(
        std::vector<ProxyPtr> const &proxies, Phase const phase,
        ProxyTransaction::Callback done)
    {
        struct State
        {
            std::mutex mutex;
            size_t remaining;
            std::optional<Result<void>> failure;
            ProxyTransaction::Callback done;
        };

        auto const state = std::make_shared<State>();
        state->remaining = proxies.size();
        state->done = std::move(done);
        for (auto const &proxy : proxies) {
            ((*proxy).*phase)([state](Result<void> result) {
                std::unique_lock lock{state->mutex};
                if (result.has_error() && !state->failure.has_value()) {
                    state->failure.emplace(std::move(result));
                }
                if (--state->remaining != 0) {
                    return;
                }
                std::optional<Result<void>> failure =
                    std::move(state->failure);
                lock.unlock();
                if (failure.has_value()) {
                    state->done(std::move(failure).value());
                }
                else {
                    state->done(success());
                }
            });
        }
    }

    // canCommit and preCommit: a failure aborts every participant before
    // it is reported
    boost::fibers::future<Result<void>> run_voting_phase(
        TransactionId const &id, std::vector<ProxyPtr> const &proxies,
        Phase const phase)
    {
        auto const promise = std::make_shared<Promise>();
        auto future = promise->get_future();
        run_all(proxies, phase, [id, proxies, promise](Result<void> result) {
            if (!result.has_error()) {
                promise->set_value(std::move(result));
                return;
            }
            LOG_WARNING(
                "Transaction {} failed on a participant, aborting {} shards: "
                "{}",
                id,
                proxies.size(),
                result.error().message().c_str());
            auto const failure =
                std::make_shared<Result<void>>(std::move(result));
            run_all(
                proxies,
                &ProxyTransaction::abort,
                [id, failure, promise](Result<void> aborted) {
                    if (aborted.has_error()) {
                        LOG_ERROR(
                            "Transaction {} not aborted on every shard: {}",
                            id,
                            aborted.error().message().c_str());
                    }
                    promise->set_value(std::move(*failure));
                });
        });
        return future;
    }

    char const *phase_name(CommitPhase const phase)
    {
        switch (phase) {
        case CommitPhase::CanCommit:
            return "canCommit";
        case CommitPhase::PreCommit:
            return "preCommit";
        case CommitPhase::Commit:
            return "commit";
        case CommitPhase::Abort:
            return "abort";
        }
        return "unknown";
    }

    template <class... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };
}

ClientCommitCohort::ClientCommitCohort(TransactionId const &id, Impl impl)
    : id_{id}
    , impl_{std::move(impl)}
{
}

size_t ClientCommitCohort::participants() const noexcept
{
    return std::visit(
        overloaded{
            [](EmptyCommitCohort const &) -> size_t { return 0; },
            [](DirectCommitCohort const &) -> size_t { return 1; },
            [](MultiCommitCohort const &m) -> size_t {
                return m.proxies.size();
            }},
        impl_);
}

void ClientCommitCohort::request(CommitPhase const phase)
{
    char const *const name = phase_name(phase);
    auto const bit = static_cast<uint8_t>(phase);
    auto const previous = requested_.fetch_or(bit, std::memory_order_acq_rel);
    ARBOR_ASSERT_PRINTF(
        (previous & bit) == 0,
        "%s",
        fmt::format("{} of transaction {} requested twice", name, id_)
            .c_str());
    LOG_DEBUG("{} of {} across {} shards", name, id_, participants());
}

boost::fibers::future<Result<void>> ClientCommitCohort::can_commit()
{
    request(CommitPhase::CanCommit);
    return std::visit(
        overloaded{
            [](EmptyCommitCohort const &) { return ready_future(); },
            [](DirectCommitCohort const &d) {
                auto promise = std::make_shared<Promise>();
                auto future = promise->get_future();
                d.proxy->can_commit(fulfil(std::move(promise)));
                return future;
            },
            [this](MultiCommitCohort const &m) {
                return run_voting_phase(
                    id_, m.proxies, &ProxyTransaction::can_commit);
            }},
        impl_);
}

boost::fibers::future<Result<void>> ClientCommitCohort::pre_commit()
{
    request(CommitPhase::PreCommit);
    return std::visit(
        overloaded{
            [](EmptyCommitCohort const &) { return ready_future(); },
            [](DirectCommitCohort const &d) {
                auto promise = std::make_shared<Promise>();
                auto future = promise->get_future();
                d.proxy->pre_commit(fulfil(std::move(promise)));
                return future;
            },
            [this](MultiCommitCohort const &m) {
                return run_voting_phase(
                    id_, m.proxies, &ProxyTransaction::pre_commit);
            }},
        impl_);
}

boost::fibers::future<Result<void>> ClientCommitCohort::commit()
{
    request(CommitPhase::Commit);
    return std::visit(
        overloaded{
            [](EmptyCommitCohort const &) { return ready_future(); },
            [](DirectCommitCohort const &d) {
                auto promise = std::make_shared<Promise>();
                auto future = promise->get_future();
                d.proxy->commit(fulfil(std::move(promise)));
                return future;
            },
            [](MultiCommitCohort const &m) {
                auto promise = std::make_shared<Promise>();
                auto future = promise->get_future();
                run_all(
                    m.proxies, &ProxyTransaction::commit, fulfil(promise));
                return future;
            }},
        impl_);
}

boost::fibers::future<Result<void>> ClientCommitCohort::abort()
{
    request(CommitPhase::Abort);
    return std::visit(
        overloaded{
            [](EmptyCommitCohort const &) { return ready_future(); },
            [](DirectCommitCohort const &d) {
                auto promise = std::make_shared<Promise>();
                auto future = promise->get_future();
                d.proxy->abort(fulfil(std::move(promise)));
                return future;
            },
            [](MultiCommitCohort const &m) {
                auto promise = std::make_shared<Promise>();
                auto future = promise->get_future();
                run_all(m.proxies, &ProxyTransaction::abort, fulfil(promise));
                return future;
            }},
        impl_);
}

ARBOR_NAMESPACE_END
