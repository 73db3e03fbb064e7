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

#include <arbor/client/proxy_transaction.hpp>
#include <arbor/core/assert.h>
#include <arbor/core/config.hpp>
#include <arbor/core/likely.h>
#include <arbor/core/result.hpp>
#include <arbor/shard/fmt/transaction_id_fmt.hpp>
#include <arbor/shard/shard.hpp>
#include <arbor/shard/shard_cohort.hpp>
#include <arbor/shard/shard_data_tree.hpp>
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstdint>
#include <utility>

ARBOR_NAMESPACE_BEGIN

ProxyTransaction::ProxyTransaction(Shard &shard, TransactionId const &id)
    : shard_{shard}
    , id_{id}
    , transaction_{shard.new_read_write_transaction(id)}
{
}

ShardId ProxyTransaction::shard_id() const noexcept
{
    return shard_.config().id;
}

bool ProxyTransaction::exists(Path const &path) const
{
    return transaction_.exists(path);
}

NodePtr ProxyTransaction::read(Path const &path) const
{
    return transaction_.read_node(path);
}

void ProxyTransaction::write(Path const &path, NodePtr data)
{
    ARBOR_ASSERT(!sealed_);
    transaction_.write(path, std::move(data));
}

void ProxyTransaction::merge(Path const &path, NodePtr data)
{
    ARBOR_ASSERT(!sealed_);
    transaction_.merge(path, std::move(data));
}

void ProxyTransaction::remove(Path const &path)
{
    ARBOR_ASSERT(!sealed_);
    transaction_.remove(path);
}

void ProxyTransaction::seal(uint64_t const previous)
{
    ARBOR_ASSERT(!sealed_);
    sealed_ = true;
    transaction_.set_previous(previous);
    transaction_.modification().seal();
    bool const submitted = shard_.execute(
        [self = shared_from_this()](ShardDataTree &tree) {
            self->cohort_ = tree.finish_transaction(std::move(self->transaction_));
        });
    if (ARBOR_UNLIKELY(!submitted)) {
        LOG_WARNING(
            "Shard {} stopped before {} was sealed",
            shard_.config().name,
            id_);
    }
}

void ProxyTransaction::run(Step const step, char const *const name, Callback callback)
{
    ARBOR_ASSERT(sealed_);
    LOG_DEBUG("{} of {} on shard {}", name, id_, shard_.config().name);
    auto shared_callback =
        std::make_shared<Callback>(std::move(callback));
    bool const submitted = shard_.execute(
        [self = shared_from_this(), step, shared_callback](ShardDataTree &) {
            ARBOR_ASSERT(self->cohort_);
            ((*self->cohort_).*step)(std::move(*shared_callback));
        });
    if (ARBOR_UNLIKELY(!submitted)) {
        LOG_WARNING(
            "Shard {} stopped, {} of {} fails", shard_.config().name, name, id_);
        (*shared_callback)(ShardError::Aborted);
    }
}

void ProxyTransaction::can_commit(Callback callback)
{
    run(&ShardCommitCohort::can_commit, "canCommit", std::move(callback));
}

void ProxyTransaction::pre_commit(Callback callback)
{
    run(&ShardCommitCohort::pre_commit, "preCommit", std::move(callback));
}

void ProxyTransaction::commit(Callback callback)
{
    run(&ShardCommitCohort::commit, "commit", std::move(callback));
}

void ProxyTransaction::abort(Callback callback)
{
    if (!sealed_) {
        LOG_DEBUG(
            "Discarding unsealed {} on shard {}",
            id_,
            shard_.config().name);
        callback(BOOST_OUTCOME_V2_NAMESPACE::success());
        return;
    }
    run(&ShardCommitCohort::abort, "abort", std::move(callback));
}

ARBOR_NAMESPACE_END
