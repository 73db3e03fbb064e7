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
#include <arbor/client/shard_strategy.hpp>
#include <arbor/core/result.hpp>
#include <arbor/shard/shard.hpp>
#include <arbor/shard/shard_cohort.hpp>
#include <arbor/shard/shard_config.hpp>
#include <arbor/shard/shard_data_tree.hpp>
#include <arbor/shard/shard_error.hpp>
#include <arbor/shard/shard_transaction.hpp>
#include <arbor/shard/transaction_id.hpp>
#include <arbor/tree/node.hpp>
#include <arbor/tree/path.hpp>

#include <boost/fiber/future.hpp>

#include <fmt/format.h>

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

using namespace arbor;

namespace
{
    Path const cars{"cars"};
    Path const people{"people"};

    Result<void> three_phase_commit(ClientCommitCohort &cohort)
    {
        auto result = cohort.can_commit().get();
        if (result.has_error()) {
            return result;
        }
        result = cohort.pre_commit().get();
        if (result.has_error()) {
            return result;
        }
        return cohort.commit().get();
    }

    struct ClientTransactionTest : public ::testing::Test
    {
        Shard default_shard{ShardConfig{.name = "default", .id = 0}};
        Shard cars_shard{ShardConfig{.name = "cars", .id = 1}};
        DataStoreClient client{
            ShardStrategy{{ShardRoute{1, cars}}, 0},
            {&default_shard, &cars_shard}};

        size_t pending(Shard &shard)
        {
            boost::fibers::promise<size_t> count;
            auto future = count.get_future();
            EXPECT_TRUE(shard.execute([&count](ShardDataTree &tree) {
                count.set_value(tree.pending_count());
            }));
            return future.get();
        }

        // commits a write of path on a transaction of history
        Result<void>
        commit_write(ClientHistory &history, Path const &path, char const *v)
        {
            auto const transaction = history.create_transaction();
            transaction->write(path, Node::leaf(v));
            auto const cohort = transaction->ready();
            return three_phase_commit(*cohort);
        }
    };
}

TEST_F(ClientTransactionTest, reads_observe_own_writes)
{
    auto const transaction = client.create_transaction();
    EXPECT_FALSE(transaction->exists(cars));
    transaction->write(cars, Node::leaf("x"));
    EXPECT_TRUE(transaction->exists(cars));
    EXPECT_EQ(transaction->read(cars)->value(), to_byte_string("x"));
    EXPECT_EQ(transaction->read(people), nullptr);
    EXPECT_EQ(transaction->proxy_count(), 2);
    EXPECT_EQ(cars_shard.root()->child("cars"), nullptr);
}

TEST_F(ClientTransactionTest, empty_cohort)
{
    auto const transaction = client.create_transaction();
    auto const cohort = transaction->ready();
    EXPECT_TRUE(transaction->is_closed());
    EXPECT_TRUE(std::holds_alternative<EmptyCommitCohort>(cohort->impl()));
    EXPECT_EQ(cohort->participants(), 0);
    EXPECT_FALSE(three_phase_commit(*cohort).has_error());
}

TEST_F(ClientTransactionTest, direct_cohort_commits)
{
    auto const transaction = client.create_transaction();
    transaction->write(cars, Node::leaf("x"));
    auto const cohort = transaction->ready();
    ASSERT_TRUE(std::holds_alternative<DirectCommitCohort>(cohort->impl()));
    ASSERT_FALSE(three_phase_commit(*cohort).has_error());
    ASSERT_NE(cars_shard.root()->child("cars"), nullptr);
    EXPECT_EQ(default_shard.root()->child("cars"), nullptr);
}

TEST_F(ClientTransactionTest, multi_cohort_commits_everywhere)
{
    auto const transaction = client.create_transaction();
    transaction->write(cars, Node::leaf("x"));
    transaction->write(people, Node::leaf("y"));
    auto const cohort = transaction->ready();
    ASSERT_TRUE(std::holds_alternative<MultiCommitCohort>(cohort->impl()));
    EXPECT_EQ(cohort->participants(), 2);
    ASSERT_FALSE(three_phase_commit(*cohort).has_error());
    EXPECT_NE(cars_shard.root()->child("cars"), nullptr);
    EXPECT_NE(default_shard.root()->child("people"), nullptr);
}

TEST_F(ClientTransactionTest, multi_can_commit_failure_aborts_participants)
{
    auto const multi = client.create_transaction();
    auto const direct = client.create_transaction();
    multi->write(cars, Node::leaf("x"));
    multi->write(people, Node::leaf("y"));
    direct->write(cars, Node::leaf("z"));

    auto const direct_cohort = direct->ready();
    ASSERT_FALSE(three_phase_commit(*direct_cohort).has_error());

    auto const cohort = multi->ready();
    auto const res = cohort->can_commit().get();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ShardError::ValidationConflict);

    EXPECT_EQ(pending(default_shard), 0);
    EXPECT_EQ(pending(cars_shard), 0);
    EXPECT_EQ(default_shard.root()->child("people"), nullptr);

    // the shard pipeline is free again
    auto const after = client.create_transaction();
    after->write(people, Node::leaf("w"));
    EXPECT_FALSE(three_phase_commit(*after->ready()).has_error());
}

TEST_F(ClientTransactionTest, multi_pre_commit_failure_aborts_participants)
{
    auto const predecessor = client.create_transaction();
    predecessor->write(cars, Node::make());
    auto const predecessor_cohort = predecessor->ready();
    ASSERT_FALSE(predecessor_cohort->can_commit().get().has_error());
    ASSERT_FALSE(predecessor_cohort->pre_commit().get().has_error());

    // validates against the predecessor's /cars
    auto const multi = client.create_transaction();
    multi->write(cars.child("bmw"), Node::leaf("x"));
    multi->write(people, Node::leaf("y"));
    auto const cohort = multi->ready();
    ASSERT_FALSE(cohort->can_commit().get().has_error());

    ASSERT_FALSE(predecessor_cohort->abort().get().has_error());
    auto const res = cohort->pre_commit().get();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ShardError::RebaseFailed);

    EXPECT_EQ(pending(default_shard), 0);
    EXPECT_EQ(pending(cars_shard), 0);
    EXPECT_EQ(default_shard.root()->child("people"), nullptr);
    EXPECT_EQ(cars_shard.root()->child("cars"), nullptr);
}

TEST_F(ClientTransactionTest, concurrent_operations_then_ready)
{
    auto const transaction = client.create_transaction();
    transaction->write(cars, Node::make());
    transaction->write(people, Node::make());

    constexpr int threads = 4;
    constexpr int writes = 50;
    std::vector<std::thread> writers;
    for (int t = 0; t < threads; ++t) {
        writers.emplace_back([&transaction, t] {
            for (int i = 0; i < writes; ++i) {
                auto const name = fmt::format("{}-{}", t, i);
                auto const &parent = (i % 2) ? cars : people;
                transaction->write(parent.child(name), Node::leaf(name));
            }
        });
    }
    for (auto &writer : writers) {
        writer.join();
    }

    auto const cohort = transaction->ready();
    EXPECT_EQ(cohort->participants(), 2);
    ASSERT_FALSE(three_phase_commit(*cohort).has_error());
    EXPECT_EQ(
        cars_shard.root()->child("cars")->children().size() +
            default_shard.root()->child("people")->children().size(),
        static_cast<size_t>(threads * writes));
}

TEST_F(ClientTransactionTest, cohort_abort_releases_shards)
{
    auto const transaction = client.create_transaction();
    transaction->write(cars, Node::leaf("x"));
    transaction->write(people, Node::leaf("y"));
    auto const cohort = transaction->ready();
    ASSERT_FALSE(cohort->can_commit().get().has_error());
    ASSERT_FALSE(cohort->abort().get().has_error());
    EXPECT_EQ(pending(default_shard), 0);
    EXPECT_EQ(pending(cars_shard), 0);
}

TEST_F(ClientTransactionTest, abort_is_idempotent)
{
    auto const transaction = client.create_transaction();
    transaction->write(cars, Node::leaf("x"));
    transaction->abort();
    EXPECT_TRUE(transaction->is_closed());
    EXPECT_EQ(transaction->proxy_count(), 0);
    transaction->abort();
    transaction->local_abort(ShardError::ReplicationFailed);
    EXPECT_TRUE(transaction->is_closed());
}

TEST_F(ClientTransactionTest, local_abort_closes)
{
    auto const transaction = client.create_transaction();
    transaction->write(people, Node::leaf("x"));
    transaction->local_abort(ShardError::ReplicationFailed);
    EXPECT_TRUE(transaction->is_closed());
    transaction->abort();
    EXPECT_EQ(pending(default_shard), 0);
}

TEST_F(ClientTransactionTest, history_ids_are_sequential)
{
    auto const history = client.create_local_history();
    auto const first = history->create_transaction();
    EXPECT_EQ(first->id(), (TransactionId{history->id(), 1}));
    (void)first->ready();
    auto const second = history->create_transaction();
    EXPECT_EQ(second->id(), (TransactionId{history->id(), 2}));
    second->abort();
    auto const third = history->create_transaction();
    EXPECT_EQ(third->id(), (TransactionId{history->id(), 3}));
}

TEST_F(ClientTransactionTest, history_tracks_skipped_transactions)
{
    auto const history = client.create_local_history();
    ASSERT_FALSE(commit_write(*history, cars, "1").has_error());
    // never reaches the cars shard
    ASSERT_FALSE(commit_write(*history, people, "2").has_error());
    ASSERT_FALSE(commit_write(*history, cars, "3").has_error());

    // aborted before it was sealed
    auto const aborted = history->create_transaction();
    aborted->write(cars, Node::leaf("4"));
    aborted->abort();

    ASSERT_FALSE(commit_write(*history, cars, "5").has_error());
    EXPECT_EQ(cars_shard.root()->child("cars")->value(), to_byte_string("5"));
}

TEST_F(ClientTransactionTest, history_close_purges_shards)
{
    auto const history = client.create_local_history();
    ASSERT_FALSE(commit_write(*history, cars, "1").has_error());
    history->close();
    EXPECT_TRUE(history->is_closed());
    history->close();

    boost::fibers::promise<Result<void>> outcome;
    auto future = outcome.get_future();
    auto late = cars_shard.new_read_write_transaction(
        TransactionId{history->id(), 2});
    late.write(cars, Node::leaf("late"));
    ASSERT_TRUE(cars_shard.execute([&](ShardDataTree &tree) {
        auto const cohort = tree.finish_transaction(std::move(late));
        cohort->can_commit(
            [&outcome](Result<void> r) { outcome.set_value(std::move(r)); });
    }));
    auto const res = future.get();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ShardError::HistoryClosed);
}

TEST_F(ClientTransactionTest, pipelined_transactions_of_one_history)
{
    auto const history = client.create_local_history();
    auto const first = history->create_transaction();
    first->write(cars, Node::leaf("1"));
    auto const first_cohort = first->ready();
    auto const second = history->create_transaction();
    second->merge(cars.child("a"), Node::leaf("2"));
    auto const second_cohort = second->ready();

    auto can_commit2 = second_cohort->can_commit();
    ASSERT_FALSE(three_phase_commit(*first_cohort).has_error());
    ASSERT_FALSE(can_commit2.get().has_error());
    ASSERT_FALSE(second_cohort->pre_commit().get().has_error());
    ASSERT_FALSE(second_cohort->commit().get().has_error());
    EXPECT_NE(cars_shard.root()->child("cars")->child("a"), nullptr);
}

TEST_F(ClientTransactionTest, dropped_transaction_aborts)
{
    auto const history = client.create_local_history();
    {
        auto const transaction = history->create_transaction();
        transaction->write(cars, Node::leaf("x"));
    }
    ASSERT_FALSE(commit_write(*history, cars, "y").has_error());
}

using ClientTransactionDeathTest = ClientTransactionTest;

TEST_F(ClientTransactionDeathTest, operation_on_closed_transaction)
{
    auto const transaction = client.create_transaction();
    transaction->abort();
    EXPECT_DEATH(transaction->write(cars, Node::leaf("x")), "is closed");
}

TEST_F(ClientTransactionDeathTest, ready_twice)
{
    auto const transaction = client.create_transaction();
    (void)transaction->ready();
    EXPECT_DEATH((void)transaction->ready(), "is closed");
}

TEST_F(ClientTransactionDeathTest, phase_requested_twice)
{
    auto const transaction = client.create_transaction();
    auto const cohort = transaction->ready();
    ASSERT_FALSE(cohort->can_commit().get().has_error());
    EXPECT_DEATH((void)cohort->can_commit(), "requested twice");
}

TEST_F(ClientTransactionDeathTest, second_open_transaction)
{
    auto const history = client.create_local_history();
    auto const open = history->create_transaction();
    EXPECT_DEATH((void)history->create_transaction(), "open transaction");
}

TEST_F(ClientTransactionDeathTest, ready_after_abort)
{
    auto const transaction = client.create_transaction();
    transaction->write(cars, Node::leaf("x"));
    transaction->abort();
    EXPECT_DEATH((void)transaction->ready(), "is closed");
}
