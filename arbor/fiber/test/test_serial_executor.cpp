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

#include <arbor/fiber/serial_executor.hpp>

#include <boost/fiber/future.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace arbor::fiber;

TEST(SerialExecutor, runs_in_submission_order)
{
    std::vector<int> order;
    {
        SerialExecutor executor{"test", 16};
        for (int i = 0; i < 100; ++i) {
            EXPECT_TRUE(executor.submit([&order, i] { order.push_back(i); }));
        }
    }
    ASSERT_EQ(order.size(), 100);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(order[static_cast<size_t>(i)], i);
    }
}

TEST(SerialExecutor, nested_submit_runs_after_current_task)
{
    SerialExecutor executor{"test"};
    std::vector<int> order;
    boost::fibers::promise<void> done;
    auto future = done.get_future();
    EXPECT_TRUE(executor.submit([&] {
        EXPECT_TRUE(executor.in_worker());
        EXPECT_TRUE(executor.submit([&] {
            order.push_back(2);
            done.set_value();
        }));
        order.push_back(1);
    }));
    future.get();
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_FALSE(executor.in_worker());
}

TEST(SerialExecutor, single_worker_thread)
{
    SerialExecutor executor{"test"};
    std::atomic<int> running{0};
    std::atomic<bool> overlapped{false};
    std::vector<std::thread> submitters;
    for (int t = 0; t < 4; ++t) {
        submitters.emplace_back([&] {
            for (int i = 0; i < 250; ++i) {
                EXPECT_TRUE(executor.submit([&] {
                    if (running.fetch_add(1) != 0) {
                        overlapped = true;
                    }
                    running.fetch_sub(1);
                }));
            }
        });
    }
    for (auto &t : submitters) {
        t.join();
    }
    executor.shutdown();
    EXPECT_FALSE(overlapped);
}

TEST(SerialExecutor, shutdown_drains_then_rejects)
{
    SerialExecutor executor{"test"};
    std::atomic<int> count{0};
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(executor.submit([&count] { ++count; }));
    }
    executor.shutdown();
    EXPECT_EQ(count, 10);
    EXPECT_FALSE(executor.submit([&count] { ++count; }));
    executor.shutdown();
    EXPECT_EQ(count, 10);
}
