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

#include <arbor/fiber/config.hpp>

#include <boost/fiber/buffered_channel.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <thread>

ARBOR_FIBER_NAMESPACE_BEGIN

// Runs submitted tasks one at a time, in submission order, on a dedicated
// worker thread. Tasks submitted from the worker itself never block: they
// are queued locally and run after the current task, ahead of the channel.
class SerialExecutor final
{
public:
    using Task = std::function<void()>;

private:
    boost::fibers::buffered_channel<Task> tasks_;
    std::deque<Task> local_;
    std::atomic<std::thread::id> worker_id_;
    std::thread worker_;

    void run();

public:
    // capacity must be a power of two
    explicit SerialExecutor(std::string name, size_t capacity = 1024);
    ~SerialExecutor();

    SerialExecutor(SerialExecutor const &) = delete;
    SerialExecutor(SerialExecutor &&) = delete;
    SerialExecutor &operator=(SerialExecutor const &) = delete;
    SerialExecutor &operator=(SerialExecutor &&) = delete;

    // false once the executor has been shut down
    bool submit(Task);

    bool in_worker() const noexcept;

    // Stops accepting tasks, drains what is queued and joins the worker
    void shutdown();
};

ARBOR_FIBER_NAMESPACE_END
