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
#include <arbor/core/likely.h>
#include <arbor/fiber/config.hpp>
#include <arbor/fiber/serial_executor.hpp>

#include <boost/fiber/channel_op_status.hpp>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <pthread.h>

#include <cstddef>
#include <string>
#include <thread>
#include <utility>

ARBOR_FIBER_NAMESPACE_BEGIN

SerialExecutor::SerialExecutor(std::string name, size_t const capacity)
    : tasks_{capacity}
    , worker_id_{}
    , worker_{[this, name = std::move(name)] {
        // linux limits thread names to 15 characters
        pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
        run();
    }}
{
}

SerialExecutor::~SerialExecutor()
{
    shutdown();
}

void SerialExecutor::run()
{
    worker_id_.store(std::this_thread::get_id(), std::memory_order_release);
    Task task;
    while (tasks_.pop(task) == boost::fibers::channel_op_status::success) {
        task();
        while (!local_.empty()) {
            task = std::move(local_.front());
            local_.pop_front();
            task();
        }
        task = nullptr;
    }
}

bool SerialExecutor::submit(Task task)
{
    ARBOR_ASSERT(task);
    if (in_worker()) {
        local_.push_back(std::move(task));
        return true;
    }
    auto const status = tasks_.push(std::move(task));
    if (ARBOR_UNLIKELY(status != boost::fibers::channel_op_status::success)) {
        LOG_WARNING("task submitted to a closed executor was dropped");
        return false;
    }
    return true;
}

bool SerialExecutor::in_worker() const noexcept
{
    return worker_id_.load(std::memory_order_acquire) ==
           std::this_thread::get_id();
}

void SerialExecutor::shutdown()
{
    ARBOR_ASSERT(!in_worker());
    tasks_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

ARBOR_FIBER_NAMESPACE_END
