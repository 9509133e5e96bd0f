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

#include <bankwatch/core/fiber/config.hpp>

#include <boost/fiber/buffered_channel.hpp>
#include <boost/fiber/condition_variable.hpp>
#include <boost/fiber/fiber.hpp>
#include <boost/fiber/future.hpp>
#include <boost/fiber/mutex.hpp>

#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

BANKWATCH_FIBER_NAMESPACE_BEGIN

/// Fixed set of worker threads sharing one ready queue. `n_fibers` fibers pop
/// tasks from a channel and run them to completion, so a long-lived task
/// occupies its fiber until it returns: size `n_fibers` for the number of
/// tasks that must be live at the same time.
class TaskPool final
{
    bool done_{false};

    boost::fibers::mutex mutex_{};
    boost::fibers::condition_variable cv_{};

    std::vector<std::thread> threads_{};

    boost::fibers::buffered_channel<std::function<void()>> channel_{64};

    std::vector<boost::fibers::fiber> fibers_{};

    std::promise<void> start_{};

public:
    TaskPool(unsigned n_threads, unsigned n_fibers);

    TaskPool(TaskPool const &) = delete;
    TaskPool &operator=(TaskPool const &) = delete;

    ~TaskPool();

    void submit(std::function<void()> task)
    {
        channel_.push(std::move(task));
    }

    /// Run `f` on a pool fiber; the future is fiber-aware and may be waited
    /// on from any thread
    template <class F>
    auto spawn(F &&f) -> boost::fibers::future<std::invoke_result_t<F>>
    {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<boost::fibers::packaged_task<R()>>(
            std::forward<F>(f));
        auto future = task->get_future();
        submit([task] { (*task)(); });
        return future;
    }
};

BANKWATCH_FIBER_NAMESPACE_END
