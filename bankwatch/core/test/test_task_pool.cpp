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

#include <gtest/gtest.h>

#include <bankwatch/core/fiber/stop_latch.hpp>
#include <bankwatch/core/fiber/task_pool.hpp>

#include <boost/fiber/future.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace bankwatch;
using namespace std::chrono_literals;

TEST(TaskPool, spawn_returns_value)
{
    fiber::TaskPool pool{2, 4};
    auto future = pool.spawn([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(TaskPool, runs_every_submitted_task)
{
    std::atomic<unsigned> count{0};
    {
        fiber::TaskPool pool{4, 16};
        for (unsigned i = 0; i < 10'000; ++i) {
            pool.submit([&count] { count.fetch_add(1); });
        }
    }
    EXPECT_EQ(count.load(), 10'000u);
}

TEST(TaskPool, long_lived_tasks_run_concurrently)
{
    fiber::TaskPool pool{2, 4};
    fiber::StopLatch latch;

    // the waiter can only finish if the stopper runs beside it
    auto waiter = pool.spawn([&latch] { return latch.wait_for(10s); });
    auto stopper = pool.spawn([&latch] { latch.request_stop(); });

    stopper.get();
    EXPECT_TRUE(waiter.get());
}

TEST(StopLatch, wait_times_out)
{
    fiber::StopLatch latch;
    auto const begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(latch.wait_for(50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - begin, 50ms);
    EXPECT_FALSE(latch.stop_requested());
}

TEST(StopLatch, stop_wakes_waiter)
{
    fiber::StopLatch latch;
    std::thread stopper{[&latch] {
        std::this_thread::sleep_for(20ms);
        latch.request_stop();
    }};
    auto const begin = std::chrono::steady_clock::now();
    EXPECT_TRUE(latch.wait_for(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    stopper.join();

    EXPECT_TRUE(latch.stop_requested());
    EXPECT_TRUE(latch.wait_for(10s));
}
