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

#include <boost/fiber/condition_variable.hpp>
#include <boost/fiber/mutex.hpp>

#include <chrono>
#include <mutex>

BANKWATCH_FIBER_NAMESPACE_BEGIN

/// One-shot stop signal that periodic fibers wait on in place of a plain
/// sleep, so a stop request wakes them immediately
class StopLatch final
{
    boost::fibers::mutex mutex_{};
    boost::fibers::condition_variable cv_{};
    bool stopped_{false};

public:
    StopLatch() = default;
    StopLatch(StopLatch const &) = delete;
    StopLatch &operator=(StopLatch const &) = delete;

    void request_stop()
    {
        {
            std::unique_lock<boost::fibers::mutex> const lock{mutex_};
            stopped_ = true;
        }
        cv_.notify_all();
    }

    bool stop_requested()
    {
        std::unique_lock<boost::fibers::mutex> const lock{mutex_};
        return stopped_;
    }

    /// Returns true if stop was requested before `timeout` elapsed
    template <class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep, Period> const &timeout)
    {
        std::unique_lock<boost::fibers::mutex> lock{mutex_};
        return cv_.wait_for(lock, timeout, [this] { return stopped_; });
    }
};

BANKWATCH_FIBER_NAMESPACE_END
