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

#include <bankwatch/core/config.hpp>

#include <boost/fiber/condition_variable.hpp>
#include <boost/fiber/mutex.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

BANKWATCH_NAMESPACE_BEGIN

/// Hands items to a consumer no earlier than a fixed hold after they were
/// pushed. Ordered by release time, then by push order, so items pushed with
/// non-decreasing arrival times come out FIFO. Waits are fiber-aware.
///
/// A non-zero capacity makes `push` wait for room. After `close`, pending
/// items are handed out without waiting and `pop` returns nullopt once empty.
template <class T>
class DelayQueue final
{
public:
    using clock = std::chrono::steady_clock;

private:
    struct Item
    {
        clock::time_point release;
        uint64_t seq;
        T value;
    };

    // max-heap comparator that puts the earliest release on top
    static bool later(Item const &a, Item const &b)
    {
        if (a.release != b.release) {
            return a.release > b.release;
        }
        return a.seq > b.seq;
    }

    boost::fibers::mutex mutex_{};
    boost::fibers::condition_variable cv_{};
    std::vector<Item> heap_{};
    clock::duration const hold_;
    size_t const capacity_;
    uint64_t next_seq_{0};
    bool closed_{false};

public:
    explicit DelayQueue(clock::duration const hold, size_t const capacity = 0)
        : hold_{hold}
        , capacity_{capacity}
    {
    }

    DelayQueue(DelayQueue const &) = delete;
    DelayQueue &operator=(DelayQueue const &) = delete;

    clock::duration hold() const
    {
        return hold_;
    }

    bool push(T value)
    {
        return push(std::move(value), clock::now());
    }

    /// Returns false if the queue was closed
    bool push(T value, clock::time_point const arrival)
    {
        {
            std::unique_lock<boost::fibers::mutex> lock{mutex_};
            cv_.wait(lock, [this] {
                return closed_ || capacity_ == 0 || heap_.size() < capacity_;
            });
            if (closed_) {
                return false;
            }
            heap_.push_back(Item{
                .release = arrival + hold_,
                .seq = next_seq_++,
                .value = std::move(value)});
            std::ranges::push_heap(heap_, later);
        }
        cv_.notify_all();
        return true;
    }

    std::optional<T> pop()
    {
        std::unique_lock<boost::fibers::mutex> lock{mutex_};
        for (;;) {
            if (heap_.empty()) {
                if (closed_) {
                    return std::nullopt;
                }
                cv_.wait(lock);
                continue;
            }
            auto const release = heap_.front().release;
            if (closed_ || clock::now() >= release) {
                break;
            }
            cv_.wait_until(lock, release);
        }
        std::ranges::pop_heap(heap_, later);
        std::optional<T> value{std::move(heap_.back().value)};
        heap_.pop_back();
        lock.unlock();
        cv_.notify_all();
        return value;
    }

    void close()
    {
        {
            std::unique_lock<boost::fibers::mutex> const lock{mutex_};
            closed_ = true;
        }
        cv_.notify_all();
    }

    size_t size()
    {
        std::unique_lock<boost::fibers::mutex> const lock{mutex_};
        return heap_.size();
    }
};

BANKWATCH_NAMESPACE_END
