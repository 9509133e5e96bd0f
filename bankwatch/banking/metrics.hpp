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

#include <atomic>
#include <cstdint>
#include <string>

BANKWATCH_NAMESPACE_BEGIN

class Counter final
{
    std::atomic<uint64_t> value_{0};

public:
    void inc(uint64_t const n = 1)
    {
        value_.fetch_add(n, std::memory_order_relaxed);
    }

    uint64_t get() const
    {
        return value_.load(std::memory_order_relaxed);
    }
};

class Gauge final
{
    std::atomic<int64_t> value_{0};

public:
    void set(int64_t const value)
    {
        value_.store(value, std::memory_order_relaxed);
    }

    void add(int64_t const n)
    {
        value_.fetch_add(n, std::memory_order_relaxed);
    }

    int64_t get() const
    {
        return value_.load(std::memory_order_relaxed);
    }
};

/// Process-wide pipeline metrics. Created once at startup and passed by
/// reference to every component that updates it; values are never reset.
struct Metrics
{
    Gauge block_arrived{};
    Gauge banking_errors{};
    Gauge txerrors{};
    Counter banking_stage_events{};
    Counter blocks{};

    Counter malformed_events{};
    Counter malformed_transactions{};
    Counter evicted_transactions{};
    Counter persist_failures{};
    Gauge delay_queue_depth{};
    Gauge tracked_transactions{};
    Gauge slot_watermark{};
    Gauge tally_slots{};

    /// Prometheus text exposition format
    std::string to_prometheus() const;
};

BANKWATCH_NAMESPACE_END
