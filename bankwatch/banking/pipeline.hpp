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

#include <bankwatch/banking/block_processor.hpp>
#include <bankwatch/banking/delay_queue.hpp>
#include <bankwatch/banking/error_tally.hpp>
#include <bankwatch/banking/event/event_source.hpp>
#include <bankwatch/banking/eviction_job.hpp>
#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/banking/notification_handler.hpp>
#include <bankwatch/banking/slot_watermark.hpp>
#include <bankwatch/banking/transaction_index.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/fiber/stop_latch.hpp>
#include <bankwatch/core/fiber/task_pool.hpp>
#include <bankwatch/core/result.hpp>
#include <bankwatch/storage/storage_error.hpp>
#include <bankwatch/storage/storage_sink.hpp>

#include <boost/fiber/buffered_channel.hpp>
#include <boost/fiber/mutex.hpp>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <optional>

BANKWATCH_NAMESPACE_BEGIN

struct PipelineConfig
{
    std::chrono::milliseconds block_hold{std::chrono::seconds{30}};
    size_t delay_queue_capacity{0};
    BlockProcessorConfig block_processor{};
    EvictionConfig eviction{};
};

/// Owns the correlation state and runs the three long-lived tasks: ingest,
/// block processing behind the delay queue, and periodic eviction. The event
/// source is read on a dedicated thread, since reads may block the calling
/// thread, and decoded events reach the ingest fiber through a channel.
///
/// Shutdown order: ingest stops, the delay queue is closed and its remaining
/// blocks processed, the eviction task stops, then every tracked entry is
/// flushed to the sink. A fatal storage error stops all three tasks and the
/// flush is skipped.
class Pipeline final
{
    static constexpr size_t EVENT_CHANNEL_CAPACITY = 1024;

    PipelineConfig config_;
    StorageSink &sink_;
    Metrics &metrics_;

    TransactionIndex index_{};
    ErrorTally tally_{};
    SlotWatermark watermark_{};
    DelayQueue<BlockEvent> delay_queue_;
    boost::fibers::buffered_channel<Event> events_{EVENT_CHANNEL_CAPACITY};
    NotificationHandler notification_handler_;
    BlockProcessor block_processor_;
    EvictionJob eviction_job_;

    fiber::StopLatch stop_{};
    boost::fibers::mutex fatal_mutex_{};
    std::optional<StorageError> fatal_{};

    void latch_fatal(StorageError);
    void read_events(EventSource &, sig_atomic_t const volatile &stop);
    void ingest();
    void process_blocks();
    void evict_periodically();

public:
    Pipeline(PipelineConfig const &, StorageSink &, Metrics &);

    Pipeline(Pipeline const &) = delete;
    Pipeline &operator=(Pipeline const &) = delete;

    /// Routes one decoded event; blocks are stamped and queued
    void on_event(Event);

    /// Runs until the source ends, `stop` is set or storage fails fatally,
    /// then drains. Returns the fatal storage error, if any.
    Result<void>
    run(EventSource &, fiber::TaskPool &, sig_atomic_t const volatile &stop);

    /// Stops ingestion at the next event
    void request_stop()
    {
        stop_.request_stop();
    }

    std::optional<StorageError> fatal_error();

    TransactionIndex &index()
    {
        return index_;
    }

    ErrorTally &tally()
    {
        return tally_;
    }

    SlotWatermark const &watermark() const
    {
        return watermark_;
    }

    DelayQueue<BlockEvent> &delay_queue()
    {
        return delay_queue_;
    }

    BlockProcessor &block_processor()
    {
        return block_processor_;
    }

    EvictionJob &eviction_job()
    {
        return eviction_job_;
    }
};

BANKWATCH_NAMESPACE_END
