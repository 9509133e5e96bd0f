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

#include <bankwatch/banking/event/event_source.hpp>
#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/banking/pipeline.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/fiber/task_pool.hpp>
#include <bankwatch/core/result.hpp>
#include <bankwatch/storage/storage_error.hpp>
#include <bankwatch/storage/storage_sink.hpp>

#include <boost/fiber/channel_op_status.hpp>
#include <boost/fiber/mutex.hpp>
#include <quill/Quill.h>

#include <csignal>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <variant>

#include <pthread.h>

BANKWATCH_NAMESPACE_BEGIN

Pipeline::Pipeline(
    PipelineConfig const &config, StorageSink &sink, Metrics &metrics)
    : config_{config}
    , sink_{sink}
    , metrics_{metrics}
    , delay_queue_{config.block_hold, config.delay_queue_capacity}
    , notification_handler_{index_, tally_, metrics}
    , block_processor_{
          config.block_processor, index_, tally_, watermark_, sink, metrics}
    , eviction_job_{
          config.eviction, index_, tally_, watermark_, sink, metrics}
{
}

void Pipeline::latch_fatal(StorageError const error)
{
    {
        std::unique_lock<boost::fibers::mutex> const lock{fatal_mutex_};
        if (!fatal_.has_value()) {
            fatal_ = error;
        }
    }
    stop_.request_stop();
    events_.close();
    delay_queue_.close();
}

std::optional<StorageError> Pipeline::fatal_error()
{
    std::unique_lock<boost::fibers::mutex> const lock{fatal_mutex_};
    return fatal_;
}

void Pipeline::on_event(Event event)
{
    if (auto const *const notification =
            std::get_if<TransactionNotification>(&event)) {
        notification_handler_.on_notification(*notification);
        return;
    }

    auto &block = std::get<BlockEvent>(event);
    auto const slot = block.slot;
    metrics_.block_arrived.set(
        static_cast<int64_t>(block.transactions.size()));
    metrics_.blocks.inc();
    if (!delay_queue_.push(std::move(block))) {
        LOG_WARNING("dropping block {} received during shutdown", slot);
    }
    metrics_.delay_queue_depth.set(
        static_cast<int64_t>(delay_queue_.size()));
}

void Pipeline::read_events(
    EventSource &source, sig_atomic_t const volatile &stop)
{
    pthread_setname_np(pthread_self(), "event reader");
    uint64_t events = 0;
    while (!stop && !stop_.stop_requested()) {
        auto res = source.next();
        if (res.has_error()) {
            LOG_DEBUG(
                "skipping malformed event: {}",
                res.assume_error().message().c_str());
            metrics_.malformed_events.inc();
            continue;
        }
        auto &event = res.assume_value();
        if (!event.has_value()) {
            LOG_INFO("event stream ended after {} events", events);
            events_.close();
            return;
        }
        ++events;
        if (events_.push(std::move(*event)) !=
            boost::fibers::channel_op_status::success) {
            break;
        }
    }
    LOG_INFO("ingestion stopped after {} events", events);
    events_.close();
}

void Pipeline::ingest()
{
    Event event;
    while (events_.pop(event) == boost::fibers::channel_op_status::success) {
        on_event(std::move(event));
    }
}

void Pipeline::process_blocks()
{
    while (auto block = delay_queue_.pop()) {
        metrics_.delay_queue_depth.set(
            static_cast<int64_t>(delay_queue_.size()));
        if (fatal_error().has_value()) {
            return;
        }
        auto const res = block_processor_.process(*block);
        if (res.has_error()) {
            latch_fatal(StorageError::ConnectionLost);
            return;
        }
    }
}

void Pipeline::evict_periodically()
{
    while (!stop_.wait_for(config_.eviction.period)) {
        if (eviction_job_.run_once().has_error()) {
            latch_fatal(StorageError::ConnectionLost);
            return;
        }
    }
}

Result<void> Pipeline::run(
    EventSource &source, fiber::TaskPool &pool,
    sig_atomic_t const volatile &stop)
{
    LOG_INFO(
        "starting pipeline: block_hold={}ms eviction_period={}ms "
        "lag_window={} batch_size={}",
        config_.block_hold.count(),
        config_.eviction.period.count(),
        config_.eviction.lag_window,
        config_.eviction.batch_size);

    auto block_processing = pool.spawn([this] { process_blocks(); });
    auto eviction = pool.spawn([this] { evict_periodically(); });
    auto ingestion = pool.spawn([this] { ingest(); });
    std::thread reader{
        [this, &source, &stop] { read_events(source, stop); }};

    ingestion.get();
    reader.join();
    LOG_INFO("draining {} queued blocks", delay_queue_.size());
    delay_queue_.close();
    block_processing.get();
    stop_.request_stop();
    eviction.get();

    if (auto const fatal = fatal_error(); fatal.has_value()) {
        LOG_ERROR(
            "storage failed fatally, {} tracked transactions were not "
            "persisted",
            index_.size());
        return *fatal;
    }

    BOOST_OUTCOME_TRY(auto const flushed, eviction_job_.flush_all());
    LOG_INFO(
        "pipeline drained, {} transactions flushed at shutdown",
        flushed.evicted);
    return outcome::success();
}

BANKWATCH_NAMESPACE_END
