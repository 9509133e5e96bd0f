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

#include <bankwatch/banking/error_tally.hpp>
#include <bankwatch/banking/eviction_job.hpp>
#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/banking/slot_watermark.hpp>
#include <bankwatch/banking/transaction_index.hpp>
#include <bankwatch/banking/transaction_info.hpp>
#include <bankwatch/core/assert.h>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/result.hpp>
#include <bankwatch/storage/storage_error.hpp>
#include <bankwatch/storage/storage_sink.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

BANKWATCH_NAMESPACE_BEGIN

EvictionJob::EvictionJob(
    EvictionConfig const &config, TransactionIndex &index, ErrorTally &tally,
    SlotWatermark const &watermark, StorageSink &sink, Metrics &metrics)
    : config_{config}
    , index_{index}
    , tally_{tally}
    , watermark_{watermark}
    , sink_{sink}
    , metrics_{metrics}
{
    BANKWATCH_ASSERT(config_.batch_size > 0);
}

Result<EvictionReport>
EvictionJob::persist(std::vector<TransactionInfo> const &evicted)
{
    EvictionReport report{.evicted = evicted.size()};
    metrics_.evicted_transactions.inc(evicted.size());

    std::span<TransactionInfo const> remaining{evicted};
    while (!remaining.empty()) {
        auto const n = std::min(config_.batch_size, remaining.size());
        auto const batch = remaining.first(n);
        remaining = remaining.subspan(n);
        ++report.batches;

        auto const res = sink_.save_transactions(batch);
        if (!res.has_error()) {
            continue;
        }
        if (is_fatal(res.assume_error())) {
            LOG_ERROR(
                "saving transactions failed fatally after {} batches: {}",
                report.batches - 1,
                res.assume_error().message().c_str());
            return StorageError::ConnectionLost;
        }
        LOG_ERROR(
            "saving batch of {} transactions failed: {}",
            batch.size(),
            res.assume_error().message().c_str());
        ++report.failed_batches;
        metrics_.persist_failures.inc();
    }

    metrics_.tracked_transactions.set(static_cast<int64_t>(index_.size()));
    return report;
}

Result<EvictionReport> EvictionJob::run_once()
{
    auto const watermark = watermark_.load();
    auto const evicted = index_.evict(watermark, config_.lag_window);
    BOOST_OUTCOME_TRY(auto report, persist(evicted));
    if (watermark > config_.lag_window) {
        report.purged_slots =
            tally_.purge_through(watermark - config_.lag_window);
    }
    metrics_.tally_slots.set(static_cast<int64_t>(tally_.size()));
    LOG_INFO(
        "eviction at watermark {}: evicted={} batches={} failed={} "
        "purged_slots={}",
        watermark,
        report.evicted,
        report.batches,
        report.failed_batches,
        report.purged_slots);
    return report;
}

Result<EvictionReport> EvictionJob::flush_all()
{
    auto const drained = index_.drain();
    BOOST_OUTCOME_TRY(auto const report, persist(drained));
    LOG_INFO(
        "flushed {} transactions in {} batches, {} failed",
        report.evicted,
        report.batches,
        report.failed_batches);
    return report;
}

BANKWATCH_NAMESPACE_END
