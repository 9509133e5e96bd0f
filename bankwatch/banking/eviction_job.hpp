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

#include <bankwatch/banking/error_tally.hpp>
#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/banking/slot_watermark.hpp>
#include <bankwatch/banking/transaction_index.hpp>
#include <bankwatch/banking/transaction_info.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/result.hpp>
#include <bankwatch/storage/storage_sink.hpp>

#include <chrono>
#include <cstddef>
#include <vector>

BANKWATCH_NAMESPACE_BEGIN

struct EvictionConfig
{
    std::chrono::milliseconds period{std::chrono::seconds{60}};
    Slot lag_window{300};
    size_t batch_size{8};
};

struct EvictionReport
{
    size_t evicted{0};
    size_t batches{0};
    size_t failed_batches{0};
    size_t purged_slots{0};
};

/// Moves entries that fell out of the lag window out of the index and into
/// storage, `batch_size` rows per call. Evicted entries are never
/// re-inserted, whether or not their batch was stored. Each tick also drops
/// error counts for slots that fell out of the window.
class EvictionJob final
{
    EvictionConfig config_;
    TransactionIndex &index_;
    ErrorTally &tally_;
    SlotWatermark const &watermark_;
    StorageSink &sink_;
    Metrics &metrics_;

    Result<EvictionReport> persist(std::vector<TransactionInfo> const &);

public:
    EvictionJob(
        EvictionConfig const &, TransactionIndex &, ErrorTally &,
        SlotWatermark const &, StorageSink &, Metrics &);

    EvictionConfig const &config() const
    {
        return config_;
    }

    /// One tick against the current watermark
    Result<EvictionReport> run_once();

    /// Evicts and persists every remaining entry
    Result<EvictionReport> flush_all();
};

BANKWATCH_NAMESPACE_END
