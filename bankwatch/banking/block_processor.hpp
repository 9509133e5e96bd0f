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

#include <bankwatch/banking/block_info.hpp>
#include <bankwatch/banking/error_tally.hpp>
#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/banking/slot_watermark.hpp>
#include <bankwatch/banking/transaction_index.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/result.hpp>
#include <bankwatch/storage/storage_sink.hpp>

#include <cstddef>

BANKWATCH_NAMESPACE_BEGIN

struct BlockProcessorConfig
{
    size_t heavy_account_limit{DEFAULT_HEAVY_ACCOUNT_LIMIT};
    InclusionPolicy inclusion_policy{InclusionPolicy::TrackedOnly};
};

/// Consumes released blocks: merges their transactions into the index,
/// collects the slot's banking-stage error count, persists the derived
/// BlockInfo and advances the slot watermark
class BlockProcessor final
{
    BlockProcessorConfig config_;
    TransactionIndex &index_;
    ErrorTally &tally_;
    SlotWatermark &watermark_;
    StorageSink &sink_;
    Metrics &metrics_;

public:
    BlockProcessor(
        BlockProcessorConfig const &, TransactionIndex &, ErrorTally &,
        SlotWatermark &, StorageSink &, Metrics &);

    /// Fails only on a fatal storage error; any other persistence failure is
    /// logged and counted, and the block is not retried
    Result<BlockInfo> process(BlockEvent const &);
};

BANKWATCH_NAMESPACE_END
