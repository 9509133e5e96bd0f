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

#include <bankwatch/banking/block_info.hpp>
#include <bankwatch/banking/block_processor.hpp>
#include <bankwatch/banking/error_tally.hpp>
#include <bankwatch/banking/fmt/block_info_fmt.hpp>
#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/banking/slot_watermark.hpp>
#include <bankwatch/banking/transaction_index.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/result.hpp>
#include <bankwatch/storage/storage_error.hpp>
#include <bankwatch/storage/storage_sink.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <vector>

BANKWATCH_NAMESPACE_BEGIN

BlockProcessor::BlockProcessor(
    BlockProcessorConfig const &config, TransactionIndex &index,
    ErrorTally &tally, SlotWatermark &watermark, StorageSink &sink,
    Metrics &metrics)
    : config_{config}
    , index_{index}
    , tally_{tally}
    , watermark_{watermark}
    , sink_{sink}
    , metrics_{metrics}
{
}

Result<BlockInfo> BlockProcessor::process(BlockEvent const &block)
{
    size_t merged = 0;
    size_t malformed = 0;
    for (auto const &tx : block.transactions) {
        if (tx.signature.empty()) {
            ++malformed;
            continue;
        }
        if (index_.upsert_inclusion(
                tx.signature, block.slot, tx, config_.inclusion_policy)) {
            ++merged;
        }
    }
    if (malformed > 0) {
        LOG_WARNING(
            "slot {}: {} transactions without signature not merged",
            block.slot,
            malformed);
        metrics_.malformed_transactions.inc(malformed);
    }

    auto const banking_stage_errors = tally_.take(block.slot);
    auto info = make_block_info(
        block, banking_stage_errors, config_.heavy_account_limit);

    metrics_.banking_errors.add(
        static_cast<int64_t>(banking_stage_errors.value_or(0)));
    metrics_.txerrors.add(static_cast<int64_t>(
        info.processed_transactions - info.successful_transactions));

    LOG_DEBUG("processed {} merged={}", info, merged);

    if (auto const res = sink_.save_block(info); res.has_error()) {
        if (is_fatal(res.assume_error())) {
            LOG_ERROR(
                "saving block {} failed fatally: {}",
                info.slot,
                res.assume_error().message().c_str());
            return StorageError::ConnectionLost;
        }
        LOG_ERROR(
            "saving block {} failed: {}",
            info.slot,
            res.assume_error().message().c_str());
        metrics_.persist_failures.inc();
    }

    watermark_.advance(info.slot);
    metrics_.slot_watermark.set(static_cast<int64_t>(watermark_.load()));
    return info;
}

BANKWATCH_NAMESPACE_END
