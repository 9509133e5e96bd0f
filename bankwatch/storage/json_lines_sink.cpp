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
#include <bankwatch/banking/transaction_info.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/result.hpp>
#include <bankwatch/storage/json_lines_sink.hpp>
#include <bankwatch/storage/records.hpp>
#include <bankwatch/storage/storage_error.hpp>

#include <boost/fiber/mutex.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <mutex>
#include <ostream>
#include <span>
#include <string>

BANKWATCH_ANONYMOUS_NAMESPACE_BEGIN

std::string to_line(nlohmann::json const &j)
{
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) +
           '\n';
}

BANKWATCH_ANONYMOUS_NAMESPACE_END

BANKWATCH_NAMESPACE_BEGIN

JsonLinesSink::JsonLinesSink(std::ostream &out)
    : out_{out}
{
}

Result<void>
JsonLinesSink::save_transactions(std::span<TransactionInfo const> const txs)
{
    std::string lines;
    for (auto const &tx : txs) {
        lines += to_line(to_json(to_record(tx)));
    }

    std::unique_lock const lock{mutex_};
    out_ << lines << std::flush;
    if (!out_) {
        LOG_ERROR("writing {} transaction records failed", txs.size());
        return StorageError::WriteFailed;
    }
    return outcome::success();
}

Result<void> JsonLinesSink::save_block(BlockInfo const &block)
{
    auto const line = to_line(to_json(to_record(block)));

    std::unique_lock const lock{mutex_};
    out_ << line << std::flush;
    if (!out_) {
        LOG_ERROR("writing block record for slot {} failed", block.slot);
        return StorageError::WriteFailed;
    }
    return outcome::success();
}

BANKWATCH_NAMESPACE_END
