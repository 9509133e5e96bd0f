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
#include <bankwatch/banking/transaction_info.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/result.hpp>
#include <bankwatch/storage/storage_error.hpp>
#include <bankwatch/storage/storage_sink.hpp>

#include <boost/fiber/mutex.hpp>

#include <cstddef>
#include <deque>
#include <mutex>
#include <span>
#include <vector>

BANKWATCH_NAMESPACE_BEGIN

namespace test
{
    /// In-memory sink that keeps every stored batch and block. Queued
    /// failures are returned, in order, by the next calls.
    class RecordingSink final : public StorageSink
    {
        boost::fibers::mutex mutex_;
        std::vector<std::vector<TransactionInfo>> batches_;
        std::vector<BlockInfo> blocks_;
        std::deque<StorageError> transaction_failures_;
        std::deque<StorageError> block_failures_;
        size_t transaction_calls_{0};

    public:
        Result<void>
        save_transactions(std::span<TransactionInfo const> txs) override
        {
            std::unique_lock const lock{mutex_};
            ++transaction_calls_;
            if (!transaction_failures_.empty()) {
                auto error = transaction_failures_.front();
                transaction_failures_.pop_front();
                return error;
            }
            batches_.emplace_back(txs.begin(), txs.end());
            return outcome::success();
        }

        Result<void> save_block(BlockInfo const &block) override
        {
            std::unique_lock const lock{mutex_};
            if (!block_failures_.empty()) {
                auto error = block_failures_.front();
                block_failures_.pop_front();
                return error;
            }
            blocks_.push_back(block);
            return outcome::success();
        }

        void fail_transactions(StorageError const error)
        {
            std::unique_lock const lock{mutex_};
            transaction_failures_.push_back(error);
        }

        void fail_block(StorageError const error)
        {
            std::unique_lock const lock{mutex_};
            block_failures_.push_back(error);
        }

        std::vector<std::vector<TransactionInfo>> batches()
        {
            std::unique_lock const lock{mutex_};
            return batches_;
        }

        std::vector<TransactionInfo> transactions()
        {
            std::unique_lock const lock{mutex_};
            std::vector<TransactionInfo> all;
            for (auto const &batch : batches_) {
                all.insert(all.end(), batch.begin(), batch.end());
            }
            return all;
        }

        std::vector<BlockInfo> blocks()
        {
            std::unique_lock const lock{mutex_};
            return blocks_;
        }

        size_t transaction_calls()
        {
            std::unique_lock const lock{mutex_};
            return transaction_calls_;
        }
    };
}

BANKWATCH_NAMESPACE_END
