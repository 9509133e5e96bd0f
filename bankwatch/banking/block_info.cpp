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
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

BANKWATCH_ANONYMOUS_NAMESPACE_BEGIN

using UsageMap = std::unordered_map<std::string, AccountLockUsage>;

void record_lock(
    UsageMap &usage, std::string const &key, BlockTransaction const &tx)
{
    auto &entry = usage[key];
    entry.key = key;
    ++entry.count;
    entry.cu_requested += tx.cu_requested;
    entry.cu_consumed += tx.cu_consumed;
}

std::vector<AccountLockUsage> rank(UsageMap &&usage, size_t const limit)
{
    std::vector<AccountLockUsage> ranked;
    ranked.reserve(usage.size());
    for (auto &[key, entry] : usage) {
        ranked.push_back(std::move(entry));
    }
    std::ranges::sort(
        ranked, [](AccountLockUsage const &a, AccountLockUsage const &b) {
            if (a.count != b.count) {
                return a.count > b.count;
            }
            return a.key < b.key;
        });
    if (ranked.size() > limit) {
        ranked.resize(limit);
    }
    return ranked;
}

BANKWATCH_ANONYMOUS_NAMESPACE_END

BANKWATCH_NAMESPACE_BEGIN

BlockInfo make_block_info(
    BlockEvent const &block, std::optional<uint64_t> const banking_stage_errors,
    size_t const heavy_account_limit)
{
    BlockInfo info{
        .slot = block.slot,
        .block_hash = block.block_hash,
        .leader_identity = block.leader_identity,
        .processed_transactions = block.transactions.size(),
        .banking_stage_errors = banking_stage_errors};

    UsageMap writelocked;
    UsageMap readlocked;
    std::vector<uint64_t> fees;
    fees.reserve(block.transactions.size());

    for (auto const &tx : block.transactions) {
        if (tx.is_successful) {
            ++info.successful_transactions;
        }
        info.total_cu_used += tx.cu_consumed;
        info.total_cu_requested += tx.cu_requested;
        fees.push_back(tx.prioritization_fees);
        for (auto const &account : tx.accounts) {
            record_lock(
                account.writable ? writelocked : readlocked, account.key, tx);
        }
    }

    info.heavily_writelocked_accounts =
        rank(std::move(writelocked), heavy_account_limit);
    info.heavily_readlocked_accounts =
        rank(std::move(readlocked), heavy_account_limit);
    info.supp_infos = compute_fee_stats(fees);
    return info;
}

std::optional<PrioritizationFeeStats>
compute_fee_stats(std::span<uint64_t const> const fees)
{
    if (fees.empty()) {
        return std::nullopt;
    }
    std::vector<uint64_t> sorted{fees.begin(), fees.end()};
    std::ranges::sort(sorted);
    auto const at = [&sorted](size_t const percentile) {
        return sorted[(sorted.size() - 1) * percentile / 100];
    };
    return PrioritizationFeeStats{
        .p_min = sorted.front(),
        .p_median = at(50),
        .p_75 = at(75),
        .p_90 = at(90),
        .p_max = sorted.back()};
}

BANKWATCH_NAMESPACE_END
