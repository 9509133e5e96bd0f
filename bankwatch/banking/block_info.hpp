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

#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

BANKWATCH_NAMESPACE_BEGIN

/// Aggregate over the transactions of one block that lock `key`
struct AccountLockUsage
{
    std::string key{};
    uint64_t count{0};
    uint64_t cu_requested{0};
    uint64_t cu_consumed{0};

    friend bool
    operator==(AccountLockUsage const &, AccountLockUsage const &) = default;
};

struct PrioritizationFeeStats
{
    uint64_t p_min{0};
    uint64_t p_median{0};
    uint64_t p_75{0};
    uint64_t p_90{0};
    uint64_t p_max{0};

    friend bool operator==(
        PrioritizationFeeStats const &,
        PrioritizationFeeStats const &) = default;
};

struct BlockInfo
{
    Slot slot{0};
    std::string block_hash{};
    std::string leader_identity{};
    uint64_t processed_transactions{0};
    uint64_t successful_transactions{0};
    std::optional<uint64_t> banking_stage_errors{};
    uint64_t total_cu_used{0};
    uint64_t total_cu_requested{0};
    std::vector<AccountLockUsage> heavily_writelocked_accounts{};
    std::vector<AccountLockUsage> heavily_readlocked_accounts{};
    std::optional<PrioritizationFeeStats> supp_infos{};
};

constexpr size_t DEFAULT_HEAVY_ACCOUNT_LIMIT = 10;

BlockInfo make_block_info(
    BlockEvent const &, std::optional<uint64_t> banking_stage_errors,
    size_t heavy_account_limit = DEFAULT_HEAVY_ACCOUNT_LIMIT);

/// Nearest-rank percentiles; nullopt for an empty input
std::optional<PrioritizationFeeStats>
    compute_fee_stats(std::span<uint64_t const> fees);

BANKWATCH_NAMESPACE_END
