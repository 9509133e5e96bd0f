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

#include <gtest/gtest.h>

#include <bankwatch/banking/block_info.hpp>
#include <bankwatch/banking/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace bankwatch;

namespace
{
    BlockTransaction tx(
        std::string signature, bool const success, uint64_t const consumed,
        uint64_t const requested, uint64_t const fees,
        std::vector<AccountUse> accounts)
    {
        return BlockTransaction{
            .signature = std::move(signature),
            .is_successful = success,
            .cu_consumed = consumed,
            .cu_requested = requested,
            .prioritization_fees = fees,
            .accounts = std::move(accounts)};
    }
}

TEST(BlockInfo, totals)
{
    BlockEvent const block{
        .slot = 100,
        .block_hash = "hash",
        .leader_identity = "leader",
        .transactions = {
            tx("a", true, 100, 1'000, 10, {}),
            tx("b", false, 200, 2'000, 20, {}),
            tx("c", true, 300, 3'000, 30, {})}};

    auto const info = make_block_info(block, 4);
    EXPECT_EQ(info.slot, 100);
    EXPECT_EQ(info.block_hash, "hash");
    EXPECT_EQ(info.leader_identity, "leader");
    EXPECT_EQ(info.processed_transactions, 3);
    EXPECT_EQ(info.successful_transactions, 2);
    EXPECT_EQ(info.banking_stage_errors, 4);
    EXPECT_EQ(info.total_cu_used, 600);
    EXPECT_EQ(info.total_cu_requested, 6'000);
}

TEST(BlockInfo, banking_stage_errors_absent)
{
    BlockEvent const block{.slot = 1};
    auto const info = make_block_info(block, std::nullopt);
    EXPECT_FALSE(info.banking_stage_errors.has_value());
    EXPECT_EQ(info.processed_transactions, 0);
    EXPECT_FALSE(info.supp_infos.has_value());
    EXPECT_TRUE(info.heavily_writelocked_accounts.empty());
    EXPECT_TRUE(info.heavily_readlocked_accounts.empty());
}

TEST(BlockInfo, locked_accounts_are_ranked)
{
    BlockEvent const block{
        .slot = 7,
        .transactions = {
            tx("a", true, 10, 100, 0, {{"hot", true}, {"ro", false}}),
            tx("b", true, 20, 200, 0, {{"hot", true}, {"warm", true}}),
            tx("c", true, 30, 300, 0, {{"hot", true}, {"cold", true}}),
            tx("d", true, 40, 400, 0, {{"warm", true}, {"ro", false}})}};

    auto const info = make_block_info(block, std::nullopt);

    std::vector<AccountLockUsage> const expected_write{
        {.key = "hot", .count = 3, .cu_requested = 600, .cu_consumed = 60},
        {.key = "warm", .count = 2, .cu_requested = 600, .cu_consumed = 60},
        {.key = "cold", .count = 1, .cu_requested = 300, .cu_consumed = 30}};
    EXPECT_EQ(info.heavily_writelocked_accounts, expected_write);

    std::vector<AccountLockUsage> const expected_read{
        {.key = "ro", .count = 2, .cu_requested = 500, .cu_consumed = 50}};
    EXPECT_EQ(info.heavily_readlocked_accounts, expected_read);
}

TEST(BlockInfo, ties_rank_by_key_and_list_is_truncated)
{
    BlockEvent block{.slot = 7};
    for (char c = 'z'; c >= 'a'; --c) {
        std::string const key{c};
        block.transactions.push_back(
            tx("sig" + key, true, 1, 1, 0, {{key, true}}));
    }

    auto const info = make_block_info(block, std::nullopt, 3);
    ASSERT_EQ(info.heavily_writelocked_accounts.size(), 3);
    EXPECT_EQ(info.heavily_writelocked_accounts[0].key, "a");
    EXPECT_EQ(info.heavily_writelocked_accounts[1].key, "b");
    EXPECT_EQ(info.heavily_writelocked_accounts[2].key, "c");

    auto const defaults = make_block_info(block, std::nullopt);
    EXPECT_EQ(
        defaults.heavily_writelocked_accounts.size(),
        DEFAULT_HEAVY_ACCOUNT_LIMIT);
}

TEST(BlockInfo, fee_percentiles)
{
    std::vector<uint64_t> fees;
    for (uint64_t i = 1; i <= 11; ++i) {
        fees.push_back(i * 10);
    }
    // unsorted input
    std::swap(fees.front(), fees.back());

    auto const stats = compute_fee_stats(fees);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(
        *stats,
        (PrioritizationFeeStats{
            .p_min = 10,
            .p_median = 60,
            .p_75 = 80,
            .p_90 = 100,
            .p_max = 110}));

    std::vector<uint64_t> const single{42};
    EXPECT_EQ(
        compute_fee_stats(single),
        (PrioritizationFeeStats{
            .p_min = 42,
            .p_median = 42,
            .p_75 = 42,
            .p_90 = 42,
            .p_max = 42}));

    EXPECT_FALSE(compute_fee_stats({}).has_value());
}
