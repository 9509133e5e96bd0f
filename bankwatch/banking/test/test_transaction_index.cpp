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

#include <bankwatch/banking/transaction_index.hpp>
#include <bankwatch/banking/transaction_info.hpp>
#include <bankwatch/banking/types.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace bankwatch;

namespace
{
    BlockTransaction make_tx(std::string signature)
    {
        return BlockTransaction{
            .signature = std::move(signature),
            .is_successful = true,
            .cu_consumed = 1'200,
            .cu_requested = 200'000,
            .prioritization_fees = 5'000,
            .accounts = {{"acc1", true}, {"acc2", false}}};
    }

    std::vector<std::string>
    signatures_of(std::vector<TransactionInfo> const &infos)
    {
        std::vector<std::string> res;
        for (auto const &info : infos) {
            res.push_back(info.signature);
        }
        std::ranges::sort(res);
        return res;
    }
}

TEST(TransactionIndex, first_notification_creates_entry)
{
    TransactionIndex index;
    index.upsert_notification("sig", 100, "AccountInUse");

    auto const info = index.get("sig");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->signature, "sig");
    EXPECT_EQ(info->first_notification_slot, 100);
    ASSERT_EQ(info->errors.size(), 1);
    TransactionErrorKey const key{.error = "AccountInUse", .slot = 100};
    EXPECT_EQ(info->errors.at(key), 1);
    EXPECT_FALSE(info->is_executed);
    EXPECT_FALSE(info->is_confirmed);
    EXPECT_FALSE(info->processed_slot.has_value());
    EXPECT_EQ(index.size(), 1);
}

TEST(TransactionIndex, repeated_notifications_accumulate)
{
    TransactionIndex index;
    index.upsert_notification("sig", 100, "AccountInUse");
    index.upsert_notification("sig", 100, "AccountInUse");
    index.upsert_notification("sig", 101, "AccountInUse");
    index.upsert_notification("sig", 101, "WouldExceedMaxBlockCostLimit");

    auto const info = index.get("sig");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->errors.size(), 3);
    EXPECT_EQ(info->errors.at({"AccountInUse", 100}), 2);
    EXPECT_EQ(info->errors.at({"AccountInUse", 101}), 1);
    EXPECT_EQ(info->errors.at({"WouldExceedMaxBlockCostLimit", 101}), 1);
    EXPECT_EQ(info->error_count(), 4);
    EXPECT_EQ(index.size(), 1);
}

TEST(TransactionIndex, first_notification_slot_never_changes)
{
    TransactionIndex index;
    index.upsert_notification("sig", 100, "AccountInUse");
    index.upsert_notification("sig", 90, "AccountInUse");
    index.upsert_notification("sig", 120, "AccountInUse");
    ASSERT_TRUE(index.upsert_inclusion("sig", 130, make_tx("sig")));

    EXPECT_EQ(index.get("sig")->first_notification_slot, 100);
}

TEST(TransactionIndex, inclusion_keeps_errors)
{
    TransactionIndex index;
    index.upsert_notification("sig", 100, "AccountInUse");
    EXPECT_TRUE(index.upsert_inclusion(
        "sig", 102, make_tx("sig"), InclusionPolicy::TrackedOnly));

    auto const info = index.get("sig");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->error_count(), 1);
    EXPECT_TRUE(info->is_executed);
    EXPECT_TRUE(info->is_confirmed);
    EXPECT_EQ(info->processed_slot, 102);
    EXPECT_EQ(info->cu_requested, 200'000);
    EXPECT_EQ(info->prioritization_fees, 5'000);
    EXPECT_EQ(info->accounts_used.size(), 2);
    EXPECT_TRUE(info->accounts_used.at("acc1"));
    EXPECT_FALSE(info->accounts_used.at("acc2"));
}

TEST(TransactionIndex, inclusion_policy)
{
    TransactionIndex index;

    EXPECT_FALSE(index.upsert_inclusion(
        "untracked", 50, make_tx("untracked"), InclusionPolicy::TrackedOnly));
    EXPECT_FALSE(index.get("untracked").has_value());
    EXPECT_EQ(index.size(), 0);

    EXPECT_TRUE(index.upsert_inclusion(
        "untracked",
        50,
        make_tx("untracked"),
        InclusionPolicy::CreateIfAbsent));
    auto const info = index.get("untracked");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->first_notification_slot, 50);
    EXPECT_TRUE(info->errors.empty());
    EXPECT_TRUE(info->is_executed);
}

TEST(TransactionIndex, concurrent_notifications_are_all_counted)
{
    constexpr size_t THREADS = 8;
    constexpr size_t PER_THREAD = 2'000;
    constexpr size_t SIGNATURES = 16;

    TransactionIndex index;
    std::vector<std::thread> threads;
    for (size_t t = 0; t < THREADS; ++t) {
        threads.emplace_back([&index, t] {
            for (size_t i = 0; i < PER_THREAD; ++i) {
                auto const sig = "sig" + std::to_string((i + t) % SIGNATURES);
                index.upsert_notification(sig, 7, "AccountInUse");
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(index.size(), SIGNATURES);
    uint64_t total = 0;
    for (size_t s = 0; s < SIGNATURES; ++s) {
        auto const info = index.get("sig" + std::to_string(s));
        ASSERT_TRUE(info.has_value());
        EXPECT_EQ(info->errors.size(), 1);
        total += info->error_count();
    }
    EXPECT_EQ(total, THREADS * PER_THREAD);
}

TEST(TransactionIndex, concurrent_notifications_and_inclusions_merge)
{
    constexpr size_t NOTIFIERS = 4;
    constexpr size_t INCLUDERS = 2;
    constexpr size_t PER_THREAD = 2'000;
    constexpr size_t SIGNATURES = 8;

    TransactionIndex index;
    std::vector<std::thread> threads;
    for (size_t t = 0; t < NOTIFIERS; ++t) {
        threads.emplace_back([&index, t] {
            for (size_t i = 0; i < PER_THREAD; ++i) {
                auto const sig = "sig" + std::to_string((i + t) % SIGNATURES);
                index.upsert_notification(sig, 7, "AccountInUse");
            }
        });
    }
    for (size_t t = 0; t < INCLUDERS; ++t) {
        threads.emplace_back([&index, t] {
            for (size_t i = 0; i < PER_THREAD; ++i) {
                auto const sig = "sig" + std::to_string((i + t) % SIGNATURES);
                index.upsert_inclusion(
                    sig, 8, make_tx(sig), InclusionPolicy::CreateIfAbsent);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(index.size(), SIGNATURES);
    for (size_t s = 0; s < SIGNATURES; ++s) {
        auto const info = index.get("sig" + std::to_string(s));
        ASSERT_TRUE(info.has_value());
        EXPECT_EQ(info->error_count(), NOTIFIERS * PER_THREAD / SIGNATURES);
        EXPECT_TRUE(info->is_executed);
        EXPECT_EQ(info->processed_slot, 8);
        EXPECT_EQ(info->cu_requested, 200'000);
        EXPECT_EQ(info->accounts_used.size(), 2);
        EXPECT_TRUE(
            info->first_notification_slot == 7 ||
            info->first_notification_slot == 8);
    }
}

TEST(TransactionIndex, evict_during_upserts_loses_nothing)
{
    constexpr size_t SIGNATURES = 20'000;

    TransactionIndex index;
    std::vector<TransactionInfo> evicted;
    bool writer_done = false;
    std::mutex done_mutex;

    std::thread writer{[&] {
        for (size_t i = 0; i < SIGNATURES; ++i) {
            index.upsert_notification(
                "sig" + std::to_string(i),
                static_cast<Slot>(i % 1'000),
                "AccountInUse");
        }
        std::lock_guard const lock{done_mutex};
        writer_done = true;
    }};
    std::thread evictor{[&] {
        for (;;) {
            bool done;
            {
                std::lock_guard const lock{done_mutex};
                done = writer_done;
            }
            auto batch = index.evict(1'000, 500);
            std::ranges::move(batch, std::back_inserter(evicted));
            if (done) {
                return;
            }
        }
    }};
    writer.join();
    evictor.join();

    auto remaining = index.drain();
    for (auto const &info : remaining) {
        EXPECT_FALSE(is_evictable(info.first_notification_slot, 1'000, 500));
    }
    for (auto const &info : evicted) {
        EXPECT_TRUE(is_evictable(info.first_notification_slot, 1'000, 500));
        EXPECT_EQ(info.error_count(), 1);
    }
    EXPECT_EQ(evicted.size(), SIGNATURES / 2);

    std::ranges::move(remaining, std::back_inserter(evicted));
    auto const signatures = signatures_of(evicted);
    ASSERT_EQ(signatures.size(), SIGNATURES);
    EXPECT_TRUE(std::ranges::adjacent_find(signatures) == signatures.end());
}

TEST(TransactionIndex, evictable_window)
{
    EXPECT_FALSE(is_evictable(700, 1000, 300));
    EXPECT_TRUE(is_evictable(699, 1000, 300));
    EXPECT_TRUE(is_evictable(650, 1000, 300));
    EXPECT_FALSE(is_evictable(1000, 1000, 300));
    EXPECT_FALSE(is_evictable(1200, 1000, 300));
    EXPECT_FALSE(is_evictable(0, 300, 300));
    EXPECT_TRUE(is_evictable(0, 301, 300));
}

TEST(TransactionIndex, evict_removes_only_old_entries)
{
    TransactionIndex index;
    index.upsert_notification("s650", 650, "AccountInUse");
    index.upsert_notification("s699", 699, "AccountInUse");
    index.upsert_notification("s700", 700, "AccountInUse");
    index.upsert_notification("s1100", 1100, "AccountInUse");

    auto const evicted = index.evict(1000, 300);
    EXPECT_EQ(
        signatures_of(evicted), (std::vector<std::string>{"s650", "s699"}));
    EXPECT_EQ(index.size(), 2);
    EXPECT_FALSE(index.get("s650").has_value());
    EXPECT_FALSE(index.get("s699").has_value());
    EXPECT_TRUE(index.get("s700").has_value());
    EXPECT_TRUE(index.get("s1100").has_value());

    EXPECT_TRUE(index.evict(1000, 300).empty());
}

TEST(TransactionIndex, drain_removes_everything)
{
    TransactionIndex index;
    for (int i = 0; i < 100; ++i) {
        index.upsert_notification(
            "sig" + std::to_string(i), static_cast<Slot>(i), "AccountInUse");
    }
    EXPECT_EQ(index.drain().size(), 100);
    EXPECT_EQ(index.size(), 0);
    EXPECT_TRUE(index.drain().empty());
}
