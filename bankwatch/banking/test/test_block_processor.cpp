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

#include <bankwatch/banking/block_processor.hpp>
#include <bankwatch/banking/error_tally.hpp>
#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/banking/notification_handler.hpp>
#include <bankwatch/banking/slot_watermark.hpp>
#include <bankwatch/banking/transaction_index.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/storage/storage_error.hpp>
#include <bankwatch/test_util/recording_sink.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace bankwatch;

namespace
{
    BlockTransaction included(std::string signature, bool const success = true)
    {
        return BlockTransaction{
            .signature = std::move(signature),
            .is_successful = success,
            .cu_consumed = 1'000,
            .cu_requested = 10'000,
            .prioritization_fees = 7,
            .accounts = {{"acc", true}}};
    }

    TransactionNotification
    failed(std::string signature, Slot const slot, std::string error)
    {
        return TransactionNotification{
            .signature = std::move(signature),
            .slot = slot,
            .error = std::move(error)};
    }

    struct BlockProcessorTest : public ::testing::Test
    {
        Metrics metrics;
        TransactionIndex index;
        ErrorTally tally;
        SlotWatermark watermark;
        test::RecordingSink sink;
        NotificationHandler handler{index, tally, metrics};
        BlockProcessor processor{
            BlockProcessorConfig{}, index, tally, watermark, sink, metrics};
    };
}

TEST_F(BlockProcessorTest, error_before_release_is_counted)
{
    EXPECT_TRUE(handler.on_notification(failed("S", 100, "AccountInUse")));

    auto const res = processor.process(BlockEvent{
        .slot = 100,
        .block_hash = "H",
        .leader_identity = "L",
        .transactions = {included("S")}});
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().banking_stage_errors, 1);

    auto const info = index.get("S");
    ASSERT_TRUE(info.has_value());
    EXPECT_TRUE(info->is_executed);
    EXPECT_TRUE(info->is_confirmed);
    EXPECT_EQ(info->processed_slot, 100);
    EXPECT_EQ(info->errors.at({"AccountInUse", 100}), 1);

    auto const blocks = sink.blocks();
    ASSERT_EQ(blocks.size(), 1);
    EXPECT_EQ(blocks[0].banking_stage_errors, 1);
    EXPECT_EQ(blocks[0].block_hash, "H");

    EXPECT_EQ(metrics.banking_stage_events.get(), 1);
    EXPECT_EQ(metrics.banking_errors.get(), 1);
    EXPECT_EQ(watermark.load(), 100);
    EXPECT_EQ(metrics.slot_watermark.get(), 100);
    EXPECT_EQ(tally.size(), 0);
}

TEST_F(BlockProcessorTest, error_after_release_is_not_counted)
{
    auto const res = processor.process(BlockEvent{
        .slot = 100, .transactions = {included("S")}});
    ASSERT_FALSE(res.has_error());
    EXPECT_FALSE(res.value().banking_stage_errors.has_value());
    EXPECT_FALSE(index.get("S").has_value());

    EXPECT_TRUE(handler.on_notification(failed("S", 100, "AccountInUse")));
    auto const info = index.get("S");
    ASSERT_TRUE(info.has_value());
    EXPECT_FALSE(info->is_executed);
    EXPECT_EQ(info->error_count(), 1);

    // the late count stays in the tally; no block will collect it
    EXPECT_EQ(tally.size(), 1);
    EXPECT_EQ(metrics.banking_errors.get(), 0);
}

TEST_F(BlockProcessorTest, errors_of_one_slot_sum_across_signatures)
{
    handler.on_notification(failed("A", 5, "AccountInUse"));
    handler.on_notification(failed("A", 5, "AccountInUse"));
    handler.on_notification(failed("B", 5, "WouldExceedMaxBlockCostLimit"));
    handler.on_notification(failed("C", 6, "AccountInUse"));

    auto const res = processor.process(
        BlockEvent{.slot = 5, .transactions = {included("A")}});
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().banking_stage_errors, 3);
    EXPECT_EQ(tally.take(6), 1);
}

TEST_F(BlockProcessorTest, notification_without_error_is_ignored)
{
    EXPECT_FALSE(handler.on_notification(
        TransactionNotification{.signature = "S", .slot = 1}));
    EXPECT_FALSE(index.get("S").has_value());
    EXPECT_EQ(tally.size(), 0);
    EXPECT_EQ(metrics.banking_stage_events.get(), 0);
}

TEST_F(BlockProcessorTest, notification_without_signature_is_skipped)
{
    EXPECT_FALSE(handler.on_notification(failed("", 1, "AccountInUse")));
    EXPECT_EQ(index.size(), 0);
    EXPECT_EQ(tally.size(), 0);
    EXPECT_EQ(metrics.malformed_transactions.get(), 1);
}

TEST_F(BlockProcessorTest, transactions_without_signature_count_in_block)
{
    handler.on_notification(failed("S", 9, "AccountInUse"));

    auto const res = processor.process(BlockEvent{
        .slot = 9,
        .transactions = {
            included(""), included("S", false), BlockTransaction{}}});
    ASSERT_FALSE(res.has_error());
    auto const &info = res.value();
    EXPECT_EQ(info.processed_transactions, 3);
    EXPECT_EQ(info.successful_transactions, 1);
    EXPECT_EQ(info.total_cu_used, 2'000);
    EXPECT_EQ(info.total_cu_requested, 20'000);
    EXPECT_EQ(metrics.malformed_transactions.get(), 2);
    EXPECT_EQ(metrics.txerrors.get(), 2);
    EXPECT_TRUE(index.get("S")->is_executed);
    EXPECT_EQ(index.size(), 1);
}

TEST_F(BlockProcessorTest, untracked_inclusions_are_recorded_when_configured)
{
    BlockProcessor recording{
        BlockProcessorConfig{
            .inclusion_policy = InclusionPolicy::CreateIfAbsent},
        index,
        tally,
        watermark,
        sink,
        metrics};
    auto const res = recording.process(
        BlockEvent{.slot = 3, .transactions = {included("U")}});
    ASSERT_FALSE(res.has_error());

    auto const info = index.get("U");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->first_notification_slot, 3);
    EXPECT_TRUE(info->errors.empty());
}

TEST_F(BlockProcessorTest, watermark_never_goes_back)
{
    ASSERT_FALSE(processor.process(BlockEvent{.slot = 20}).has_error());
    ASSERT_FALSE(processor.process(BlockEvent{.slot = 10}).has_error());
    EXPECT_EQ(watermark.load(), 20);
    EXPECT_EQ(sink.blocks().size(), 2);
}

TEST_F(BlockProcessorTest, failed_block_write_is_counted)
{
    sink.fail_block(StorageError::CopyFailed);

    auto const res = processor.process(BlockEvent{.slot = 11});
    ASSERT_FALSE(res.has_error());
    EXPECT_TRUE(sink.blocks().empty());
    EXPECT_EQ(metrics.persist_failures.get(), 1);
    EXPECT_EQ(watermark.load(), 11);

    ASSERT_FALSE(processor.process(BlockEvent{.slot = 12}).has_error());
    EXPECT_EQ(sink.blocks().size(), 1);
}

TEST_F(BlockProcessorTest, lost_connection_is_returned)
{
    sink.fail_block(StorageError::ConnectionLost);

    auto const res = processor.process(BlockEvent{.slot = 11});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StorageError::ConnectionLost);
    EXPECT_EQ(watermark.load(), 0);
    EXPECT_EQ(metrics.persist_failures.get(), 0);
}
