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
#include <bankwatch/banking/transaction_info.hpp>
#include <bankwatch/core/result.hpp>
#include <bankwatch/storage/postgres_sink.hpp>
#include <bankwatch/storage/storage_error.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

using namespace bankwatch;

namespace
{
    constexpr size_t HEADER_SIZE = 19;

    // field count of the first row
    int field_count(std::string_view const payload)
    {
        return (static_cast<unsigned char>(payload[HEADER_SIZE]) << 8) |
               static_cast<unsigned char>(payload[HEADER_SIZE + 1]);
    }
}

TEST(PostgresSink, copy_statements_name_every_column)
{
    EXPECT_EQ(
        std::string_view{TRANSACTION_INFOS_COPY},
        "COPY banking_stage_results.transaction_infos(signature, errors, "
        "is_executed, is_confirmed, first_notification_slot, cu_requested, "
        "prioritization_fees, utc_timestamp, accounts_used, processed_slot) "
        "FROM STDIN BINARY");
    EXPECT_EQ(
        std::string_view{BLOCKS_COPY},
        "COPY banking_stage_results.blocks(block_hash, slot, leader_identity, "
        "successful_transactions, banking_stage_errors, "
        "processed_transactions, total_cu_used, total_cu_requested, "
        "heavily_writelocked_accounts, heavily_readlocked_accounts, "
        "supp_infos) FROM STDIN BINARY");
}

TEST(PostgresSink, encode_transactions)
{
    std::vector<TransactionInfo> const txs{
        TransactionInfo{"first", 1}, TransactionInfo{"second", 2}};
    auto const payload = encode_transactions(txs);

    ASSERT_GT(payload.size(), HEADER_SIZE + 2);
    EXPECT_EQ(payload.substr(0, 6), "PGCOPY");
    EXPECT_EQ(field_count(payload), 10);
    // first column is the signature
    EXPECT_EQ(payload.substr(HEADER_SIZE + 2, 4), std::string("\0\0\0\5", 4));
    EXPECT_EQ(payload.substr(HEADER_SIZE + 6, 5), "first");
    EXPECT_NE(payload.find("second"), std::string::npos);
    EXPECT_EQ(payload.substr(payload.size() - 2), "\xff\xff");
}

TEST(PostgresSink, encode_block)
{
    auto const payload = encode_block(BlockInfo{.slot = 9, .block_hash = "H"});
    EXPECT_EQ(field_count(payload), 11);
    EXPECT_EQ(payload.substr(HEADER_SIZE + 2, 5), std::string("\0\0\0\1H", 5));
    EXPECT_EQ(payload.substr(payload.size() - 2), "\xff\xff");
}

TEST(PostgresSink, unreachable_server_is_a_lost_connection)
{
    auto const res = PostgresSink::connect(
        "host=/nonexistent/bankwatch dbname=bankwatch connect_timeout=1");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StorageError::ConnectionLost);
}

TEST(StorageError, only_a_lost_connection_is_fatal)
{
    Result<void> const lost = StorageError::ConnectionLost;
    Result<void> const rejected = StorageError::CopyFailed;
    Result<void> const unwritable = StorageError::WriteFailed;
    EXPECT_TRUE(is_fatal(lost.error()));
    EXPECT_FALSE(is_fatal(rejected.error()));
    EXPECT_FALSE(is_fatal(unwritable.error()));
}
