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
#include <bankwatch/storage/copy_binary.hpp>
#include <bankwatch/storage/postgres_sink.hpp>
#include <bankwatch/storage/records.hpp>
#include <bankwatch/storage/storage_error.hpp>

#include <boost/fiber/mutex.hpp>
#include <quill/Quill.h>

#include <libpq-fe.h>

#include <climits>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <utility>

BANKWATCH_NAMESPACE_BEGIN

char const *const TRANSACTION_INFOS_COPY =
    "COPY banking_stage_results.transaction_infos("
    "signature, errors, is_executed, is_confirmed, first_notification_slot, "
    "cu_requested, prioritization_fees, utc_timestamp, accounts_used, "
    "processed_slot) FROM STDIN BINARY";

char const *const BLOCKS_COPY =
    "COPY banking_stage_results.blocks("
    "block_hash, slot, leader_identity, successful_transactions, "
    "banking_stage_errors, processed_transactions, total_cu_used, "
    "total_cu_requested, heavily_writelocked_accounts, "
    "heavily_readlocked_accounts, supp_infos) FROM STDIN BINARY";

namespace
{
    struct ResultDeleter
    {
        void operator()(PGresult *const res) const noexcept
        {
            PQclear(res);
        }
    };

    using PgResult = std::unique_ptr<PGresult, ResultDeleter>;
}

std::string encode_transactions(std::span<TransactionInfo const> const txs)
{
    CopyBinaryWriter writer;
    for (auto const &tx : txs) {
        auto const r = to_record(tx);
        writer.begin_row(10);
        writer.add_text(r.signature);
        writer.add_text(r.errors);
        writer.add_bool(r.is_executed);
        writer.add_bool(r.is_confirmed);
        writer.add_int8(r.first_notification_slot);
        writer.add_int8(r.cu_requested);
        writer.add_int8(r.prioritization_fees);
        writer.add_timestamptz(r.utc_timestamp);
        writer.add_text(r.accounts_used);
        writer.add_int8(r.processed_slot);
    }
    return writer.finish();
}

std::string encode_block(BlockInfo const &block)
{
    auto const r = to_record(block);
    CopyBinaryWriter writer;
    writer.begin_row(11);
    writer.add_text(r.block_hash);
    writer.add_int8(r.slot);
    writer.add_text(r.leader_identity);
    writer.add_int8(r.successful_transactions);
    writer.add_int8(r.banking_stage_errors);
    writer.add_int8(r.processed_transactions);
    writer.add_int8(r.total_cu_used);
    writer.add_int8(r.total_cu_requested);
    writer.add_text(r.heavily_writelocked_accounts);
    writer.add_text(r.heavily_readlocked_accounts);
    writer.add_text(r.supp_infos);
    return writer.finish();
}

PostgresSink::PostgresSink(Connection conn)
    : conn_{std::move(conn)}
{
}

Result<std::unique_ptr<PostgresSink>>
PostgresSink::connect(std::string const &conninfo)
{
    Connection conn{PQconnectdb(conninfo.c_str())};
    if (!conn) {
        LOG_ERROR("could not allocate postgres connection");
        return StorageError::ConnectionLost;
    }
    if (PQstatus(conn.get()) != CONNECTION_OK) {
        LOG_ERROR(
            "connecting to postgres failed: {}", PQerrorMessage(conn.get()));
        return StorageError::ConnectionLost;
    }
    LOG_INFO(
        "connected to postgres at {}:{} db={}",
        PQhost(conn.get()),
        PQport(conn.get()),
        PQdb(conn.get()));
    return std::unique_ptr<PostgresSink>{new PostgresSink{std::move(conn)}};
}

StorageError PostgresSink::failure() const
{
    if (PQstatus(conn_.get()) == CONNECTION_BAD) {
        return StorageError::ConnectionLost;
    }
    return StorageError::CopyFailed;
}

Result<void>
PostgresSink::copy_in(char const *const statement, std::string const &payload)
{
    if (payload.size() > INT_MAX) {
        LOG_ERROR("copy payload of {} bytes is too large", payload.size());
        return StorageError::EncodeFailed;
    }

    std::unique_lock const lock{mutex_};
    PGconn *const conn = conn_.get();
    if (PQstatus(conn) == CONNECTION_BAD) {
        LOG_ERROR("postgres connection lost: {}", PQerrorMessage(conn));
        return StorageError::ConnectionLost;
    }

    if (PgResult const res{PQexec(conn, statement)};
        PQresultStatus(res.get()) != PGRES_COPY_IN) {
        LOG_ERROR("COPY was rejected: {}", PQerrorMessage(conn));
        return failure();
    }

    auto const size = static_cast<int>(payload.size());
    if (PQputCopyData(conn, payload.data(), size) != 1) {
        LOG_ERROR("sending COPY data failed: {}", PQerrorMessage(conn));
        // the result loop below reports the failure
        (void)PQputCopyEnd(conn, "send failed");
    }
    else if (PQputCopyEnd(conn, nullptr) != 1) {
        LOG_ERROR("ending COPY failed: {}", PQerrorMessage(conn));
    }

    bool ok = true;
    while (PgResult const res{PQgetResult(conn)}) {
        if (PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
            LOG_ERROR("COPY failed: {}", PQresultErrorMessage(res.get()));
            ok = false;
        }
    }
    if (!ok) {
        return failure();
    }
    return outcome::success();
}

Result<void>
PostgresSink::save_transactions(std::span<TransactionInfo const> const txs)
{
    if (txs.empty()) {
        return outcome::success();
    }
    return copy_in(TRANSACTION_INFOS_COPY, encode_transactions(txs));
}

Result<void> PostgresSink::save_block(BlockInfo const &block)
{
    return copy_in(BLOCKS_COPY, encode_block(block));
}

BANKWATCH_NAMESPACE_END
