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

#include <libpq-fe.h>

#include <memory>
#include <span>
#include <string>

BANKWATCH_NAMESPACE_BEGIN

/// Writes records into the banking_stage_results schema with
/// `COPY ... FROM STDIN BINARY`, one COPY per call, over a single libpq
/// connection shared by all callers
class PostgresSink final : public StorageSink
{
    struct ConnectionDeleter
    {
        void operator()(PGconn *const conn) const noexcept
        {
            PQfinish(conn);
        }
    };

    using Connection = std::unique_ptr<PGconn, ConnectionDeleter>;

    Connection conn_;
    boost::fibers::mutex mutex_;

    StorageError failure() const;
    Result<void> copy_in(char const *statement, std::string const &payload);

    explicit PostgresSink(Connection);

public:
    /// Opens a connection from a libpq connection string
    static Result<std::unique_ptr<PostgresSink>>
    connect(std::string const &conninfo);

    Result<void>
    save_transactions(std::span<TransactionInfo const>) override;
    Result<void> save_block(BlockInfo const &) override;
};

/// COPY payload for transaction_infos, in the column order of
/// TRANSACTION_INFOS_COPY
std::string encode_transactions(std::span<TransactionInfo const>);

/// COPY payload for blocks, in the column order of BLOCKS_COPY
std::string encode_block(BlockInfo const &);

extern char const *const TRANSACTION_INFOS_COPY;
extern char const *const BLOCKS_COPY;

BANKWATCH_NAMESPACE_END
