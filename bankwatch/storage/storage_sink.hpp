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

#include <span>

BANKWATCH_NAMESPACE_BEGIN

/// Bulk-load destination for finished records. Implementations must accept
/// calls from several fibers; failures are reported with StorageError codes.
class StorageSink
{
public:
    virtual ~StorageSink() = default;

    virtual Result<void>
    save_transactions(std::span<TransactionInfo const>) = 0;

    virtual Result<void> save_block(BlockInfo const &) = 0;
};

BANKWATCH_NAMESPACE_END
