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

#include <bankwatch/banking/transaction_info.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

BANKWATCH_NAMESPACE_BEGIN

TransactionInfo::TransactionInfo(std::string signature, Slot const first_slot)
    : signature{std::move(signature)}
    , first_notification_slot{first_slot}
    , utc_timestamp{std::chrono::system_clock::now()}
{
}

void TransactionInfo::add_notification(
    std::string const &error, Slot const slot)
{
    ++errors[TransactionErrorKey{.error = error, .slot = slot}];
}

void TransactionInfo::add_inclusion(
    BlockTransaction const &tx, Slot const slot)
{
    is_executed = true;
    is_confirmed = true;
    cu_requested = tx.cu_requested;
    prioritization_fees = tx.prioritization_fees;
    processed_slot = slot;
    for (auto const &account : tx.accounts) {
        accounts_used[account.key] = account.writable;
    }
}

uint64_t TransactionInfo::error_count() const
{
    uint64_t count = 0;
    for (auto const &[key, n] : errors) {
        count += n;
    }
    return count;
}

BANKWATCH_NAMESPACE_END
