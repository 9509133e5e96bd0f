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

#include <chrono>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

BANKWATCH_NAMESPACE_BEGIN

struct TransactionErrorKey
{
    std::string error{};
    Slot slot{0};

    friend auto
    operator<=>(TransactionErrorKey const &, TransactionErrorKey const &) =
        default;
};

/// Everything observed about one signature while it is tracked
struct TransactionInfo
{
    std::string signature{};
    std::map<TransactionErrorKey, uint64_t> errors{};
    bool is_executed{false};
    bool is_confirmed{false};
    Slot first_notification_slot{0};
    std::optional<uint64_t> cu_requested{};
    std::optional<uint64_t> prioritization_fees{};
    std::optional<Slot> processed_slot{};
    std::map<std::string, bool> accounts_used{};
    std::chrono::system_clock::time_point utc_timestamp{};

    TransactionInfo() = default;
    TransactionInfo(std::string signature, Slot first_slot);

    void add_notification(std::string const &error, Slot);
    void add_inclusion(BlockTransaction const &, Slot);

    /// Sum of all error occurrences
    uint64_t error_count() const;
};

BANKWATCH_NAMESPACE_END
