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

#include <bankwatch/core/config.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

BANKWATCH_NAMESPACE_BEGIN

using Slot = uint64_t;

/// One observed banking-stage attempt to include `signature` at `slot`
struct TransactionNotification
{
    std::string signature{};
    Slot slot{0};
    std::optional<std::string> error{};
};

struct AccountUse
{
    std::string key{};
    bool writable{false};

    friend bool operator==(AccountUse const &, AccountUse const &) = default;
};

struct BlockTransaction
{
    std::string signature{}; ///< empty when the payload had none
    bool is_successful{false};
    uint64_t cu_consumed{0};
    uint64_t cu_requested{0};
    uint64_t prioritization_fees{0};
    std::vector<AccountUse> accounts{};
};

struct BlockEvent
{
    Slot slot{0};
    std::string block_hash{};
    std::string leader_identity{};
    std::vector<BlockTransaction> transactions{};
};

using Event = std::variant<TransactionNotification, BlockEvent>;

BANKWATCH_NAMESPACE_END
