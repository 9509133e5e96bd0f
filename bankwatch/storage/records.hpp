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

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

BANKWATCH_NAMESPACE_BEGIN

/// Row of banking_stage_results.transaction_infos, in column order
struct TransactionRecord
{
    std::string signature{};
    std::string errors{};
    bool is_executed{false};
    bool is_confirmed{false};
    int64_t first_notification_slot{0};
    std::optional<int64_t> cu_requested{};
    std::optional<int64_t> prioritization_fees{};
    std::chrono::system_clock::time_point utc_timestamp{};
    std::string accounts_used{};
    std::optional<int64_t> processed_slot{};
};

/// Row of banking_stage_results.blocks, in column order
struct BlockRecord
{
    std::string block_hash{};
    int64_t slot{0};
    std::string leader_identity{};
    int64_t successful_transactions{0};
    std::optional<int64_t> banking_stage_errors{};
    int64_t processed_transactions{0};
    int64_t total_cu_used{0};
    int64_t total_cu_requested{0};
    std::string heavily_writelocked_accounts{};
    std::string heavily_readlocked_accounts{};
    std::string supp_infos{};
};

TransactionRecord to_record(TransactionInfo const &);
BlockRecord to_record(BlockInfo const &);

nlohmann::json errors_to_json(TransactionInfo const &);
nlohmann::json accounts_used_to_json(TransactionInfo const &);
nlohmann::json to_json(std::vector<AccountLockUsage> const &);
nlohmann::json to_json(std::optional<PrioritizationFeeStats> const &);

/// Serialized text of `j`, or an empty string if it cannot be encoded (for
/// example a string that is not valid UTF-8)
std::string dump_or_empty(nlohmann::json const &j, char const *field);

nlohmann::json to_json(TransactionRecord const &);
nlohmann::json to_json(BlockRecord const &);

BANKWATCH_NAMESPACE_END
