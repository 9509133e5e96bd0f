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
#include <bankwatch/storage/records.hpp>

#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <vector>

BANKWATCH_ANONYMOUS_NAMESPACE_BEGIN

std::optional<int64_t> to_int64(std::optional<uint64_t> const &v)
{
    if (!v.has_value()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(*v);
}

nlohmann::json to_json(std::optional<int64_t> const &v)
{
    if (!v.has_value()) {
        return nullptr;
    }
    return *v;
}

BANKWATCH_ANONYMOUS_NAMESPACE_END

BANKWATCH_NAMESPACE_BEGIN

nlohmann::json errors_to_json(TransactionInfo const &info)
{
    auto res = nlohmann::json::array();
    for (auto const &[key, count] : info.errors) {
        res.push_back(
            {{"error", key.error}, {"slot", key.slot}, {"count", count}});
    }
    return res;
}

nlohmann::json accounts_used_to_json(TransactionInfo const &info)
{
    auto res = nlohmann::json::array();
    for (auto const &[key, writable] : info.accounts_used) {
        res.push_back({{"key", key}, {"writable", writable}});
    }
    return res;
}

nlohmann::json to_json(std::vector<AccountLockUsage> const &accounts)
{
    auto res = nlohmann::json::array();
    for (auto const &account : accounts) {
        res.push_back(
            {{"key", account.key},
             {"count", account.count},
             {"cu_requested", account.cu_requested},
             {"cu_consumed", account.cu_consumed}});
    }
    return res;
}

nlohmann::json to_json(std::optional<PrioritizationFeeStats> const &stats)
{
    if (!stats.has_value()) {
        return nullptr;
    }
    return {
        {"p_min", stats->p_min},
        {"p_median", stats->p_median},
        {"p_75", stats->p_75},
        {"p_90", stats->p_90},
        {"p_max", stats->p_max}};
}

std::string dump_or_empty(nlohmann::json const &j, char const *const field)
{
    try {
        return j.dump();
    }
    catch (nlohmann::json::exception const &e) {
        LOG_WARNING("could not encode {}, storing empty: {}", field, e.what());
        return {};
    }
}

TransactionRecord to_record(TransactionInfo const &info)
{
    return TransactionRecord{
        .signature = info.signature,
        .errors = dump_or_empty(errors_to_json(info), "errors"),
        .is_executed = info.is_executed,
        .is_confirmed = info.is_confirmed,
        .first_notification_slot =
            static_cast<int64_t>(info.first_notification_slot),
        .cu_requested = to_int64(info.cu_requested),
        .prioritization_fees = to_int64(info.prioritization_fees),
        .utc_timestamp = info.utc_timestamp,
        .accounts_used =
            dump_or_empty(accounts_used_to_json(info), "accounts_used"),
        .processed_slot = to_int64(info.processed_slot)};
}

BlockRecord to_record(BlockInfo const &info)
{
    return BlockRecord{
        .block_hash = info.block_hash,
        .slot = static_cast<int64_t>(info.slot),
        .leader_identity = info.leader_identity,
        .successful_transactions =
            static_cast<int64_t>(info.successful_transactions),
        .banking_stage_errors = to_int64(info.banking_stage_errors),
        .processed_transactions =
            static_cast<int64_t>(info.processed_transactions),
        .total_cu_used = static_cast<int64_t>(info.total_cu_used),
        .total_cu_requested = static_cast<int64_t>(info.total_cu_requested),
        .heavily_writelocked_accounts = dump_or_empty(
            to_json(info.heavily_writelocked_accounts),
            "heavily_writelocked_accounts"),
        .heavily_readlocked_accounts = dump_or_empty(
            to_json(info.heavily_readlocked_accounts),
            "heavily_readlocked_accounts"),
        .supp_infos = dump_or_empty(to_json(info.supp_infos), "supp_infos")};
}

nlohmann::json to_json(TransactionRecord const &r)
{
    return {
        {"kind", "transaction"},
        {"signature", r.signature},
        {"errors", r.errors},
        {"is_executed", r.is_executed},
        {"is_confirmed", r.is_confirmed},
        {"first_notification_slot", r.first_notification_slot},
        {"cu_requested", to_json(r.cu_requested)},
        {"prioritization_fees", to_json(r.prioritization_fees)},
        {"utc_timestamp",
         std::format(
             "{:%FT%T}Z",
             std::chrono::floor<std::chrono::microseconds>(r.utc_timestamp))},
        {"accounts_used", r.accounts_used},
        {"processed_slot", to_json(r.processed_slot)}};
}

nlohmann::json to_json(BlockRecord const &r)
{
    return {
        {"kind", "block"},
        {"block_hash", r.block_hash},
        {"slot", r.slot},
        {"leader_identity", r.leader_identity},
        {"successful_transactions", r.successful_transactions},
        {"banking_stage_errors", to_json(r.banking_stage_errors)},
        {"processed_transactions", r.processed_transactions},
        {"total_cu_used", r.total_cu_used},
        {"total_cu_requested", r.total_cu_requested},
        {"heavily_writelocked_accounts", r.heavily_writelocked_accounts},
        {"heavily_readlocked_accounts", r.heavily_readlocked_accounts},
        {"supp_infos", r.supp_infos}};
}

BANKWATCH_NAMESPACE_END
