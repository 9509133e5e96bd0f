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
#include <bankwatch/core/basic_formatter.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

template <>
struct quill::copy_loggable<bankwatch::BlockInfo> : std::true_type
{
};

template <>
struct fmt::formatter<bankwatch::BlockInfo> : public bankwatch::BasicFormatter
{
    template <typename FormatContext>
    auto format(bankwatch::BlockInfo const &b, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "BlockInfo{{"
            "slot={} "
            "hash={} "
            "leader={} "
            "processed={} "
            "successful={} "
            "banking_errors={} "
            "cu_used={} "
            "cu_requested={} "
            "write_locked={} "
            "read_locked={}"
            "}}",
            b.slot,
            b.block_hash,
            b.leader_identity,
            b.processed_transactions,
            b.successful_transactions,
            b.banking_stage_errors.value_or(0),
            b.total_cu_used,
            b.total_cu_requested,
            b.heavily_writelocked_accounts.size(),
            b.heavily_readlocked_accounts.size());
        return ctx.out();
    }
};
