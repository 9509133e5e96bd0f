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

#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/core/config.hpp>

#include <cstdint>
#include <format>
#include <iterator>
#include <string>
#include <string_view>

BANKWATCH_ANONYMOUS_NAMESPACE_BEGIN

void append(
    std::string &out, std::string_view const name, std::string_view const help,
    Counter const &counter)
{
    std::format_to(
        std::back_inserter(out),
        "# HELP {0} {1}\n# TYPE {0} counter\n{0} {2}\n",
        name,
        help,
        counter.get());
}

void append(
    std::string &out, std::string_view const name, std::string_view const help,
    Gauge const &gauge)
{
    std::format_to(
        std::back_inserter(out),
        "# HELP {0} {1}\n# TYPE {0} gauge\n{0} {2}\n",
        name,
        help,
        gauge.get());
}

BANKWATCH_ANONYMOUS_NAMESPACE_END

BANKWATCH_NAMESPACE_BEGIN

std::string Metrics::to_prometheus() const
{
    std::string out;
    append(
        out,
        "block_arrived",
        "block seen with n transactions",
        block_arrived);
    append(
        out,
        "bankingstage_banking_errors",
        "banking_stage errors in block",
        banking_errors);
    append(
        out, "bankingstage_txerrors", "transaction errors in block", txerrors);
    append(
        out,
        "bankingstage_banking_stage_events_counter",
        "Banking stage events received",
        banking_stage_events);
    append(
        out,
        "bankingstage_blocks_counter",
        "Banking stage blocks received",
        blocks);
    append(
        out,
        "bankingstage_malformed_events",
        "upstream messages skipped as malformed",
        malformed_events);
    append(
        out,
        "bankingstage_malformed_transactions",
        "notifications or block transactions skipped for missing signature",
        malformed_transactions);
    append(
        out,
        "bankingstage_evicted_transactions",
        "transaction infos removed from the index for persistence",
        evicted_transactions);
    append(
        out,
        "bankingstage_persist_failures",
        "block records and transaction batches that failed to persist",
        persist_failures);
    append(
        out,
        "bankingstage_delay_queue_depth",
        "blocks waiting for their release time",
        delay_queue_depth);
    append(
        out,
        "bankingstage_tracked_transactions",
        "transaction infos held in the index",
        tracked_transactions);
    append(
        out,
        "bankingstage_slot_watermark",
        "slot of the last processed block",
        slot_watermark);
    append(
        out,
        "bankingstage_error_tally_slots",
        "slots with banking-stage error counts not yet taken",
        tally_slots);
    return out;
}

BANKWATCH_NAMESPACE_END
