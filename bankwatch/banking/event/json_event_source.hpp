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

#include <bankwatch/banking/event/event_source.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/result.hpp>

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

BANKWATCH_NAMESPACE_BEGIN

/// Decodes one JSON message, either
///   {"type":"banking_transaction_error","slot":..,"signature":..,"error":..}
/// or
///   {"type":"block","slot":..,"block_hash":..,"leader_identity":..,
///    "transactions":[..]}
/// A malformed entry of "transactions" decodes with an empty signature.
Result<Event> decode_event(std::string_view message);

/// Reads newline-delimited JSON messages from a stream
class JsonEventSource final : public EventSource
{
    std::istream &in_;
    std::string line_;
    uint64_t line_number_{0};

public:
    explicit JsonEventSource(std::istream &);

    Result<std::optional<Event>> next() override;

    uint64_t line_number() const noexcept
    {
        return line_number_;
    }
};

BANKWATCH_NAMESPACE_END
