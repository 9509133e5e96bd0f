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

#include <bankwatch/banking/event/event_decode_error.hpp>
#include <bankwatch/banking/event/json_event_source.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/result.hpp>

#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

BANKWATCH_ANONYMOUS_NAMESPACE_BEGIN

using json = nlohmann::json;

Result<uint64_t> get_slot(json const &obj)
{
    auto const it = obj.find("slot");
    if (it == obj.end()) {
        return EventDecodeError::MissingField;
    }
    if (!it->is_number_unsigned()) {
        return EventDecodeError::InvalidField;
    }
    return it->get<uint64_t>();
}

Result<std::string> get_string(json const &obj, char const *const name)
{
    auto const it = obj.find(name);
    if (it == obj.end() || it->is_null()) {
        return EventDecodeError::MissingField;
    }
    if (!it->is_string()) {
        return EventDecodeError::InvalidField;
    }
    return it->get<std::string>();
}

// absent fields are zero; a field of the wrong type clears `valid`
uint64_t get_u64_or_zero(json const &obj, char const *const name, bool &valid)
{
    auto const it = obj.find(name);
    if (it == obj.end()) {
        return 0;
    }
    if (!it->is_number_unsigned()) {
        valid = false;
        return 0;
    }
    return it->get<uint64_t>();
}

bool get_bool_or_false(json const &obj, char const *const name, bool &valid)
{
    auto const it = obj.find(name);
    if (it == obj.end()) {
        return false;
    }
    if (!it->is_boolean()) {
        valid = false;
        return false;
    }
    return it->get<bool>();
}

BlockTransaction decode_transaction(json const &entry)
{
    if (!entry.is_object()) {
        return {};
    }
    auto signature = get_string(entry, "signature");
    if (signature.has_error()) {
        return {};
    }

    bool valid = true;
    BlockTransaction tx;
    tx.is_successful = get_bool_or_false(entry, "success", valid);
    tx.cu_consumed = get_u64_or_zero(entry, "cu_consumed", valid);
    tx.cu_requested = get_u64_or_zero(entry, "cu_requested", valid);
    tx.prioritization_fees =
        get_u64_or_zero(entry, "prioritization_fees", valid);

    if (auto const it = entry.find("accounts"); it != entry.end()) {
        if (!it->is_array()) {
            return {};
        }
        for (auto const &account : *it) {
            if (!account.is_object()) {
                return {};
            }
            auto key = get_string(account, "key");
            if (key.has_error()) {
                return {};
            }
            bool const writable =
                get_bool_or_false(account, "writable", valid);
            tx.accounts.push_back(
                AccountUse{
                    .key = std::move(key).assume_value(),
                    .writable = writable});
        }
    }

    if (!valid) {
        return {};
    }
    tx.signature = std::move(signature).assume_value();
    return tx;
}

Result<Event> decode_notification(json const &j)
{
    BOOST_OUTCOME_TRY(auto const slot, get_slot(j));

    TransactionNotification notification{.slot = slot};
    if (auto const it = j.find("signature");
        it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return EventDecodeError::InvalidField;
        }
        notification.signature = it->get<std::string>();
    }
    // structured causes are kept as their json text
    if (auto const it = j.find("error"); it != j.end() && !it->is_null()) {
        notification.error = it->is_string() ? it->get<std::string>()
                                             : it->dump();
    }
    return Event{std::move(notification)};
}

Result<Event> decode_block(json const &j)
{
    BOOST_OUTCOME_TRY(auto const slot, get_slot(j));
    BOOST_OUTCOME_TRY(auto block_hash, get_string(j, "block_hash"));
    BOOST_OUTCOME_TRY(auto leader_identity, get_string(j, "leader_identity"));

    BlockEvent block{
        .slot = slot,
        .block_hash = std::move(block_hash),
        .leader_identity = std::move(leader_identity)};
    if (auto const it = j.find("transactions"); it != j.end()) {
        if (!it->is_array()) {
            return EventDecodeError::InvalidField;
        }
        block.transactions.reserve(it->size());
        for (auto const &entry : *it) {
            block.transactions.push_back(decode_transaction(entry));
        }
    }
    return Event{std::move(block)};
}

BANKWATCH_ANONYMOUS_NAMESPACE_END

BANKWATCH_NAMESPACE_BEGIN

Result<Event> decode_event(std::string_view const message)
{
    if (message.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return EventDecodeError::EmptyMessage;
    }
    auto const j = json::parse(message, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return EventDecodeError::InvalidJson;
    }
    BOOST_OUTCOME_TRY(auto const type, get_string(j, "type"));
    if (type == "banking_transaction_error") {
        return decode_notification(j);
    }
    if (type == "block") {
        return decode_block(j);
    }
    return EventDecodeError::UnknownType;
}

JsonEventSource::JsonEventSource(std::istream &in)
    : in_{in}
{
}

Result<std::optional<Event>> JsonEventSource::next()
{
    if (!std::getline(in_, line_)) {
        if (in_.bad()) {
            LOG_ERROR("reading events failed after line {}", line_number_);
        }
        return std::optional<Event>{};
    }
    ++line_number_;
    BOOST_OUTCOME_TRY(auto event, decode_event(line_));
    return std::optional<Event>{std::move(event)};
}

BANKWATCH_NAMESPACE_END
