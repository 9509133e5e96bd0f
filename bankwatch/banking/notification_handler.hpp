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

#include <bankwatch/banking/error_tally.hpp>
#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/banking/transaction_index.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>

BANKWATCH_NAMESPACE_BEGIN

class NotificationHandler final
{
    TransactionIndex &index_;
    ErrorTally &tally_;
    Metrics &metrics_;

public:
    NotificationHandler(TransactionIndex &, ErrorTally &, Metrics &);

    /// Tallies the error against its slot and records it on the signature's
    /// entry. Notifications without an error cause are ignored. Returns true
    /// if the notification was recorded.
    bool on_notification(TransactionNotification const &);
};

BANKWATCH_NAMESPACE_END
