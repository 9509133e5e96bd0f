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

#include <bankwatch/banking/error_tally.hpp>
#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/banking/notification_handler.hpp>
#include <bankwatch/banking/transaction_index.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>

#include <quill/Quill.h>

BANKWATCH_NAMESPACE_BEGIN

NotificationHandler::NotificationHandler(
    TransactionIndex &index, ErrorTally &tally, Metrics &metrics)
    : index_{index}
    , tally_{tally}
    , metrics_{metrics}
{
}

bool NotificationHandler::on_notification(
    TransactionNotification const &notification)
{
    if (!notification.error.has_value()) {
        return false;
    }
    if (notification.signature.empty()) {
        LOG_DEBUG(
            "skipping notification without signature at slot {}",
            notification.slot);
        metrics_.malformed_transactions.inc();
        return false;
    }
    metrics_.banking_stage_events.inc();
    tally_.record_error(notification.slot);
    index_.upsert_notification(
        notification.signature, notification.slot, *notification.error);
    return true;
}

BANKWATCH_NAMESPACE_END
