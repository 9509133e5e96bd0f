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

#include "metrics_file.hpp"

#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/fiber/stop_latch.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

BANKWATCH_NAMESPACE_BEGIN

void write_metrics_file(
    Metrics const &metrics, std::filesystem::path const &path)
{
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out{tmp, std::ios::trunc};
        out << metrics.to_prometheus();
        if (!out) {
            LOG_WARNING("could not write metrics to {}", tmp.string());
            return;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        LOG_WARNING(
            "could not move metrics to {}: {}", path.string(), ec.message());
    }
}

void report_metrics(
    Metrics const &metrics, std::filesystem::path const &path,
    std::chrono::seconds const period, fiber::StopLatch &stop)
{
    while (!stop.wait_for(period)) {
        write_metrics_file(metrics, path);
        LOG_INFO(
            "blocks={} error_notifications={} tracked={} queued_blocks={} "
            "watermark={}",
            metrics.blocks.get(),
            metrics.banking_stage_events.get(),
            metrics.tracked_transactions.get(),
            metrics.delay_queue_depth.get(),
            metrics.slot_watermark.get());
    }
    write_metrics_file(metrics, path);
}

BANKWATCH_NAMESPACE_END
