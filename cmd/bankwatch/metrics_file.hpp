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

#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/fiber/stop_latch.hpp>

#include <chrono>
#include <filesystem>

BANKWATCH_NAMESPACE_BEGIN

/// Replaces `path` with the current metrics in Prometheus text format. The
/// text is written next to it first and renamed into place.
void write_metrics_file(Metrics const &, std::filesystem::path const &);

/// Writes the metrics file every `period` until `stop` is requested, then
/// once more
void report_metrics(
    Metrics const &, std::filesystem::path const &, std::chrono::seconds period,
    fiber::StopLatch &stop);

BANKWATCH_NAMESPACE_END
