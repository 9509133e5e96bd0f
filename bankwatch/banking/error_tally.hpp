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

#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <oneapi/tbb/concurrent_hash_map.h>
#pragma GCC diagnostic pop
#include <oneapi/tbb/spin_rw_mutex.h>

#include <cstddef>
#include <cstdint>
#include <optional>

BANKWATCH_NAMESPACE_BEGIN

/// Count of banking-stage error notifications per slot, drained once per
/// slot by the block processor. Counts for slots whose block was already
/// processed are dropped by `purge_through`.
class ErrorTally final
{
    using Map = oneapi::tbb::concurrent_hash_map<Slot, uint64_t>;

    Map map_{};
    // shared by per-key operations, exclusive while purging
    mutable oneapi::tbb::spin_rw_mutex purge_mutex_{};

public:
    ErrorTally() = default;
    ErrorTally(ErrorTally const &) = delete;
    ErrorTally &operator=(ErrorTally const &) = delete;

    void record_error(Slot);

    /// Read and remove the count for `slot`; nullopt if no error was ever
    /// recorded for it
    std::optional<uint64_t> take(Slot);

    /// Remove every count for a slot at or below `slot`; returns how many
    /// slots were removed
    size_t purge_through(Slot slot);

    size_t size() const;
};

BANKWATCH_NAMESPACE_END
