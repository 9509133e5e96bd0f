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
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>

#include <oneapi/tbb/spin_rw_mutex.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

BANKWATCH_NAMESPACE_BEGIN

using ScopedLock = oneapi::tbb::spin_rw_mutex::scoped_lock;

void ErrorTally::record_error(Slot const slot)
{
    ScopedLock const lock{purge_mutex_, false};
    Map::accessor acc;
    if (map_.insert(acc, Map::value_type{slot, 1})) {
        return;
    }
    ++acc->second;
}

std::optional<uint64_t> ErrorTally::take(Slot const slot)
{
    ScopedLock const lock{purge_mutex_, false};
    Map::accessor acc;
    if (!map_.find(acc, slot)) {
        return std::nullopt;
    }
    uint64_t const count = acc->second;
    map_.erase(acc);
    return count;
}

size_t ErrorTally::purge_through(Slot const slot)
{
    ScopedLock const lock{purge_mutex_, true};
    std::vector<Slot> stale;
    for (auto const &entry : map_) {
        if (entry.first <= slot) {
            stale.push_back(entry.first);
        }
    }
    for (auto const key : stale) {
        map_.erase(key);
    }
    return stale.size();
}

size_t ErrorTally::size() const
{
    ScopedLock const lock{purge_mutex_, false};
    return map_.size();
}

BANKWATCH_NAMESPACE_END
