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

#include <atomic>

BANKWATCH_NAMESPACE_BEGIN

/// Slot of the most recently processed block; only ever moves forward
class SlotWatermark final
{
    std::atomic<Slot> slot_{0};

public:
    Slot load() const
    {
        return slot_.load(std::memory_order_acquire);
    }

    /// Returns true if the watermark moved
    bool advance(Slot const slot)
    {
        Slot current = slot_.load(std::memory_order_relaxed);
        while (current < slot) {
            if (slot_.compare_exchange_weak(
                    current,
                    slot,
                    std::memory_order_acq_rel,
                    std::memory_order_relaxed)) {
                return true;
            }
        }
        return false;
    }
};

BANKWATCH_NAMESPACE_END
