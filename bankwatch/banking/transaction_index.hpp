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

#include <bankwatch/banking/transaction_info.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>

#include <oneapi/tbb/spin_rw_mutex.h>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

BANKWATCH_NAMESPACE_BEGIN

enum class InclusionPolicy
{
    TrackedOnly,
    CreateIfAbsent,
};

/// An entry is old enough to evict once the watermark is strictly more than
/// `lag_window` slots past its first observation
constexpr bool is_evictable(
    Slot const first_notification_slot, Slot const watermark,
    Slot const lag_window)
{
    return watermark > first_notification_slot &&
           watermark - first_notification_slot > lag_window;
}

/// Concurrent signature -> TransactionInfo map. Keys are spread over a fixed
/// number of shards, each behind its own reader/writer lock; updates to one
/// signature are serialized and readers only ever get whole copies.
class TransactionIndex final
{
    static constexpr size_t SHARDS = 64;

    struct alignas(64) Shard
    {
        mutable oneapi::tbb::spin_rw_mutex mutex{};
        std::unordered_map<std::string, TransactionInfo> map{};
    };

    std::array<Shard, SHARDS> shards_{};

    Shard &shard_for(std::string const &signature);
    Shard const &shard_for(std::string const &signature) const;

public:
    TransactionIndex() = default;
    TransactionIndex(TransactionIndex const &) = delete;
    TransactionIndex &operator=(TransactionIndex const &) = delete;

    void upsert_notification(
        std::string const &signature, Slot, std::string const &error);

    /// Returns false if the policy is TrackedOnly and the signature is not
    /// tracked
    bool upsert_inclusion(
        std::string const &signature, Slot block_slot, BlockTransaction const &,
        InclusionPolicy = InclusionPolicy::CreateIfAbsent);

    std::optional<TransactionInfo> get(std::string const &signature) const;

    size_t size() const;

    /// Remove and return every entry evictable against `watermark`
    std::vector<TransactionInfo> evict(Slot watermark, Slot lag_window);

    /// Remove and return every entry
    std::vector<TransactionInfo> drain();
};

BANKWATCH_NAMESPACE_END
