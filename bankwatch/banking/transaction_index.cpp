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

#include <bankwatch/banking/transaction_index.hpp>
#include <bankwatch/banking/transaction_info.hpp>
#include <bankwatch/banking/types.hpp>
#include <bankwatch/core/config.hpp>

#include <oneapi/tbb/spin_rw_mutex.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

BANKWATCH_NAMESPACE_BEGIN

using ScopedLock = oneapi::tbb::spin_rw_mutex::scoped_lock;

TransactionIndex::Shard &
TransactionIndex::shard_for(std::string const &signature)
{
    return shards_[std::hash<std::string>{}(signature) % SHARDS];
}

TransactionIndex::Shard const &
TransactionIndex::shard_for(std::string const &signature) const
{
    return shards_[std::hash<std::string>{}(signature) % SHARDS];
}

void TransactionIndex::upsert_notification(
    std::string const &signature, Slot const slot, std::string const &error)
{
    auto &shard = shard_for(signature);
    ScopedLock const lock{shard.mutex, /*write*/ true};
    auto [it, inserted] = shard.map.try_emplace(signature);
    if (inserted) {
        it->second = TransactionInfo{signature, slot};
    }
    it->second.add_notification(error, slot);
}

bool TransactionIndex::upsert_inclusion(
    std::string const &signature, Slot const block_slot,
    BlockTransaction const &tx, InclusionPolicy const policy)
{
    auto &shard = shard_for(signature);
    ScopedLock const lock{shard.mutex, /*write*/ true};
    auto it = shard.map.find(signature);
    if (it == shard.map.end()) {
        if (policy == InclusionPolicy::TrackedOnly) {
            return false;
        }
        it = shard.map
                 .emplace(signature, TransactionInfo{signature, block_slot})
                 .first;
    }
    it->second.add_inclusion(tx, block_slot);
    return true;
}

std::optional<TransactionInfo>
TransactionIndex::get(std::string const &signature) const
{
    auto const &shard = shard_for(signature);
    ScopedLock const lock{shard.mutex, /*write*/ false};
    auto const it = shard.map.find(signature);
    if (it == shard.map.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t TransactionIndex::size() const
{
    size_t n = 0;
    for (auto const &shard : shards_) {
        ScopedLock const lock{shard.mutex, /*write*/ false};
        n += shard.map.size();
    }
    return n;
}

std::vector<TransactionInfo>
TransactionIndex::evict(Slot const watermark, Slot const lag_window)
{
    std::vector<TransactionInfo> evicted;
    for (auto &shard : shards_) {
        ScopedLock const lock{shard.mutex, /*write*/ true};
        for (auto it = shard.map.begin(); it != shard.map.end();) {
            if (is_evictable(
                    it->second.first_notification_slot,
                    watermark,
                    lag_window)) {
                evicted.push_back(std::move(it->second));
                it = shard.map.erase(it);
            }
            else {
                ++it;
            }
        }
    }
    return evicted;
}

std::vector<TransactionInfo> TransactionIndex::drain()
{
    std::vector<TransactionInfo> drained;
    for (auto &shard : shards_) {
        ScopedLock const lock{shard.mutex, /*write*/ true};
        drained.reserve(drained.size() + shard.map.size());
        for (auto &[signature, info] : shard.map) {
            drained.push_back(std::move(info));
        }
        shard.map.clear();
    }
    return drained;
}

BANKWATCH_NAMESPACE_END
