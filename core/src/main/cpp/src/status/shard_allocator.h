/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <atomic>
#include <optional>
#include <string>
#include <vector>
#include "models.h"
#include "status_config.h"
#include "../persistence/store_interface.h"

namespace statuslist {
namespace status {

struct Allocation {
    std::string shard_id;
    uint32_t bit_index = 0;
    uint32_t status = 0;
};

/**
 * Hands out unique slot indices and manages shard lifecycle.
 *
 * Each shard's slots are created up front in a random order (Fisher-Yates
 * over 0, W, 2W, ...) and handed out by rank, so consecutive allocations
 * land on unrelated bit positions. When the active shard is exhausted the
 * definition's list_cursor advances and a fresh shard is created in the
 * same transaction.
 *
 * Concurrent allocators are serialized by the store: a transaction that
 * loses a race on the definition, shard or slot record is retried from
 * scratch, up to StatusListConfig::max_allocation_retries attempts.
 */
class ShardAllocator {
public:
    ShardAllocator(persist::RecordStore& store, const StatusListConfig& config);

    Allocation allocate(const std::string& definition_id);

    // Clears status and assignment; the slot is not handed out again
    Slot recycle(const std::string& shard_id, uint32_t bit_index);

    // ValidationError if value does not fit the shard's slot width
    Slot update_status(const std::string& shard_id, uint32_t bit_index, uint32_t value);

    Shard get_shard(const std::string& shard_id);

    // Ordered by definition, then sequence
    std::vector<Shard> list_shards(const std::optional<std::string>& definition_id = std::nullopt);

    Slot get_slot(const std::string& shard_id, uint32_t bit_index);

    // Ordered by bit index; rank narrows the result to one slot
    std::vector<Slot> list_slots(const std::string& shard_id, std::optional<uint32_t> rank = std::nullopt);

    // Deletes the shard and its slots in one transaction
    void remove_shard(const std::string& shard_id);

    /**
     * Deletes every shard of a definition with its slots. The definition's
     * list_cursor is kept so sequences are never reused.
     * @return number of shards removed
     */
    size_t remove_shards(const std::string& definition_id);

    uint64_t conflicts() const { return conflicts_.load(); }

private:
    Allocation try_allocate(const std::string& definition_id);
    Shard create_shard(persist::Session& txn, const Definition& definition, uint64_t sequence);
    static std::vector<uint32_t> shuffled_bit_indices(uint32_t count, uint32_t width);
    static Shard load_shard(persist::Session& session, const std::string& shard_id);
    static Slot load_slot(persist::Session& session, const std::string& shard_id, uint32_t bit_index);
    static void erase_shard(persist::Session& txn, const Shard& shard);

    persist::RecordStore& store_;
    StatusListConfig config_;
    std::atomic<uint64_t> conflicts_{0};
};

} // namespace status
} // namespace statuslist
