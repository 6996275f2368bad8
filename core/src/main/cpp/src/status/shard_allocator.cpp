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

#include "shard_allocator.h"
#include "../errors.h"
#include "../util/log.h"
#include <algorithm>
#include <numeric>
#include <random>

namespace statuslist {
namespace status {

namespace {

std::mt19937& shuffle_engine() {
    thread_local std::mt19937 engine{std::random_device{}()};
    return engine;
}

Definition load_definition(persist::Session& session, const std::string& id) {
    try {
        return Definition::from_record(session.retrieve_by_id(scopes::kDefinition, id));
    } catch (const NotFoundError&) {
        throw NotFoundError("status list definition not found: " + id);
    }
}

// Active shard of a definition, if one was created with this sequence
std::optional<Shard> find_shard(persist::Session& session, const std::string& definition_id,
                                uint64_t sequence) {
    auto matches = session.query(scopes::kShard, {
        {"definition_id", definition_id},
        {"sequence", std::to_string(sequence)}
    });
    if (matches.empty()) {
        return std::nullopt;
    }
    if (matches.size() > 1) {
        throw StorageError("definition " + definition_id + " has "
                           + std::to_string(matches.size()) + " shards with sequence "
                           + std::to_string(sequence));
    }
    return Shard::from_record(matches.front());
}

} // namespace

ShardAllocator::ShardAllocator(persist::RecordStore& store, const StatusListConfig& config)
    : store_(store), config_(config) {}

// ============================================================================
// Helpers
// ============================================================================

std::vector<uint32_t> ShardAllocator::shuffled_bit_indices(uint32_t count, uint32_t width) {
    std::vector<uint32_t> indices(count);
    for (uint32_t i = 0; i < count; ++i) {
        indices[i] = i * width;
    }
    // Fisher-Yates, walking down from the last position
    auto& engine = shuffle_engine();
    for (uint32_t i = count; i > 1; --i) {
        std::uniform_int_distribution<uint32_t> pick(0, i - 1);
        std::swap(indices[i - 1], indices[pick(engine)]);
    }
    return indices;
}

Shard ShardAllocator::load_shard(persist::Session& session, const std::string& shard_id) {
    try {
        return Shard::from_record(session.retrieve_by_id(scopes::kShard, shard_id));
    } catch (const NotFoundError&) {
        throw NotFoundError("status list not found: " + shard_id);
    }
}

Slot ShardAllocator::load_slot(persist::Session& session, const std::string& shard_id,
                               uint32_t bit_index) {
    const std::string id = Slot::make_id(shard_id, bit_index);
    try {
        return Slot::from_record(session.retrieve_by_id(scopes::kSlot, id));
    } catch (const NotFoundError&) {
        throw NotFoundError("status list entry not found: " + id);
    }
}

void ShardAllocator::erase_shard(persist::Session& txn, const Shard& shard) {
    for (const auto& record : txn.query(scopes::kSlot, {{"status_list_id", shard.id}})) {
        txn.remove(scopes::kSlot, record);
    }
    txn.remove(scopes::kShard, shard.to_record());
}

Shard ShardAllocator::create_shard(persist::Session& txn, const Definition& definition,
                                   uint64_t sequence) {
    Shard shard;
    shard.id = new_record_id();
    shard.definition_id = definition.id;
    shard.sequence = sequence;
    shard.list_size = definition.list_size;
    shard.entry_size = definition.status_size;
    shard.entry_cursor = 0;

    auto record = shard.to_record();
    txn.save(scopes::kShard, record);
    shard.version = record.version;

    auto order = shuffled_bit_indices(shard.slot_count(), shard.entry_size);
    for (uint32_t rank = 0; rank < order.size(); ++rank) {
        Slot slot;
        slot.shard_id = shard.id;
        slot.bit_index = order[rank];
        slot.rank = rank;
        auto slot_record = slot.to_record();
        txn.save(scopes::kSlot, slot_record);
    }

    debug() << "[ShardAllocator] staged shard " << shard.id << " sequence=" << sequence
            << " slots=" << order.size() << " for definition " << definition.id;
    return shard;
}

// ============================================================================
// Allocation
// ============================================================================

Allocation ShardAllocator::allocate(const std::string& definition_id) {
    for (uint32_t attempt = 1; ; ++attempt) {
        try {
            return try_allocate(definition_id);
        } catch (const TransactionConflict& e) {
            conflicts_.fetch_add(1);
            if (attempt >= config_.max_allocation_retries) {
                error() << "[ShardAllocator] allocation for definition " << definition_id
                        << " failed after " << attempt << " conflicting attempts";
                throw;
            }
            debug() << "[ShardAllocator] retrying allocation for definition " << definition_id
                    << " (attempt " << attempt << "): " << e.what();
        }
    }
}

Allocation ShardAllocator::try_allocate(const std::string& definition_id) {
    auto txn = store_.transaction();

    Definition definition = load_definition(*txn, definition_id);

    std::optional<Shard> shard;
    if (definition.list_cursor) {
        shard = find_shard(*txn, definition.id, *definition.list_cursor);
    }

    if (!shard || shard->exhausted()) {
        uint64_t next = definition.list_cursor ? *definition.list_cursor + 1 : 0;
        definition.list_cursor = next;
        auto def_record = definition.to_record();
        txn->save(scopes::kDefinition, def_record);
        shard = create_shard(*txn, definition, next);
    }

    const uint32_t rank = shard->entry_cursor / shard->entry_size;
    persist::Record slot_record;
    try {
        slot_record = txn->retrieve_by_tag_filter(scopes::kSlot, {
            {"status_list_id", shard->id},
            {"sequence", std::to_string(rank)}
        });
    } catch (const NotFoundError&) {
        // a concurrent removal of the shard shows up here as a stale read
        txn->validate();
        std::throw_with_nested(StorageError("shard " + shard->id + " has no unique slot of rank "
                                            + std::to_string(rank)));
    }
    Slot slot = Slot::from_record(slot_record);
    slot.is_assigned = true;
    slot_record = slot.to_record();
    txn->save(scopes::kSlot, slot_record);

    shard->entry_cursor += shard->entry_size;
    auto shard_record = shard->to_record();
    txn->save(scopes::kShard, shard_record);

    txn->commit();

    trace() << "[ShardAllocator] allocated " << slot.id() << " rank=" << rank;
    return Allocation{shard->id, slot.bit_index, slot.status};
}

// ============================================================================
// Slot maintenance
// ============================================================================

Slot ShardAllocator::recycle(const std::string& shard_id, uint32_t bit_index) {
    auto txn = store_.transaction();
    Slot slot = load_slot(*txn, shard_id, bit_index);
    slot.status = 0;
    slot.is_assigned = false;

    auto record = slot.to_record();
    txn->save(scopes::kSlot, record);
    txn->commit();
    slot.version = record.version;

    debug() << "[ShardAllocator] recycled " << slot.id();
    return slot;
}

Slot ShardAllocator::update_status(const std::string& shard_id, uint32_t bit_index, uint32_t value) {
    auto txn = store_.transaction();
    Shard shard = load_shard(*txn, shard_id);
    Slot slot = load_slot(*txn, shard_id, bit_index);

    if (static_cast<uint64_t>(value) >= (uint64_t{1} << shard.entry_size)) {
        throw ValidationError("status " + std::to_string(value) + " does not fit in "
                              + std::to_string(shard.entry_size) + " bit(s)");
    }
    slot.status = value;

    auto record = slot.to_record();
    txn->save(scopes::kSlot, record);
    txn->commit();
    slot.version = record.version;

    debug() << "[ShardAllocator] status of " << slot.id() << " set to " << value;
    return slot;
}

// ============================================================================
// Queries
// ============================================================================

Shard ShardAllocator::get_shard(const std::string& shard_id) {
    auto session = store_.session();
    return load_shard(*session, shard_id);
}

std::vector<Shard> ShardAllocator::list_shards(const std::optional<std::string>& definition_id) {
    persist::TagFilter filter;
    if (definition_id) {
        filter["definition_id"] = *definition_id;
    }
    std::vector<Shard> out;
    for (const auto& record : store_.session()->query(scopes::kShard, filter)) {
        out.push_back(Shard::from_record(record));
    }
    std::sort(out.begin(), out.end(), [](const Shard& a, const Shard& b) {
        if (a.definition_id != b.definition_id) {
            return a.definition_id < b.definition_id;
        }
        return a.sequence < b.sequence;
    });
    return out;
}

Slot ShardAllocator::get_slot(const std::string& shard_id, uint32_t bit_index) {
    auto session = store_.session();
    return load_slot(*session, shard_id, bit_index);
}

std::vector<Slot> ShardAllocator::list_slots(const std::string& shard_id, std::optional<uint32_t> rank) {
    auto session = store_.session();
    load_shard(*session, shard_id);

    persist::TagFilter filter{{"status_list_id", shard_id}};
    if (rank) {
        filter["sequence"] = std::to_string(*rank);
    }
    std::vector<Slot> out;
    for (const auto& record : session->query(scopes::kSlot, filter)) {
        out.push_back(Slot::from_record(record));
    }
    std::sort(out.begin(), out.end(), [](const Slot& a, const Slot& b) {
        return a.bit_index < b.bit_index;
    });
    return out;
}

// ============================================================================
// Deletion
// ============================================================================

void ShardAllocator::remove_shard(const std::string& shard_id) {
    auto txn = store_.transaction();
    Shard shard = load_shard(*txn, shard_id);
    erase_shard(*txn, shard);
    txn->commit();

    info() << "[ShardAllocator] removed shard " << shard_id
           << " (definition " << shard.definition_id << ", sequence " << shard.sequence << ")";
}

size_t ShardAllocator::remove_shards(const std::string& definition_id) {
    auto txn = store_.transaction();
    load_definition(*txn, definition_id);

    auto records = txn->query(scopes::kShard, {{"definition_id", definition_id}});
    for (const auto& record : records) {
        erase_shard(*txn, Shard::from_record(record));
    }
    txn->commit();

    info() << "[ShardAllocator] removed " << records.size() << " shard(s) of definition "
           << definition_id;
    return records.size();
}

} // namespace status
} // namespace statuslist
