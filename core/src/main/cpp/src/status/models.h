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
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "../persistence/record.h"

namespace statuslist {
namespace status {

enum class StatusPurpose {
    Revocation,
    Suspension,
    Message
};

const char* to_string(StatusPurpose purpose);

// ValidationError for anything but revocation|suspension|message
StatusPurpose parse_status_purpose(const std::string& text);

// bit pattern text (e.g. "0x01") -> label
using StatusMessageMap = std::map<std::string, std::string>;

// Random UUID text used for definition and shard ids
std::string new_record_id();

/**
 * Configuration for one status purpose: slot width, shard capacity and the
 * sequence of the shard currently accepting allocations.
 */
struct Definition {
    std::string id;
    StatusPurpose status_purpose = StatusPurpose::Revocation;
    uint32_t status_size = 1;                      // bits per slot
    std::optional<StatusMessageMap> status_message;
    uint32_t list_size = 131072;                   // bits per shard
    std::optional<uint64_t> list_cursor;           // active shard sequence
    uint64_t version = 0;

    persist::Record to_record() const;
    static Definition from_record(const persist::Record& record);
    std::string to_json() const;
};

/**
 * One physical bit array. list_size and entry_size are copied from the
 * definition at creation and never change afterwards.
 */
struct Shard {
    std::string id;
    std::string definition_id;
    uint64_t sequence = 0;
    uint32_t list_size = 0;      // capacity in bits
    uint32_t entry_size = 1;     // slot width in bits
    uint32_t entry_cursor = 0;   // next rank * entry_size
    uint64_t version = 0;

    bool exhausted() const { return entry_cursor >= list_size; }
    uint32_t slot_count() const { return list_size / entry_size; }

    persist::Record to_record() const;
    static Shard from_record(const persist::Record& record);
    std::string to_json() const;
};

/**
 * One bit-aligned binding inside a shard, identified by "<shard_id>-<bit_index>".
 */
struct Slot {
    std::string shard_id;
    uint32_t bit_index = 0;
    uint32_t rank = 0;           // position in the shard's hand-out order
    uint32_t status = 0;
    bool is_assigned = false;
    uint64_t version = 0;

    std::string id() const { return make_id(shard_id, bit_index); }
    static std::string make_id(const std::string& shard_id, uint32_t bit_index);

    persist::Record to_record() const;
    static Slot from_record(const persist::Record& record);
    std::string to_json() const;
};

} // namespace status
} // namespace statuslist
