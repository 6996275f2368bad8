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

#include "models.h"
#include "../errors.h"
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace statuslist {
namespace status {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(JsonWriter& w, const std::string& s) {
    w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

rapidjson::Document parse_value(const persist::Record& record, const char* kind) {
    rapidjson::Document doc;
    doc.Parse(record.value.c_str(), record.value.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        throw StorageError(std::string("corrupt ") + kind + " record " + record.id);
    }
    return doc;
}

uint64_t get_uint64(const rapidjson::Value& obj, const char* field, const persist::Record& record) {
    if (!obj.HasMember(field) || !obj[field].IsUint64()) {
        throw StorageError("record " + record.id + " missing numeric field '" + field + "'");
    }
    return obj[field].GetUint64();
}

uint32_t get_uint32(const rapidjson::Value& obj, const char* field, const persist::Record& record) {
    uint64_t v = get_uint64(obj, field, record);
    if (v > UINT32_MAX) {
        throw StorageError("record " + record.id + " field '" + field + "' out of range");
    }
    return static_cast<uint32_t>(v);
}

std::string get_string(const rapidjson::Value& obj, const char* field, const persist::Record& record) {
    if (!obj.HasMember(field) || !obj[field].IsString()) {
        throw StorageError("record " + record.id + " missing text field '" + field + "'");
    }
    return obj[field].GetString();
}

void write_definition_fields(JsonWriter& w, const Definition& d) {
    w.Key("status_purpose");
    w.String(to_string(d.status_purpose));
    w.Key("status_size");
    w.Uint(d.status_size);
    w.Key("status_message");
    if (d.status_message) {
        w.StartObject();
        for (const auto& [pattern, label] : *d.status_message) {
            w.Key(pattern.c_str(), static_cast<rapidjson::SizeType>(pattern.size()));
            write_string(w, label);
        }
        w.EndObject();
    } else {
        w.Null();
    }
    w.Key("list_size");
    w.Uint(d.list_size);
    w.Key("list_cursor");
    if (d.list_cursor) {
        w.Uint64(*d.list_cursor);
    } else {
        w.Null();
    }
}

void write_shard_fields(JsonWriter& w, const Shard& s) {
    w.Key("definition_id");
    write_string(w, s.definition_id);
    w.Key("sequence");
    w.Uint64(s.sequence);
    w.Key("list_size");
    w.Uint(s.list_size);
    w.Key("entry_size");
    w.Uint(s.entry_size);
    w.Key("entry_cursor");
    w.Uint(s.entry_cursor);
}

void write_slot_fields(JsonWriter& w, const Slot& s) {
    w.Key("status_list_id");
    write_string(w, s.shard_id);
    w.Key("sequence");
    w.Uint(s.rank);
    w.Key("status");
    w.Uint(s.status);
    w.Key("is_assigned");
    w.Bool(s.is_assigned);
}

} // namespace

// ============================================================================
// StatusPurpose
// ============================================================================

const char* to_string(StatusPurpose purpose) {
    switch (purpose) {
    case StatusPurpose::Revocation:
        return "revocation";
    case StatusPurpose::Suspension:
        return "suspension";
    case StatusPurpose::Message:
        return "message";
    }
    return "revocation";
}

StatusPurpose parse_status_purpose(const std::string& text) {
    if (text == "revocation") return StatusPurpose::Revocation;
    if (text == "suspension") return StatusPurpose::Suspension;
    if (text == "message")    return StatusPurpose::Message;
    throw ValidationError("unknown status purpose '" + text + "'");
}

std::string new_record_id() {
    // one generator per thread; random_generator is not thread-safe
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

// ============================================================================
// Definition
// ============================================================================

persist::Record Definition::to_record() const {
    persist::Record r;
    r.id = id;
    r.version = version;
    r.tags["status_purpose"] = to_string(status_purpose);

    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    write_definition_fields(w, *this);
    w.EndObject();
    r.value = buffer.GetString();
    return r;
}

Definition Definition::from_record(const persist::Record& record) {
    auto doc = parse_value(record, "definition");

    Definition d;
    d.id = record.id;
    d.version = record.version;
    try {
        d.status_purpose = parse_status_purpose(get_string(doc, "status_purpose", record));
    } catch (const ValidationError&) {
        std::throw_with_nested(StorageError("record " + record.id + " has an invalid status purpose"));
    }
    d.status_size = get_uint32(doc, "status_size", record);
    d.list_size = get_uint32(doc, "list_size", record);

    if (doc.HasMember("status_message") && doc["status_message"].IsObject()) {
        StatusMessageMap messages;
        for (auto m = doc["status_message"].MemberBegin(); m != doc["status_message"].MemberEnd(); ++m) {
            if (m->value.IsString()) {
                messages[m->name.GetString()] = m->value.GetString();
            }
        }
        d.status_message = std::move(messages);
    }
    if (doc.HasMember("list_cursor") && !doc["list_cursor"].IsNull()) {
        d.list_cursor = get_uint64(doc, "list_cursor", record);
    }
    return d;
}

std::string Definition::to_json() const {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    w.Key("id");
    write_string(w, id);
    write_definition_fields(w, *this);
    w.EndObject();
    return buffer.GetString();
}

// ============================================================================
// Shard
// ============================================================================

persist::Record Shard::to_record() const {
    persist::Record r;
    r.id = id;
    r.version = version;
    r.tags["definition_id"] = definition_id;
    r.tags["sequence"] = std::to_string(sequence);

    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    write_shard_fields(w, *this);
    w.EndObject();
    r.value = buffer.GetString();
    return r;
}

Shard Shard::from_record(const persist::Record& record) {
    auto doc = parse_value(record, "shard");

    Shard s;
    s.id = record.id;
    s.version = record.version;
    s.definition_id = get_string(doc, "definition_id", record);
    s.sequence = get_uint64(doc, "sequence", record);
    s.list_size = get_uint32(doc, "list_size", record);
    s.entry_size = get_uint32(doc, "entry_size", record);
    s.entry_cursor = get_uint32(doc, "entry_cursor", record);
    if (s.entry_size == 0) {
        throw StorageError("shard " + record.id + " has zero entry size");
    }
    return s;
}

std::string Shard::to_json() const {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    w.Key("id");
    write_string(w, id);
    write_shard_fields(w, *this);
    w.EndObject();
    return buffer.GetString();
}

// ============================================================================
// Slot
// ============================================================================

std::string Slot::make_id(const std::string& shard_id, uint32_t bit_index) {
    return shard_id + "-" + std::to_string(bit_index);
}

persist::Record Slot::to_record() const {
    persist::Record r;
    r.id = id();
    r.version = version;
    r.tags["status_list_id"] = shard_id;
    r.tags["sequence"] = std::to_string(rank);

    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    write_slot_fields(w, *this);
    w.EndObject();
    r.value = buffer.GetString();
    return r;
}

Slot Slot::from_record(const persist::Record& record) {
    auto doc = parse_value(record, "slot");

    Slot s;
    s.version = record.version;
    s.shard_id = get_string(doc, "status_list_id", record);
    s.rank = get_uint32(doc, "sequence", record);
    s.status = get_uint32(doc, "status", record);
    if (!doc.HasMember("is_assigned") || !doc["is_assigned"].IsBool()) {
        throw StorageError("record " + record.id + " missing field 'is_assigned'");
    }
    s.is_assigned = doc["is_assigned"].GetBool();

    // bit index is the id suffix after the shard id
    auto dash = record.id.rfind('-');
    if (dash == std::string::npos || dash != s.shard_id.size()
        || record.id.compare(0, dash, s.shard_id) != 0) {
        throw StorageError("slot id " + record.id + " does not match its shard");
    }
    const std::string digits = record.id.substr(dash + 1);
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
        throw StorageError("slot id " + record.id + " has no bit index");
    }
    try {
        size_t pos = 0;
        unsigned long idx = std::stoul(digits, &pos);
        if (pos != digits.size() || idx > UINT32_MAX) {
            throw std::out_of_range("bit index");
        }
        s.bit_index = static_cast<uint32_t>(idx);
    } catch (const std::logic_error&) {
        std::throw_with_nested(StorageError("slot id " + record.id + " has no bit index"));
    }
    return s;
}

std::string Slot::to_json() const {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    w.Key("id");
    write_string(w, id());
    w.Key("index");
    w.Uint(bit_index);
    write_slot_fields(w, *this);
    w.EndObject();
    return buffer.GetString();
}

} // namespace status
} // namespace statuslist
