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

#include "definition_registry.h"
#include "../errors.h"
#include "../util/log.h"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace statuslist {
namespace status {

DefinitionRegistry::DefinitionRegistry(persist::RecordStore& store, const StatusListConfig& config)
    : store_(store), config_(config) {}

void DefinitionRegistry::validate(const Definition& d) {
    if (d.status_size == 0 || d.status_size > constants::kMaxStatusSize) {
        throw ValidationError("status_size must be between 1 and "
                              + std::to_string(constants::kMaxStatusSize) + ", got "
                              + std::to_string(d.status_size));
    }
    if (d.status_size > 1 && !d.status_message) {
        throw ValidationError("status_message is required when status_size is greater than 1");
    }
    if (d.status_purpose == StatusPurpose::Message && !d.status_message) {
        throw ValidationError("status_message is required for purpose 'message'");
    }
    if (d.list_size == 0) {
        throw ValidationError("list_size must be at least 1");
    }
    if (d.list_size % d.status_size != 0) {
        throw ValidationError("list_size " + std::to_string(d.list_size)
                              + " is not a multiple of status_size "
                              + std::to_string(d.status_size));
    }
}

void DefinitionRegistry::normalize(Definition& d) {
    if (d.status_size == 1 && d.status_purpose != StatusPurpose::Message) {
        d.status_message.reset();
    }
}

Definition DefinitionRegistry::load(persist::Session& session, const std::string& id) {
    persist::Record record;
    try {
        record = session.retrieve_by_id(scopes::kDefinition, id);
    } catch (const NotFoundError&) {
        throw NotFoundError("status list definition not found: " + id);
    }
    return Definition::from_record(record);
}

// ============================================================================
// Operations
// ============================================================================

Definition DefinitionRegistry::create(StatusPurpose purpose,
                                      uint32_t status_size,
                                      std::optional<StatusMessageMap> status_message,
                                      std::optional<uint32_t> list_size) {
    Definition d;
    d.id = new_record_id();
    d.status_purpose = purpose;
    d.status_size = status_size;
    d.status_message = std::move(status_message);
    d.list_size = list_size.value_or(config_.default_list_size);

    validate(d);
    normalize(d);

    auto record = d.to_record();
    store_.session()->save(scopes::kDefinition, record);
    d.version = record.version;

    info() << "[DefinitionRegistry] created definition " << d.id
           << " purpose=" << to_string(purpose)
           << " status_size=" << d.status_size
           << " list_size=" << d.list_size;
    return d;
}

Definition DefinitionRegistry::get(const std::string& id) {
    auto session = store_.session();
    return load(*session, id);
}

std::vector<Definition> DefinitionRegistry::list(std::optional<StatusPurpose> purpose) {
    persist::TagFilter filter;
    if (purpose) {
        filter["status_purpose"] = to_string(*purpose);
    }
    std::vector<Definition> out;
    for (const auto& record : store_.session()->query(scopes::kDefinition, filter)) {
        out.push_back(Definition::from_record(record));
    }
    return out;
}

Definition DefinitionRegistry::update(const std::string& id, const std::string& json_body) {
    rapidjson::Document body;
    body.Parse(json_body.c_str(), json_body.size());
    if (body.HasParseError()) {
        throw ValidationError(std::string("update body is not valid JSON: ")
                              + rapidjson::GetParseError_En(body.GetParseError()));
    }
    if (!body.IsObject()) {
        throw ValidationError("update body must be a JSON object");
    }

    auto txn = store_.transaction();
    Definition d = load(*txn, id);

    for (auto m = body.MemberBegin(); m != body.MemberEnd(); ++m) {
        std::string field = m->name.GetString();
        const rapidjson::Value& v = m->value;

        if (field == "status_size") {
            if (!v.IsUint()) {
                throw ValidationError("status_size must be a non-negative integer");
            }
            d.status_size = v.GetUint();
        } else if (field == "list_size") {
            if (!v.IsUint()) {
                throw ValidationError("list_size must be a non-negative integer");
            }
            d.list_size = v.GetUint();
        } else if (field == "status_message") {
            if (v.IsNull()) {
                d.status_message.reset();
            } else if (v.IsObject()) {
                StatusMessageMap messages;
                for (auto e = v.MemberBegin(); e != v.MemberEnd(); ++e) {
                    if (!e->value.IsString()) {
                        throw ValidationError("status_message labels must be strings");
                    }
                    messages[e->name.GetString()] = e->value.GetString();
                }
                d.status_message = std::move(messages);
            } else {
                throw ValidationError("status_message must be an object or null");
            }
        } else {
            throw ValidationError("field '" + field + "' cannot be updated");
        }
    }

    validate(d);
    normalize(d);

    auto record = d.to_record();
    txn->save(scopes::kDefinition, record);
    txn->commit();
    d.version = record.version;

    info() << "[DefinitionRegistry] updated definition " << d.id;
    return d;
}

void DefinitionRegistry::remove(const std::string& id) {
    auto txn = store_.transaction();
    Definition d = load(*txn, id);

    auto shards = txn->query(scopes::kShard, {{"definition_id", id}});
    if (!shards.empty()) {
        throw ConflictError("status list definition " + id + " still owns "
                            + std::to_string(shards.size()) + " shard(s)");
    }

    txn->remove(scopes::kDefinition, d.to_record());
    txn->commit();

    info() << "[DefinitionRegistry] removed definition " << id;
}

} // namespace status
} // namespace statuslist
