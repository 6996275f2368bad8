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
#include <optional>
#include <string>
#include <vector>
#include "models.h"
#include "status_config.h"
#include "../persistence/store_interface.h"

namespace statuslist {
namespace status {

/**
 * CRUD over status list definitions.
 *
 * A definition fixes the purpose, slot width and shard capacity used when
 * the allocator creates new shards. Existing shards copied those values at
 * creation and are never touched by update().
 */
class DefinitionRegistry {
public:
    DefinitionRegistry(persist::RecordStore& store, const StatusListConfig& config);

    /**
     * Creates and persists a definition.
     * list_size defaults to StatusListConfig::default_list_size.
     * The message map is dropped for 1-bit non-message definitions.
     */
    Definition create(StatusPurpose purpose,
                      uint32_t status_size,
                      std::optional<StatusMessageMap> status_message = std::nullopt,
                      std::optional<uint32_t> list_size = std::nullopt);

    Definition get(const std::string& id);

    // Ordered by id
    std::vector<Definition> list(std::optional<StatusPurpose> purpose = std::nullopt);

    /**
     * Applies a JSON object of field changes. Only status_message,
     * list_size and status_size may be changed; the merged definition is
     * validated again before it is stored.
     */
    Definition update(const std::string& id, const std::string& json_body);

    // ConflictError while any shard still belongs to the definition
    void remove(const std::string& id);

    // ValidationError describing the first broken rule
    static void validate(const Definition& definition);

private:
    static void normalize(Definition& definition);
    static Definition load(persist::Session& session, const std::string& id);

    persist::RecordStore& store_;
    StatusListConfig config_;
};

} // namespace status
} // namespace statuslist
