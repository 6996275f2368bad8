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
#include <string>

namespace statuslist {
    namespace persist {

        // Equality filter over record tags; all pairs must match.
        using TagFilter = std::map<std::string, std::string>;

        /**
         * One stored record: an id unique within its scope, text tags that can
         * be filtered on, and an opaque value (JSON text for the status models).
         *
         * version is owned by the store: 0 for a record that has never been
         * saved, incremented on every committed write. A record handed back to
         * save() must carry the version it was read with.
         */
        struct Record {
            std::string id;
            std::map<std::string, std::string> tags;
            std::string value;
            uint64_t version = 0;

            bool matches(const TagFilter& filter) const {
                for (const auto& [name, expected] : filter) {
                    auto it = tags.find(name);
                    if (it == tags.end() || it->second != expected) {
                        return false;
                    }
                }
                return true;
            }
        };

    } // namespace persist
} // namespace statuslist
