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
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace statuslist {
    namespace persist {

        struct FSResult {
            bool ok;
            int err;
        };

        // Thin POSIX file-system layer used by snapshots and the publish sink.
        class PlatformFS {
        public:
            static FSResult fsync_directory(const std::string& dir_path);
            static FSResult atomic_replace(const std::string& tmp, const std::string& final);
            static FSResult ensure_directory(const std::string& path);
            static std::pair<FSResult, size_t> file_size(const std::string& path);

            /**
             * Writes the whole buffer to path via temp file + fsync + rename,
             * so readers observe either the old or the new contents.
             */
            static FSResult write_file_atomic(const std::string& path, std::string_view data);
        };

    }
} // namespace statuslist::persist
