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

#include "publish_sink.h"
#include "../errors.h"
#include "../persistence/platform_fs.h"
#include "../util/log.h"
#include <cstring>
#include <filesystem>

namespace statuslist {
namespace status {

namespace {

constexpr const char* kFileScheme = "file://";

} // namespace

std::string FileSystemSink::resolve_path(const std::string& uri) {
    if (uri.rfind(kFileScheme, 0) == 0) {
        std::string path = uri.substr(std::strlen(kFileScheme));
        if (path.empty()) {
            throw SinkError("empty path in uri '" + uri + "'");
        }
        return path;
    }
    auto scheme_end = uri.find("://");
    if (scheme_end != std::string::npos) {
        throw SinkError("unsupported publish scheme '" + uri.substr(0, scheme_end) + "'");
    }
    if (uri.empty()) {
        throw SinkError("empty publish uri");
    }
    return uri;
}

void FileSystemSink::write(const std::string& uri, const std::string& text) {
    std::string path = resolve_path(uri);

    std::string parent = std::filesystem::path(path).parent_path().string();
    if (!parent.empty()) {
        auto res = persist::PlatformFS::ensure_directory(parent);
        if (!res.ok) {
            throw SinkError("cannot create directory " + parent + ": " + std::strerror(res.err));
        }
    }

    auto res = persist::PlatformFS::write_file_atomic(path, text);
    if (!res.ok) {
        throw SinkError("cannot write " + path + ": " + std::strerror(res.err));
    }
    debug() << "[FileSystemSink] wrote " << text.size() << " bytes to " << path;
}

} // namespace status
} // namespace statuslist
