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
#include <string>

namespace statuslist {
namespace status {

/**
 * Destination for published tokens, addressed by "scheme://path".
 * write() replaces the whole object; failures surface as SinkError.
 */
class PublishSink {
public:
    virtual ~PublishSink() = default;

    virtual void write(const std::string& uri, const std::string& text) = 0;
};

/**
 * Local files: "file:///abs/path", or a bare path with no scheme.
 * Parent directories are created; each file is replaced atomically.
 */
class FileSystemSink final : public PublishSink {
public:
    void write(const std::string& uri, const std::string& text) override;

    // SinkError for any scheme other than file://
    static std::string resolve_path(const std::string& uri);
};

} // namespace status
} // namespace statuslist
