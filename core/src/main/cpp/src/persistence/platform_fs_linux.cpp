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

#include "platform_fs.h"

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <cstdio>
#include <filesystem>

namespace statuslist {
    namespace persist {

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            int fd = ::open(dir_path.c_str(), O_RDONLY);
            if (fd < 0) {
                return {false, errno};
            }

            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);

            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst) {
            int rc = ::rename(src.c_str(), dst.c_str());
            if (rc != 0) {
                return {false, errno};
            }

            // rename is only durable once the parent directory is synced
            std::filesystem::path dst_path(dst);
            std::string parent_dir = dst_path.parent_path().string();
            if (parent_dir.empty()) {
                parent_dir = ".";
            }

            return fsync_directory(parent_dir);
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            if (ec) {
                if (std::filesystem::is_directory(path)) {
                    return {true, 0};
                }
                return {false, ec.value()};
            }
            return {true, 0};
        }

        std::pair<FSResult, size_t> PlatformFS::file_size(const std::string& path) {
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (size_t)st.st_size : 0 };
        }

        FSResult PlatformFS::write_file_atomic(const std::string& path, std::string_view data) {
            std::string tmp = path + ".tmp";

            int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (fd < 0) {
                return {false, errno};
            }

            const char* p = data.data();
            size_t remaining = data.size();
            while (remaining > 0) {
                ssize_t n = ::write(fd, p, remaining);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int ec = errno;
                    ::close(fd);
                    ::unlink(tmp.c_str());
                    return {false, ec};
                }
                p += n;
                remaining -= static_cast<size_t>(n);
            }

            if (::fsync(fd) != 0) {
                int ec = errno;
                ::close(fd);
                ::unlink(tmp.c_str());
                return {false, ec};
            }
            ::close(fd);

            FSResult res = atomic_replace(tmp, path);
            if (!res.ok) {
                ::unlink(tmp.c_str());
            }
            return res;
        }

    } // namespace persist
} // namespace statuslist
