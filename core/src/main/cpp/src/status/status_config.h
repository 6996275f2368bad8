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
#include <cstdlib>
#include <string>

namespace statuslist {
namespace status {

// Compile-time defaults
namespace constants {
    constexpr uint32_t kListSize = 131072;             // bits per shard
    constexpr uint32_t kMaxStatusSize = 8;             // widest slot in bits
    constexpr int64_t  kTtlSeconds = 43200;            // statuslist+jwt "ttl" hint
    constexpr int64_t  kValidityDays = 365;
    constexpr uint32_t kMaxAllocationRetries = 32;
    constexpr int      kCompressionLevel = 9;
    constexpr const char* kStatusBaseUrl = "https://localhost/credentials/status";
}

// Record scopes in the backing store
namespace scopes {
    constexpr const char* kDefinition = "status-list-definition";
    constexpr const char* kShard = "status-list";
    constexpr const char* kSlot = "status-list-entry";
}

/**
 * Runtime configuration for allocation and publication.
 */
struct StatusListConfig {
    uint32_t default_list_size      = constants::kListSize;
    std::string status_base_url     = constants::kStatusBaseUrl;
    int64_t ttl_seconds             = constants::kTtlSeconds;
    int64_t validity_days           = constants::kValidityDays;
    uint32_t max_allocation_retries = constants::kMaxAllocationRetries;
    bool fail_on_sink_error         = false;
    int compression_level           = constants::kCompressionLevel;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StatusListConfig defaults() {
        StatusListConfig cfg;

        if (const char* env = std::getenv("STATUSLIST_LIST_SIZE")) {
            cfg.default_list_size = static_cast<uint32_t>(std::stoul(env));
        }
        if (const char* env = std::getenv("STATUSLIST_BASE_URL")) {
            cfg.status_base_url = env;
        }
        if (const char* env = std::getenv("STATUSLIST_TTL")) {
            cfg.ttl_seconds = std::stoll(env);
        }
        if (const char* env = std::getenv("STATUSLIST_VALIDITY_DAYS")) {
            cfg.validity_days = std::stoll(env);
        }
        if (const char* env = std::getenv("STATUSLIST_MAX_RETRIES")) {
            cfg.max_allocation_retries = static_cast<uint32_t>(std::stoul(env));
        }
        if (const char* env = std::getenv("STATUSLIST_FAIL_ON_SINK_ERROR")) {
            std::string v = env;
            cfg.fail_on_sink_error = (v == "1" || v == "true" || v == "TRUE" || v == "yes");
        }
        if (const char* env = std::getenv("STATUSLIST_COMPRESSION_LEVEL")) {
            cfg.compression_level = std::stoi(env);
        }

        return cfg;
    }

    bool validate() const {
        if (default_list_size == 0) {
            return false;
        }
        if (status_base_url.empty()) {
            return false;
        }
        if (ttl_seconds < 0 || validity_days < 0) {
            return false;
        }
        if (max_allocation_retries < 1) {
            // at least one attempt
            return false;
        }
        if (compression_level < 0 || compression_level > 9) {
            return false;
        }
        return true;
    }
};

} // namespace status
} // namespace statuslist
