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
#include <functional>
#include <string>
#include "models.h"
#include "status_config.h"
#include "../persistence/store_interface.h"

namespace statuslist {
namespace status {

enum class PublishFormat {
    Ietf,   // statuslist+jwt
    W3c     // BitstringStatusListCredential
};

const char* to_string(PublishFormat format);

// ValidationError for anything but "ietf" or "w3c"
PublishFormat parse_publish_format(const std::string& text);

/**
 * Unsigned token parts: JOSE headers and claims, both as JSON text.
 */
struct Envelope {
    PublishFormat format = PublishFormat::Ietf;
    std::string headers;
    std::string payload;
};

class EnvelopeBuilder {
public:
    // Seconds since the epoch
    using Clock = std::function<int64_t()>;

    explicit EnvelopeBuilder(const StatusListConfig& config, Clock clock = system_clock());

    /**
     * Builds the envelope for one shard around an already encoded list.
     * Claims: iss, nbf, jti ("urn:uuid:<shard id>"), sub
     * ("<status_base_url>/<sequence>") plus the format specific part.
     */
    Envelope build(const Shard& shard,
                   const Definition& definition,
                   PublishFormat format,
                   const std::string& issuer_id,
                   const std::string& lst) const;

    // Encodes the shard from the session first
    Envelope build(persist::Session& session,
                   const Shard& shard,
                   const Definition& definition,
                   PublishFormat format,
                   const std::string& issuer_id) const;

    std::string subject(const Shard& shard) const;

    // "YYYY-MM-DDTHH:MM:SSZ"
    static std::string iso8601(int64_t epoch_seconds);

    static Clock system_clock();

private:
    StatusListConfig config_;
    Clock clock_;
};

} // namespace status
} // namespace statuslist
