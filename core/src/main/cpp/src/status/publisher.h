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
#include "envelope_builder.h"
#include "publish_sink.h"
#include "signer.h"
#include "status_config.h"
#include "../persistence/store_interface.h"

namespace statuslist {
namespace status {

// Outcome for one shard of a publish run
struct ShardPublication {
    std::string shard_id;
    uint64_t sequence = 0;
    std::string payload;      // unsigned claims JSON
    std::string uri;          // target, when a publish uri was given
    bool is_signed = false;
    bool written = false;
    std::string error;        // fatal for this shard
    std::string warning;      // sink failure tolerated by config
};

struct PublishReport {
    std::string definition_id;
    PublishFormat format = PublishFormat::Ietf;
    std::vector<ShardPublication> shards;

    size_t failures() const;
    bool ok() const { return failures() == 0; }
    std::string to_json() const;
};

/**
 * Publishes every shard of a definition: encode, wrap, sign and optionally
 * write "<publish_uri>/<sequence>-<format>.jwt" through the sink.
 *
 * A failing shard does not stop the run; its error is recorded in the
 * report. Unknown formats and definitions are rejected before any shard.
 */
class Publisher {
public:
    Publisher(persist::RecordStore& store,
              Signer& signer,
              PublishSink& sink,
              const StatusListConfig& config,
              EnvelopeBuilder::Clock clock = EnvelopeBuilder::system_clock());

    PublishReport publish(const std::string& definition_id,
                          const std::string& format,
                          const std::string& issuer_id,
                          const std::optional<std::string>& publish_uri = std::nullopt);

    static std::string target_uri(const std::string& publish_uri, uint64_t sequence,
                                  PublishFormat format);

private:
    persist::RecordStore& store_;
    Signer& signer_;
    PublishSink& sink_;
    StatusListConfig config_;
    EnvelopeBuilder builder_;
};

} // namespace status
} // namespace statuslist
