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

#include "publisher.h"
#include "bitstring.h"
#include "../errors.h"
#include "../util/log.h"
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <algorithm>

namespace statuslist {
namespace status {

size_t PublishReport::failures() const {
    return std::count_if(shards.begin(), shards.end(), [](const ShardPublication& s) {
        return !s.error.empty();
    });
}

std::string PublishReport::to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> w(buffer);
    w.StartObject();
    w.Key("definition_id");
    w.String(definition_id.c_str());
    w.Key("format");
    w.String(to_string(format));
    w.Key("shards");
    w.StartArray();
    for (const auto& s : shards) {
        w.StartObject();
        w.Key("shard_id");
        w.String(s.shard_id.c_str());
        w.Key("sequence");
        w.Uint64(s.sequence);
        w.Key("signed");
        w.Bool(s.is_signed);
        w.Key("written");
        w.Bool(s.written);
        if (!s.uri.empty()) {
            w.Key("uri");
            w.String(s.uri.c_str());
        }
        if (!s.error.empty()) {
            w.Key("error");
            w.String(s.error.c_str());
        }
        if (!s.warning.empty()) {
            w.Key("warning");
            w.String(s.warning.c_str());
        }
        // claims are already JSON text
        w.Key("payload");
        if (s.payload.empty()) {
            w.Null();
        } else {
            w.RawValue(s.payload.c_str(), s.payload.size(), rapidjson::kObjectType);
        }
        w.EndObject();
    }
    w.EndArray();
    w.EndObject();
    return buffer.GetString();
}

Publisher::Publisher(persist::RecordStore& store,
                     Signer& signer,
                     PublishSink& sink,
                     const StatusListConfig& config,
                     EnvelopeBuilder::Clock clock)
    : store_(store),
      signer_(signer),
      sink_(sink),
      config_(config),
      builder_(config, std::move(clock)) {}

std::string Publisher::target_uri(const std::string& publish_uri, uint64_t sequence,
                                  PublishFormat format) {
    std::string base = publish_uri;
    if (base.empty() || base.back() != '/') {
        base += '/';
    }
    return base + std::to_string(sequence) + "-" + to_string(format) + ".jwt";
}

PublishReport Publisher::publish(const std::string& definition_id,
                                 const std::string& format_text,
                                 const std::string& issuer_id,
                                 const std::optional<std::string>& publish_uri) {
    const PublishFormat format = parse_publish_format(format_text);

    auto session = store_.session();
    Definition definition;
    try {
        definition = Definition::from_record(session->retrieve_by_id(scopes::kDefinition, definition_id));
    } catch (const NotFoundError&) {
        throw NotFoundError("status list definition not found: " + definition_id);
    }

    std::vector<Shard> shards;
    for (const auto& record : session->query(scopes::kShard, {{"definition_id", definition_id}})) {
        shards.push_back(Shard::from_record(record));
    }
    std::sort(shards.begin(), shards.end(), [](const Shard& a, const Shard& b) {
        return a.sequence < b.sequence;
    });

    PublishReport report;
    report.definition_id = definition_id;
    report.format = format;

    BitstringEncoder encoder(config_.compression_level);

    for (const auto& shard : shards) {
        ShardPublication result;
        result.shard_id = shard.id;
        result.sequence = shard.sequence;

        std::string token;
        try {
            Envelope env = builder_.build(shard, definition, format, issuer_id,
                                          encoder.encode_shard(*session, shard));
            result.payload = env.payload;
            token = signer_.sign(env.headers, env.payload, issuer_id);
            result.is_signed = true;
        } catch (const std::exception& e) {
            result.error = describe(e);
            warning() << "[Publisher] shard " << shard.id << " (sequence " << shard.sequence
                      << ") not published: " << result.error;
            report.shards.push_back(std::move(result));
            continue;
        }

        if (publish_uri) {
            result.uri = target_uri(*publish_uri, shard.sequence, format);
            try {
                sink_.write(result.uri, token);
                result.written = true;
            } catch (const std::exception& e) {
                std::string msg = describe(e);
                if (config_.fail_on_sink_error) {
                    result.error = msg;
                } else {
                    result.warning = msg;
                }
                warning() << "[Publisher] could not write " << result.uri << ": " << msg;
            }
        }

        report.shards.push_back(std::move(result));
    }

    info() << "[Publisher] published definition " << definition_id << " as "
           << to_string(format) << ": " << report.shards.size() << " shard(s), "
           << report.failures() << " failure(s)";
    return report;
}

} // namespace status
} // namespace statuslist
