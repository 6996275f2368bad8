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

#include "envelope_builder.h"
#include "bitstring.h"
#include "../errors.h"
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <chrono>
#include <ctime>

namespace statuslist {
namespace status {

namespace {

constexpr int64_t kSecondsPerDay = 86400;
constexpr const char* kCredentialsV2Context = "https://www.w3.org/ns/credentials/v2";

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(JsonWriter& w, const std::string& s) {
    w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

} // namespace

const char* to_string(PublishFormat format) {
    return format == PublishFormat::W3c ? "w3c" : "ietf";
}

PublishFormat parse_publish_format(const std::string& text) {
    if (text == "ietf") return PublishFormat::Ietf;
    if (text == "w3c")  return PublishFormat::W3c;
    throw ValidationError("unsupported publish format '" + text + "'");
}

EnvelopeBuilder::EnvelopeBuilder(const StatusListConfig& config, Clock clock)
    : config_(config), clock_(std::move(clock)) {}

EnvelopeBuilder::Clock EnvelopeBuilder::system_clock() {
    return [] {
        return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    };
}

std::string EnvelopeBuilder::iso8601(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string EnvelopeBuilder::subject(const Shard& shard) const {
    std::string base = config_.status_base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + std::to_string(shard.sequence);
}

Envelope EnvelopeBuilder::build(const Shard& shard,
                                const Definition& definition,
                                PublishFormat format,
                                const std::string& issuer_id,
                                const std::string& lst) const {
    const int64_t now = clock_();
    const int64_t until = now + config_.validity_days * kSecondsPerDay;
    const std::string sub = subject(shard);

    Envelope env;
    env.format = format;

    {
        rapidjson::StringBuffer buffer;
        JsonWriter w(buffer);
        w.StartObject();
        if (format == PublishFormat::Ietf) {
            w.Key("typ");
            w.String("statuslist+jwt");
        }
        w.EndObject();
        env.headers = buffer.GetString();
    }

    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    w.Key("iss");
    write_string(w, issuer_id);
    w.Key("nbf");
    w.Int64(now);
    w.Key("jti");
    write_string(w, "urn:uuid:" + shard.id);
    w.Key("sub");
    write_string(w, sub);

    if (format == PublishFormat::Ietf) {
        w.Key("iat");
        w.Int64(now);
        w.Key("exp");
        w.Int64(until);
        w.Key("ttl");
        w.Int64(config_.ttl_seconds);
        w.Key("status_list");
        w.StartObject();
        w.Key("bits");
        write_string(w, std::to_string(shard.entry_size));
        w.Key("lst");
        write_string(w, lst);
        w.EndObject();
    } else {
        w.Key("vc");
        w.StartObject();
        w.Key("@context");
        w.StartArray();
        w.String(kCredentialsV2Context);
        w.EndArray();
        w.Key("id");
        write_string(w, sub);
        w.Key("type");
        w.StartArray();
        w.String("VerifiableCredential");
        w.String("BitstringStatusListCredential");
        w.EndArray();
        w.Key("issuer");
        write_string(w, issuer_id);
        w.Key("validFrom");
        write_string(w, iso8601(now));
        w.Key("validUntil");
        write_string(w, iso8601(until));
        w.Key("credentialSubject");
        w.StartObject();
        w.Key("id");
        write_string(w, sub + "#list");
        w.Key("type");
        w.String("BitstringStatusList");
        w.Key("statusPurpose");
        w.String(to_string(definition.status_purpose));
        w.Key("encodedList");
        write_string(w, lst);
        w.EndObject();
        w.EndObject();
    }
    w.EndObject();
    env.payload = buffer.GetString();
    return env;
}

Envelope EnvelopeBuilder::build(persist::Session& session,
                                const Shard& shard,
                                const Definition& definition,
                                PublishFormat format,
                                const std::string& issuer_id) const {
    BitstringEncoder encoder(config_.compression_level);
    return build(shard, definition, format, issuer_id, encoder.encode_shard(session, shard));
}

} // namespace status
} // namespace statuslist
