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

#include "signer.h"
#include "bitstring.h"
#include "../errors.h"
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace statuslist {
namespace status {

namespace {

rapidjson::Document parse_object(const std::string& json, const char* what) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        throw SigningError(std::string(what) + " is not a JSON object");
    }
    return doc;
}

std::string render(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> w(buffer);
    value.Accept(w);
    return buffer.GetString();
}

} // namespace

std::string UnsecuredJwtSigner::sign(const std::string& headers_json,
                                     const std::string& payload_json,
                                     const std::string& issuer_id) {
    if (issuer_id.empty()) {
        throw SigningError("issuer id is required");
    }

    auto headers = parse_object(headers_json, "token header");
    auto payload = parse_object(payload_json, "token payload");

    auto& alloc = headers.GetAllocator();
    if (headers.HasMember("alg")) {
        headers["alg"].SetString("none", alloc);
    } else {
        headers.AddMember("alg", rapidjson::Value("none", alloc), alloc);
    }

    return bitstring::base64url_encode(render(headers)) + "."
         + bitstring::base64url_encode(render(payload)) + ".";
}

} // namespace status
} // namespace statuslist
