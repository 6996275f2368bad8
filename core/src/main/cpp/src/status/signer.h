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
 * Turns JOSE headers and a claims payload (JSON text) into a compact token.
 * Implementations report every failure as SigningError.
 */
class Signer {
public:
    virtual ~Signer() = default;

    virtual std::string sign(const std::string& headers_json,
                             const std::string& payload_json,
                             const std::string& issuer_id) = 0;
};

/**
 * Unsecured JWS ("alg": "none"): header.payload. with an empty signature.
 * Only meant for development and tests; verifiers must reject it in production.
 */
class UnsecuredJwtSigner final : public Signer {
public:
    std::string sign(const std::string& headers_json,
                     const std::string& payload_json,
                     const std::string& issuer_id) override;
};

} // namespace status
} // namespace statuslist
