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
#include <string_view>
#include <vector>
#include "models.h"
#include "../persistence/store_interface.h"

namespace statuslist {
namespace status {

/**
 * Packing of shard slot values into the published "lst" / "encodedList"
 * text: a zero-filled bit array with each status written MSB first at its
 * bit index, gzip-compressed and base64url-encoded without padding.
 */
namespace bitstring {

    // Raw bit array of ceil(capacity / 8) bytes
    std::string pack(const std::vector<Slot>& slots, uint32_t capacity, uint32_t width);

    // gzip container with a fixed header (mtime 0, no file name)
    std::string gzip(std::string_view data, int level);
    std::string gunzip(std::string_view data);

    std::string base64url_encode(std::string_view data);
    std::string base64url_decode(std::string_view text);

    std::string encode(const std::vector<Slot>& slots, uint32_t capacity, uint32_t width,
                       int level = 9);

    // Inverse of encode(): the packed bit array. ValidationError on malformed text.
    std::string decode(std::string_view lst);

    // Status value of the slot at bit_index in an encoded list
    uint32_t status_at(std::string_view lst, uint32_t width, uint32_t bit_index);

} // namespace bitstring

/**
 * Loads a shard's slots from a session and encodes them.
 */
class BitstringEncoder {
public:
    explicit BitstringEncoder(int compression_level = 9) : level_(compression_level) {}

    std::string encode_shard(persist::Session& session, const Shard& shard) const;
    std::string encode_shard(persist::Session& session, const std::string& shard_id) const;

private:
    int level_;
};

} // namespace status
} // namespace statuslist
