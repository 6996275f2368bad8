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

#include "bitstring.h"
#include "status_config.h"
#include "../errors.h"
#include "../util/log.h"
#include <zlib.h>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <algorithm>

namespace statuslist {
namespace status {
namespace bitstring {

namespace {

// gzip wrapper instead of raw zlib
constexpr int kGzipWindowBits = 15 + 16;
// accept gzip or zlib headers on input
constexpr int kAutoWindowBits = 15 + 32;

} // namespace

std::string pack(const std::vector<Slot>& slots, uint32_t capacity, uint32_t width) {
    if (width == 0 || width > constants::kMaxStatusSize) {
        throw ValidationError("invalid slot width " + std::to_string(width));
    }

    std::vector<const Slot*> ordered;
    ordered.reserve(slots.size());
    for (const auto& s : slots) {
        ordered.push_back(&s);
    }
    std::sort(ordered.begin(), ordered.end(), [](const Slot* a, const Slot* b) {
        return a->bit_index < b->bit_index;
    });

    std::string bits((static_cast<size_t>(capacity) + 7) / 8, '\0');
    for (const Slot* s : ordered) {
        if (s->bit_index % width != 0 || static_cast<uint64_t>(s->bit_index) + width > capacity) {
            throw ValidationError("slot " + s->id() + " lies outside a "
                                  + std::to_string(capacity) + "-bit list");
        }
        if (s->status >= (1u << width)) {
            throw ValidationError("slot " + s->id() + " status " + std::to_string(s->status)
                                  + " does not fit in " + std::to_string(width) + " bit(s)");
        }
        for (uint32_t b = 0; b < width; ++b) {
            if ((s->status >> (width - 1 - b)) & 1u) {
                uint32_t pos = s->bit_index + b;
                bits[pos / 8] = static_cast<char>(
                    static_cast<unsigned char>(bits[pos / 8]) | (0x80u >> (pos % 8)));
            }
        }
    }
    return bits;
}

std::string gzip(std::string_view data, int level) {
    z_stream stream;
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw ValidationError("invalid compression level " + std::to_string(level));
    }

    std::string output(deflateBound(&stream, static_cast<uLong>(data.size())), '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(&output[0]);
    stream.avail_out = static_cast<uInt>(output.size());

    int ret = deflate(&stream, Z_FINISH);
    if (ret != Z_STREAM_END) {
        deflateEnd(&stream);
        throw StorageError("deflate failed with code " + std::to_string(ret));
    }
    output.resize(stream.total_out);
    deflateEnd(&stream);
    return output;
}

std::string gunzip(std::string_view data) {
    z_stream stream;
    std::string output;
    size_t outlen = 0;

    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    stream.avail_in = 0;
    stream.next_in = Z_NULL;
    stream.avail_out = 0;

    if (inflateInit2(&stream, kAutoWindowBits) != Z_OK) {
        throw StorageError("could not inflateInit2");
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    for (int ret = Z_OK; ret != Z_STREAM_END; ) {
        if (stream.avail_out == 0) {
            output.resize(std::max<size_t>(output.size() * 2, 1024));
        }
        stream.next_out = reinterpret_cast<Bytef*>(&output[outlen]);
        stream.avail_out = static_cast<uInt>(output.size() - outlen);

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&stream);
            throw ValidationError("encoded list is not valid gzip data");
        }
        outlen = output.size() - stream.avail_out;
        if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            throw ValidationError("encoded list is truncated");
        }
    }
    inflateEnd(&stream);
    output.resize(outlen);
    return output;
}

std::string base64url_encode(std::string_view data) {
    using namespace boost::archive::iterators;
    using Base64 = base64_from_binary<transform_width<const char*, 6, 8>>;

    std::string text(Base64(data.data()), Base64(data.data() + data.size()));
    for (char& c : text) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return text;
}

std::string base64url_decode(std::string_view text) {
    using namespace boost::archive::iterators;
    using Binary = transform_width<binary_from_base64<const char*>, 8, 6>;

    std::string standard(text);
    while (!standard.empty() && standard.back() == '=') {
        standard.pop_back();
    }
    if (standard.size() % 4 == 1) {
        throw ValidationError("encoded list has an impossible base64 length");
    }
    for (char& c : standard) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/') {
            throw ValidationError("encoded list is not base64url text");
        }
    }

    std::string bytes;
    try {
        bytes.assign(Binary(standard.data()), Binary(standard.data() + standard.size()));
    } catch (const dataflow_exception&) {
        std::throw_with_nested(ValidationError("encoded list is not base64url text"));
    }
    // drop the bits of the final partial group
    bytes.resize(standard.size() * 6 / 8);
    return bytes;
}

std::string encode(const std::vector<Slot>& slots, uint32_t capacity, uint32_t width, int level) {
    return base64url_encode(gzip(pack(slots, capacity, width), level));
}

std::string decode(std::string_view lst) {
    return gunzip(base64url_decode(lst));
}

uint32_t status_at(std::string_view lst, uint32_t width, uint32_t bit_index) {
    if (width == 0 || width > constants::kMaxStatusSize || bit_index % width != 0) {
        throw ValidationError("bit index " + std::to_string(bit_index)
                              + " is not aligned to width " + std::to_string(width));
    }
    std::string bits = decode(lst);
    if (static_cast<uint64_t>(bit_index) + width > static_cast<uint64_t>(bits.size()) * 8) {
        throw ValidationError("bit index " + std::to_string(bit_index) + " is beyond the list");
    }
    uint32_t value = 0;
    for (uint32_t b = 0; b < width; ++b) {
        uint32_t pos = bit_index + b;
        uint32_t bit = (static_cast<unsigned char>(bits[pos / 8]) >> (7 - pos % 8)) & 1u;
        value = (value << 1) | bit;
    }
    return value;
}

} // namespace bitstring

// ============================================================================
// BitstringEncoder
// ============================================================================

std::string BitstringEncoder::encode_shard(persist::Session& session, const Shard& shard) const {
    std::vector<Slot> slots;
    for (const auto& record : session.query(scopes::kSlot, {{"status_list_id", shard.id}})) {
        slots.push_back(Slot::from_record(record));
    }
    if (slots.size() != shard.slot_count()) {
        warning() << "[BitstringEncoder] shard " << shard.id << " has " << slots.size()
                  << " slots, expected " << shard.slot_count();
    }
    std::string lst = bitstring::encode(slots, shard.list_size, shard.entry_size, level_);
    debug() << "[BitstringEncoder] encoded shard " << shard.id << " (" << shard.list_size
            << " bits) into " << lst.size() << " chars";
    return lst;
}

std::string BitstringEncoder::encode_shard(persist::Session& session, const std::string& shard_id) const {
    persist::Record record;
    try {
        record = session.retrieve_by_id(scopes::kShard, shard_id);
    } catch (const NotFoundError&) {
        throw NotFoundError("status list not found: " + shard_id);
    }
    return encode_shard(session, Shard::from_record(record));
}

} // namespace status
} // namespace statuslist
