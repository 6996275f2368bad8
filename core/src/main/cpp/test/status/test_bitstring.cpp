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

#include <gtest/gtest.h>
#include "status/bitstring.h"
#include "status/definition_registry.h"
#include "status/shard_allocator.h"
#include "persistence/memory_store.h"
#include "errors.h"

using namespace statuslist;
using namespace statuslist::status;

namespace {

Slot make_slot(uint32_t bit_index, uint32_t status) {
    Slot s;
    s.shard_id = "shard";
    s.bit_index = bit_index;
    s.status = status;
    return s;
}

} // namespace

class BitstringTest : public ::testing::Test {
protected:
    persist::MemoryStore store;
    StatusListConfig config;
};

// ============================================================================
// Packing
// ============================================================================

TEST_F(BitstringTest, PackSingleBitsMsbFirst) {
    std::vector<Slot> slots = {make_slot(0, 1), make_slot(1, 0), make_slot(7, 1), make_slot(8, 1)};
    std::string bits = bitstring::pack(slots, 16, 1);

    ASSERT_EQ(bits.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(bits[0]), 0x81);
    EXPECT_EQ(static_cast<unsigned char>(bits[1]), 0x80);
}

TEST_F(BitstringTest, PackMultiBitFields) {
    // 2-bit fields: 0b11, 0b01, 0b10, 0b00
    std::vector<Slot> slots = {make_slot(4, 2), make_slot(0, 3), make_slot(6, 0), make_slot(2, 1)};
    std::string bits = bitstring::pack(slots, 8, 2);

    ASSERT_EQ(bits.size(), 1u);
    EXPECT_EQ(static_cast<unsigned char>(bits[0]), 0xD8);
}

TEST_F(BitstringTest, PackPadsFinalByte) {
    std::vector<Slot> slots = {make_slot(9, 1)};
    std::string bits = bitstring::pack(slots, 10, 1);

    ASSERT_EQ(bits.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(bits[0]), 0x00);
    EXPECT_EQ(static_cast<unsigned char>(bits[1]), 0x40);
}

TEST_F(BitstringTest, PackRejectsBadSlots) {
    EXPECT_THROW(bitstring::pack({make_slot(0, 2)}, 8, 1), ValidationError);
    EXPECT_THROW(bitstring::pack({make_slot(8, 1)}, 8, 1), ValidationError);
    EXPECT_THROW(bitstring::pack({make_slot(1, 1)}, 8, 2), ValidationError);
    EXPECT_THROW(bitstring::pack({}, 8, 0), ValidationError);
}

// ============================================================================
// Compression / text encoding
// ============================================================================

TEST_F(BitstringTest, GzipHeaderIsFixed) {
    std::string gz = bitstring::gzip(std::string(100, 'x'), 9);
    ASSERT_GE(gz.size(), 10u);
    EXPECT_EQ(static_cast<unsigned char>(gz[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(gz[1]), 0x8b);
    // mtime is zero
    EXPECT_EQ(gz.substr(4, 4), std::string(4, '\0'));
    EXPECT_EQ(bitstring::gunzip(gz), std::string(100, 'x'));
}

TEST_F(BitstringTest, Base64UrlAlphabetWithoutPadding) {
    EXPECT_EQ(bitstring::base64url_encode(""), "");
    EXPECT_EQ(bitstring::base64url_encode("f"), "Zg");
    EXPECT_EQ(bitstring::base64url_encode("fo"), "Zm8");
    EXPECT_EQ(bitstring::base64url_encode("foo"), "Zm9v");
    EXPECT_EQ(bitstring::base64url_encode("\xfb\xff"), "-_8");

    EXPECT_EQ(bitstring::base64url_decode("Zg"), "f");
    EXPECT_EQ(bitstring::base64url_decode("Zm8"), "fo");
    EXPECT_EQ(bitstring::base64url_decode("Zm9v"), "foo");
    EXPECT_EQ(bitstring::base64url_decode("-_8"), "\xfb\xff");
}

TEST_F(BitstringTest, DecodeRejectsGarbage) {
    EXPECT_THROW(bitstring::base64url_decode("a+b/"), ValidationError);
    EXPECT_THROW(bitstring::base64url_decode("abcde"), ValidationError);
    EXPECT_THROW(bitstring::decode("Zm9v"), ValidationError);    // not gzip
    EXPECT_THROW(bitstring::decode("!!!!"), ValidationError);
}

TEST_F(BitstringTest, CodecFailuresCarryErrorKind) {
    std::string compressed = bitstring::gzip(std::string(64, '\0'), 9);
    for (const std::string& bad : {compressed.substr(0, compressed.size() / 2),
                                   std::string("\x1f\x8b\x08garbage"), std::string()}) {
        try {
            bitstring::gunzip(bad);
            ADD_FAILURE() << "expected a decode failure";
        } catch (const StatusListError& e) {
            EXPECT_EQ(e.status_code(), 400);
        }
    }
    EXPECT_THROW(bitstring::gzip("abc", 42), ValidationError);
}

TEST_F(BitstringTest, EncodeDecodeSingleBit) {
    std::vector<Slot> slots;
    for (uint32_t i = 0; i < 64; ++i) {
        slots.push_back(make_slot(i, i % 3 == 0 ? 1 : 0));
    }
    std::string lst = bitstring::encode(slots, 64, 1);
    EXPECT_EQ(lst.find('='), std::string::npos);

    for (uint32_t i = 0; i < 64; ++i) {
        EXPECT_EQ(bitstring::status_at(lst, 1, i), i % 3 == 0 ? 1u : 0u) << "bit " << i;
    }
    EXPECT_THROW(bitstring::status_at(lst, 1, 64), ValidationError);
}

TEST_F(BitstringTest, DefaultListCompressesWell) {
    std::vector<Slot> slots = {make_slot(131071, 1)};
    std::string lst = bitstring::encode(slots, 131072, 1);

    EXPECT_LT(lst.size(), 400u);
    EXPECT_EQ(bitstring::decode(lst).size(), 16384u);
    EXPECT_EQ(bitstring::status_at(lst, 1, 131071), 1u);
    EXPECT_EQ(bitstring::status_at(lst, 1, 131070), 0u);
}

// ============================================================================
// Shards
// ============================================================================

TEST_F(BitstringTest, EncodeShardIsDeterministic) {
    DefinitionRegistry registry(store, config);
    ShardAllocator allocator(store, config);
    Definition d = registry.create(StatusPurpose::Revocation, 1, std::nullopt, 128u);
    Allocation a = allocator.allocate(d.id);
    allocator.update_status(a.shard_id, a.bit_index, 1);

    BitstringEncoder encoder;
    auto session = store.session();
    std::string first = encoder.encode_shard(*session, a.shard_id);
    std::string second = encoder.encode_shard(*session, a.shard_id);
    EXPECT_EQ(first, second);

    EXPECT_EQ(bitstring::status_at(first, 1, a.bit_index), 1u);
}

TEST_F(BitstringTest, EncodedShardReflectsLatestStatuses) {
    DefinitionRegistry registry(store, config);
    ShardAllocator allocator(store, config);
    Definition d = registry.create(StatusPurpose::Message, 4,
                                   StatusMessageMap{{"0x0", "ok"}, {"0xf", "done"}}, 64u);

    std::vector<Allocation> allocations;
    for (int i = 0; i < 16; ++i) {
        allocations.push_back(allocator.allocate(d.id));
    }
    for (size_t i = 0; i < allocations.size(); ++i) {
        allocator.update_status(allocations[i].shard_id, allocations[i].bit_index,
                                static_cast<uint32_t>(i));
    }
    allocator.update_status(allocations[5].shard_id, allocations[5].bit_index, 9);

    BitstringEncoder encoder;
    auto session = store.session();
    std::string lst = encoder.encode_shard(*session, allocations[0].shard_id);

    for (size_t i = 0; i < allocations.size(); ++i) {
        uint32_t expected = i == 5 ? 9u : static_cast<uint32_t>(i);
        EXPECT_EQ(bitstring::status_at(lst, 4, allocations[i].bit_index), expected);
    }
}

TEST_F(BitstringTest, EncodeMissingShard) {
    BitstringEncoder encoder;
    auto session = store.session();
    EXPECT_THROW(encoder.encode_shard(*session, std::string("missing")), NotFoundError);
}
