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
#include "status/definition_registry.h"
#include "status/shard_allocator.h"
#include "persistence/memory_store.h"
#include "errors.h"

using namespace statuslist;
using namespace statuslist::status;

class DefinitionRegistryTest : public ::testing::Test {
protected:
    persist::MemoryStore store;
    StatusListConfig config;
    std::unique_ptr<DefinitionRegistry> registry;

    void SetUp() override {
        config.default_list_size = 64;
        registry = std::make_unique<DefinitionRegistry>(store, config);
    }

    static StatusMessageMap messages() {
        return {{"0x00", "valid"}, {"0x01", "revoked"}, {"0x02", "suspended"}, {"0x03", "pending"}};
    }
};

// ============================================================================
// Create
// ============================================================================

TEST_F(DefinitionRegistryTest, CreateWithDefaults) {
    Definition d = registry->create(StatusPurpose::Revocation, 1);

    EXPECT_FALSE(d.id.empty());
    EXPECT_EQ(d.status_size, 1u);
    EXPECT_EQ(d.list_size, 64u);
    EXPECT_FALSE(d.list_cursor.has_value());
    EXPECT_FALSE(d.status_message.has_value());

    Definition loaded = registry->get(d.id);
    EXPECT_EQ(loaded.status_purpose, StatusPurpose::Revocation);
    EXPECT_EQ(loaded.list_size, 64u);
    EXPECT_EQ(loaded.version, d.version);
}

TEST_F(DefinitionRegistryTest, CreateMultiBitNeedsMessages) {
    EXPECT_THROW(registry->create(StatusPurpose::Revocation, 2), ValidationError);

    Definition d = registry->create(StatusPurpose::Revocation, 2, messages(), 128);
    ASSERT_TRUE(d.status_message.has_value());
    EXPECT_EQ(d.status_message->at("0x01"), "revoked");

    Definition loaded = registry->get(d.id);
    ASSERT_TRUE(loaded.status_message.has_value());
    EXPECT_EQ(loaded.status_message->size(), 4u);
}

TEST_F(DefinitionRegistryTest, MessagePurposeNeedsMessages) {
    EXPECT_THROW(registry->create(StatusPurpose::Message, 1), ValidationError);

    Definition d = registry->create(StatusPurpose::Message, 1, StatusMessageMap{{"0x00", "a"}, {"0x01", "b"}});
    EXPECT_TRUE(d.status_message.has_value());
}

TEST_F(DefinitionRegistryTest, SingleBitDropsMessages) {
    Definition d = registry->create(StatusPurpose::Suspension, 1, messages());
    EXPECT_FALSE(d.status_message.has_value());
    EXPECT_FALSE(registry->get(d.id).status_message.has_value());
}

TEST_F(DefinitionRegistryTest, RejectsBadWidthAndCapacity) {
    EXPECT_THROW(registry->create(StatusPurpose::Revocation, 0), ValidationError);
    EXPECT_THROW(registry->create(StatusPurpose::Revocation, 9, messages()), ValidationError);
    EXPECT_THROW(registry->create(StatusPurpose::Revocation, 1, std::nullopt, 0u), ValidationError);
    EXPECT_THROW(registry->create(StatusPurpose::Revocation, 2, messages(), 15u), ValidationError);
    EXPECT_NO_THROW(registry->create(StatusPurpose::Revocation, 8, messages(), 16u));
}

TEST_F(DefinitionRegistryTest, ParsePurpose) {
    EXPECT_EQ(parse_status_purpose("revocation"), StatusPurpose::Revocation);
    EXPECT_EQ(parse_status_purpose("suspension"), StatusPurpose::Suspension);
    EXPECT_EQ(parse_status_purpose("message"), StatusPurpose::Message);
    EXPECT_THROW(parse_status_purpose("Revocation"), ValidationError);
}

// ============================================================================
// Get / list
// ============================================================================

TEST_F(DefinitionRegistryTest, GetMissing) {
    try {
        registry->get("no-such-id");
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.status_code(), 404);
        EXPECT_NE(std::string(e.what()).find("no-such-id"), std::string::npos);
    }
}

TEST_F(DefinitionRegistryTest, ListFiltersByPurpose) {
    registry->create(StatusPurpose::Revocation, 1);
    registry->create(StatusPurpose::Revocation, 1);
    registry->create(StatusPurpose::Suspension, 1);

    EXPECT_EQ(registry->list().size(), 3u);
    EXPECT_EQ(registry->list(StatusPurpose::Revocation).size(), 2u);
    EXPECT_EQ(registry->list(StatusPurpose::Suspension).size(), 1u);
    EXPECT_TRUE(registry->list(StatusPurpose::Message).empty());
}

// ============================================================================
// Update
// ============================================================================

TEST_F(DefinitionRegistryTest, UpdateWhitelistedFields) {
    Definition d = registry->create(StatusPurpose::Revocation, 1);

    Definition updated = registry->update(d.id,
        R"({"status_size": 2, "list_size": 32, "status_message": {"0x00": "ok", "0x01": "bad"}})");
    EXPECT_EQ(updated.status_size, 2u);
    EXPECT_EQ(updated.list_size, 32u);
    ASSERT_TRUE(updated.status_message.has_value());

    Definition loaded = registry->get(d.id);
    EXPECT_EQ(loaded.status_size, 2u);
    EXPECT_EQ(loaded.list_size, 32u);
    EXPECT_GT(loaded.version, d.version);
}

TEST_F(DefinitionRegistryTest, UpdateRejectsForbiddenFields) {
    Definition d = registry->create(StatusPurpose::Revocation, 1);

    EXPECT_THROW(registry->update(d.id, R"({"status_purpose": "suspension"})"), ValidationError);
    EXPECT_THROW(registry->update(d.id, R"({"list_cursor": 7})"), ValidationError);
    EXPECT_THROW(registry->update(d.id, R"({"id": "other"})"), ValidationError);
    EXPECT_THROW(registry->update(d.id, R"({"colour": "blue"})"), ValidationError);

    // nothing was written
    Definition loaded = registry->get(d.id);
    EXPECT_EQ(loaded.status_purpose, StatusPurpose::Revocation);
    EXPECT_FALSE(loaded.list_cursor.has_value());
    EXPECT_EQ(loaded.version, d.version);
}

TEST_F(DefinitionRegistryTest, UpdateRejectsMalformedBodies) {
    Definition d = registry->create(StatusPurpose::Revocation, 1);

    EXPECT_THROW(registry->update(d.id, "not json"), ValidationError);
    EXPECT_THROW(registry->update(d.id, "[1, 2]"), ValidationError);
    EXPECT_THROW(registry->update(d.id, R"({"list_size": "big"})"), ValidationError);
    EXPECT_THROW(registry->update(d.id, R"({"status_message": 5})"), ValidationError);
}

TEST_F(DefinitionRegistryTest, UpdateRevalidatesMergedDefinition) {
    Definition d = registry->create(StatusPurpose::Revocation, 1);

    // width 2 without messages
    EXPECT_THROW(registry->update(d.id, R"({"status_size": 2})"), ValidationError);
    // capacity not a multiple of width
    Definition wide = registry->create(StatusPurpose::Revocation, 4, StatusMessageMap{{"0x0", "a"}}, 64u);
    EXPECT_THROW(registry->update(wide.id, R"({"list_size": 30})"), ValidationError);
}

TEST_F(DefinitionRegistryTest, UpdateMissing) {
    EXPECT_THROW(registry->update("missing", R"({"list_size": 8})"), NotFoundError);
}

TEST_F(DefinitionRegistryTest, UpdateLeavesExistingShardsAlone) {
    Definition d = registry->create(StatusPurpose::Revocation, 1, std::nullopt, 8u);
    ShardAllocator allocator(store, config);
    Allocation a = allocator.allocate(d.id);

    registry->update(d.id, R"({"list_size": 16})");

    Shard shard = allocator.get_shard(a.shard_id);
    EXPECT_EQ(shard.list_size, 8u);
    EXPECT_EQ(allocator.list_slots(a.shard_id).size(), 8u);
}

// ============================================================================
// Remove
// ============================================================================

TEST_F(DefinitionRegistryTest, RemoveUnused) {
    Definition d = registry->create(StatusPurpose::Revocation, 1);
    registry->remove(d.id);
    EXPECT_THROW(registry->get(d.id), NotFoundError);
    EXPECT_THROW(registry->remove(d.id), NotFoundError);
}

TEST_F(DefinitionRegistryTest, RemoveBlockedByShards) {
    Definition d = registry->create(StatusPurpose::Revocation, 1, std::nullopt, 8u);
    ShardAllocator allocator(store, config);
    allocator.allocate(d.id);

    try {
        registry->remove(d.id);
        FAIL() << "expected ConflictError";
    } catch (const ConflictError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Conflict);
        EXPECT_EQ(e.status_code(), 400);
    }
    EXPECT_NO_THROW(registry->get(d.id));

    // after the shards are gone the definition can go too
    EXPECT_EQ(allocator.remove_shards(d.id), 1u);
    registry->remove(d.id);
    EXPECT_THROW(registry->get(d.id), NotFoundError);
}
