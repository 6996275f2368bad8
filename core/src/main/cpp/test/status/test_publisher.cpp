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
#include "status/publisher.h"
#include "status/bitstring.h"
#include "status/definition_registry.h"
#include "status/shard_allocator.h"
#include "persistence/memory_store.h"
#include "../persistence/test_helpers.h"
#include "status_test_helpers.h"
#include "errors.h"

#include <rapidjson/document.h>
#include <filesystem>
#include <fstream>

using namespace statuslist;
using namespace statuslist::status;

namespace {

constexpr int64_t kNow = 1700000000;

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Splits a compact token and decodes one part
std::string token_part(const std::string& token, int part) {
    size_t start = 0;
    for (int i = 0; i < part; ++i) {
        start = token.find('.', start) + 1;
    }
    size_t end = token.find('.', start);
    return bitstring::base64url_decode(token.substr(start, end - start));
}

} // namespace

class PublisherTest : public ::testing::Test {
protected:
    persist::MemoryStore store;
    StatusListConfig config;
    std::unique_ptr<DefinitionRegistry> registry;
    std::unique_ptr<ShardAllocator> allocator;
    test::RecordingSink sink;
    test::SelectiveSigner signer;
    std::string test_dir_;

    void SetUp() override {
        config.status_base_url = "https://status.example.org/lists";
        registry = std::make_unique<DefinitionRegistry>(store, config);
        allocator = std::make_unique<ShardAllocator>(store, config);
        test_dir_ = persist::test::create_temp_dir("statuslist_publisher");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    Publisher publisher(PublishSink& target) {
        return Publisher(store, signer, target, config, [] { return kNow; });
    }

    // Definition with three 4-slot shards
    Definition three_shards() {
        Definition d = registry->create(StatusPurpose::Revocation, 1, std::nullopt, 4u);
        for (int i = 0; i < 9; ++i) {
            allocator->allocate(d.id);
        }
        return d;
    }
};

TEST_F(PublisherTest, PublishesEveryShardInSequenceOrder) {
    Definition d = three_shards();

    PublishReport report = publisher(sink).publish(d.id, "ietf", "did:web:issuer", std::string("file:///pub"));

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.format, PublishFormat::Ietf);
    ASSERT_EQ(report.shards.size(), 3u);
    for (uint64_t i = 0; i < 3; ++i) {
        const auto& s = report.shards[i];
        EXPECT_EQ(s.sequence, i);
        EXPECT_TRUE(s.is_signed);
        EXPECT_TRUE(s.written);
        EXPECT_EQ(s.uri, "file:///pub/" + std::to_string(i) + "-ietf.jwt");
        EXPECT_TRUE(sink.files.count(s.uri));

        rapidjson::Document payload;
        payload.Parse(s.payload.c_str());
        ASSERT_FALSE(payload.HasParseError());
        EXPECT_EQ(std::string(payload["sub"].GetString()),
                  "https://status.example.org/lists/" + std::to_string(i));
        EXPECT_EQ(std::string(payload["jti"].GetString()), "urn:uuid:" + s.shard_id);
    }
    EXPECT_EQ(signer.calls, 3);
}

TEST_F(PublisherTest, TokenCarriesPayload) {
    Definition d = registry->create(StatusPurpose::Revocation, 1, std::nullopt, 16u);
    Allocation a = allocator->allocate(d.id);
    allocator->update_status(a.shard_id, a.bit_index, 1);

    PublishReport report = publisher(sink).publish(d.id, "ietf", "did:web:issuer", std::string("out"));
    ASSERT_EQ(report.shards.size(), 1u);

    const std::string& token = sink.files.at("out/0-ietf.jwt");
    EXPECT_EQ(token_part(token, 0), R"({"typ":"statuslist+jwt","alg":"none"})");
    EXPECT_EQ(token_part(token, 1), report.shards[0].payload);
    EXPECT_EQ(token.back(), '.');

    // the published list reflects the revoked slot
    rapidjson::Document payload;
    payload.Parse(report.shards[0].payload.c_str());
    EXPECT_EQ(bitstring::status_at(payload["status_list"]["lst"].GetString(), 1, a.bit_index), 1u);
}

TEST_F(PublisherTest, WithoutUriNothingIsWritten) {
    Definition d = three_shards();
    PublishReport report = publisher(sink).publish(d.id, "w3c", "did:web:issuer");

    EXPECT_EQ(report.shards.size(), 3u);
    EXPECT_TRUE(sink.files.empty());
    for (const auto& s : report.shards) {
        EXPECT_TRUE(s.is_signed);
        EXPECT_FALSE(s.written);
        EXPECT_TRUE(s.uri.empty());
    }
}

TEST_F(PublisherTest, SigningFailureIsIsolatedPerShard) {
    Definition d = three_shards();
    signer.failing_subjects.insert("https://status.example.org/lists/1");

    PublishReport report = publisher(sink).publish(d.id, "ietf", "did:web:issuer", std::string("pub"));

    ASSERT_EQ(report.shards.size(), 3u);
    EXPECT_EQ(report.failures(), 1u);
    EXPECT_FALSE(report.ok());

    EXPECT_TRUE(report.shards[0].written);
    EXPECT_FALSE(report.shards[1].is_signed);
    EXPECT_FALSE(report.shards[1].written);
    EXPECT_NE(report.shards[1].error.find("key unavailable"), std::string::npos);
    EXPECT_FALSE(report.shards[1].payload.empty());
    EXPECT_TRUE(report.shards[2].written);

    EXPECT_EQ(sink.files.size(), 2u);
    EXPECT_FALSE(sink.files.count("pub/1-ietf.jwt"));
    EXPECT_EQ(signer.calls, 3);
}

TEST_F(PublisherTest, SinkFailureIsWarningByDefault) {
    Definition d = three_shards();
    sink.fail = true;

    PublishReport report = publisher(sink).publish(d.id, "ietf", "did:web:issuer", std::string("pub"));

    EXPECT_TRUE(report.ok());
    for (const auto& s : report.shards) {
        EXPECT_TRUE(s.is_signed);
        EXPECT_FALSE(s.written);
        EXPECT_TRUE(s.error.empty());
        EXPECT_NE(s.warning.find("sink unavailable"), std::string::npos);
    }
}

TEST_F(PublisherTest, SinkFailureIsErrorWhenConfigured) {
    Definition d = three_shards();
    sink.fail = true;
    config.fail_on_sink_error = true;

    PublishReport report = publisher(sink).publish(d.id, "ietf", "did:web:issuer", std::string("pub"));

    EXPECT_EQ(report.failures(), 3u);
    for (const auto& s : report.shards) {
        EXPECT_TRUE(s.is_signed);
        EXPECT_FALSE(s.error.empty());
    }
}

TEST_F(PublisherTest, RejectsBeforeTouchingShards) {
    Definition d = three_shards();

    EXPECT_THROW(publisher(sink).publish(d.id, "pdf", "did:web:issuer"), ValidationError);
    EXPECT_THROW(publisher(sink).publish("missing", "ietf", "did:web:issuer"), NotFoundError);
    EXPECT_EQ(signer.calls, 0);
}

TEST_F(PublisherTest, DefinitionWithoutShards) {
    Definition d = registry->create(StatusPurpose::Revocation, 1);
    PublishReport report = publisher(sink).publish(d.id, "w3c", "did:web:issuer", std::string("pub"));
    EXPECT_TRUE(report.shards.empty());
    EXPECT_TRUE(report.ok());
}

TEST_F(PublisherTest, ReportJson) {
    Definition d = three_shards();
    signer.failing_subjects.insert("https://status.example.org/lists/2");
    PublishReport report = publisher(sink).publish(d.id, "w3c", "did:web:issuer");

    rapidjson::Document doc;
    doc.Parse(report.to_json().c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["format"].GetString(), "w3c");
    ASSERT_EQ(doc["shards"].Size(), 3u);
    EXPECT_TRUE(doc["shards"][0]["signed"].GetBool());
    EXPECT_TRUE(doc["shards"][0]["payload"].IsObject());
    EXPECT_STREQ(doc["shards"][0]["payload"]["vc"]["credentialSubject"]["statusPurpose"].GetString(),
                 "revocation");
    EXPECT_TRUE(doc["shards"][2].HasMember("error"));
}

TEST_F(PublisherTest, FileSystemSinkWritesTokens) {
    Definition d = three_shards();
    FileSystemSink files;
    std::string base = "file://" + test_dir_ + "/nested/lists";

    PublishReport report = publisher(files).publish(d.id, "w3c", "did:web:issuer", base);
    EXPECT_TRUE(report.ok());

    for (int i = 0; i < 3; ++i) {
        std::string path = test_dir_ + "/nested/lists/" + std::to_string(i) + "-w3c.jwt";
        ASSERT_TRUE(std::filesystem::exists(path)) << path;
        std::string token = read_file(path);
        EXPECT_EQ(token_part(token, 1), report.shards[i].payload);
    }
}

// ============================================================================
// Signer and sink
// ============================================================================

TEST_F(PublisherTest, UnsecuredSignerValidatesInput) {
    UnsecuredJwtSigner unsecured;
    EXPECT_THROW(unsecured.sign("not json", "{}", "iss"), SigningError);
    EXPECT_THROW(unsecured.sign("{}", "[]", "iss"), SigningError);
    EXPECT_THROW(unsecured.sign("{}", "{}", ""), SigningError);

    std::string token = unsecured.sign(R"({"alg":"ES256"})", R"({"a":1})", "iss");
    EXPECT_EQ(token_part(token, 0), R"({"alg":"none"})");
    EXPECT_EQ(token_part(token, 1), R"({"a":1})");
}

TEST_F(PublisherTest, TargetUriJoinsOneSeparator) {
    EXPECT_EQ(Publisher::target_uri("file:///pub", 0, PublishFormat::Ietf), "file:///pub/0-ietf.jwt");
    EXPECT_EQ(Publisher::target_uri("file:///pub/", 2, PublishFormat::W3c), "file:///pub/2-w3c.jwt");
    EXPECT_EQ(Publisher::target_uri("file:///", 0, PublishFormat::Ietf), "file:///0-ietf.jwt");
    EXPECT_EQ(FileSystemSink::resolve_path(Publisher::target_uri("file:///", 0, PublishFormat::Ietf)),
              "/0-ietf.jwt");
    EXPECT_EQ(Publisher::target_uri("out", 1, PublishFormat::Ietf), "out/1-ietf.jwt");
}

TEST_F(PublisherTest, FileSystemSinkResolvesUris) {
    EXPECT_EQ(FileSystemSink::resolve_path("file:///var/lists/0.jwt"), "/var/lists/0.jwt");
    EXPECT_EQ(FileSystemSink::resolve_path("relative/0.jwt"), "relative/0.jwt");
    EXPECT_THROW(FileSystemSink::resolve_path("s3://bucket/0.jwt"), SinkError);
    EXPECT_THROW(FileSystemSink::resolve_path("file://"), SinkError);
    EXPECT_THROW(FileSystemSink::resolve_path(""), SinkError);

    FileSystemSink files;
    std::string blocker = test_dir_ + "/blocker";
    std::ofstream(blocker) << "x";
    EXPECT_THROW(files.write(blocker + "/child/0.jwt", "token"), SinkError);
}
