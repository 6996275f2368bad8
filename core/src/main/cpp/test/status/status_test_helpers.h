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

#include "persistence/memory_store.h"
#include "status/publish_sink.h"
#include "status/signer.h"
#include "errors.h"

#include <functional>
#include <map>
#include <set>
#include <string>

namespace statuslist::status::test {

/**
 * Wraps a MemoryStore and injects failures into transactions: StorageError
 * at the Nth save (counted per transaction) or at commit, a number of
 * TransactionConflicts at commit, or a concurrent writer before a lookup.
 */
class FaultyStore : public persist::RecordStore {
public:
    explicit FaultyStore(persist::MemoryStore& inner) : inner_(inner) {}

    int fail_at_save = -1;   // 1-based; -1 disables
    bool fail_commit = false;
    int conflicting_commits = 0;   // commits that lose a race before one succeeds
    std::function<void()> before_tag_lookup;   // runs once, ahead of the next tag-filter lookup

    std::unique_ptr<persist::Session> session() override { return inner_.session(); }

    std::unique_ptr<persist::Transaction> transaction() override {
        return std::make_unique<FaultyTransaction>(inner_.transaction(), *this);
    }

private:
    class FaultyTransaction : public persist::Transaction {
    public:
        FaultyTransaction(std::unique_ptr<persist::Transaction> inner, FaultyStore& owner)
            : inner_(std::move(inner)), owner_(owner) {}

        persist::Record retrieve_by_id(const std::string& scope, const std::string& id) override {
            return inner_->retrieve_by_id(scope, id);
        }
        persist::Record retrieve_by_tag_filter(const std::string& scope, const persist::TagFilter& f) override {
            if (owner_.before_tag_lookup) {
                auto hook = std::move(owner_.before_tag_lookup);
                owner_.before_tag_lookup = nullptr;
                hook();
            }
            return inner_->retrieve_by_tag_filter(scope, f);
        }
        std::vector<persist::Record> query(const std::string& scope, const persist::TagFilter& f) override {
            return inner_->query(scope, f);
        }
        void save(const std::string& scope, persist::Record& record) override {
            if (++saves_ == owner_.fail_at_save) {
                throw StorageError("injected save failure");
            }
            inner_->save(scope, record);
        }
        void remove(const std::string& scope, const persist::Record& record) override {
            inner_->remove(scope, record);
        }
        void commit() override {
            if (owner_.fail_commit) {
                throw StorageError("injected commit failure");
            }
            if (owner_.conflicting_commits > 0) {
                --owner_.conflicting_commits;
                throw TransactionConflict("injected conflict");
            }
            inner_->commit();
        }
        bool committed() const override { return inner_->committed(); }
        void validate() override { inner_->validate(); }

    private:
        std::unique_ptr<persist::Transaction> inner_;
        FaultyStore& owner_;
        int saves_ = 0;
    };

    persist::MemoryStore& inner_;
};

// Keeps written documents in memory
class RecordingSink : public PublishSink {
public:
    std::map<std::string, std::string> files;
    bool fail = false;

    void write(const std::string& uri, const std::string& text) override {
        if (fail) {
            throw SinkError("sink unavailable: " + uri);
        }
        files[uri] = text;
    }
};

// Fails for chosen subject URIs, delegates to the unsecured signer otherwise
class SelectiveSigner : public Signer {
public:
    std::set<std::string> failing_subjects;
    int calls = 0;

    std::string sign(const std::string& headers_json,
                     const std::string& payload_json,
                     const std::string& issuer_id) override {
        ++calls;
        for (const auto& sub : failing_subjects) {
            if (payload_json.find("\"sub\":\"" + sub + "\"") != std::string::npos) {
                throw SigningError("key unavailable for " + sub);
            }
        }
        return inner_.sign(headers_json, payload_json, issuer_id);
    }

private:
    UnsecuredJwtSigner inner_;
};

} // namespace statuslist::status::test
