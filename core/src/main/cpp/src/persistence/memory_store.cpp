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

#include "memory_store.h"
#include "platform_fs.h"
#include "../errors.h"
#include "../util/log.h"
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/error/en.h>
#include <algorithm>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

namespace statuslist {
namespace persist {

namespace {

std::string describe_key(const std::string& scope, const std::string& id) {
    return scope + "/" + id;
}

} // namespace

// ============================================================================
// Transaction
// ============================================================================

class MemoryTransaction final : public Transaction {
public:
    explicit MemoryTransaction(MemoryStore& store) : store_(store) {}

    ~MemoryTransaction() override {
        if (!committed_ && !writes_.empty()) {
            debug() << "[MemoryStore] rolled back transaction with "
                    << writes_.size() << " staged writes";
        }
    }

    Record retrieve_by_id(const std::string& scope, const std::string& id) override {
        auto key = MemoryStore::Key(scope, id);
        auto staged = writes_.find(key);
        if (staged != writes_.end()) {
            if (staged->second.erase) {
                throw NotFoundError("record not found: " + describe_key(scope, id));
            }
            return staged->second.record;
        }

        auto found = store_.lookup(scope, id);
        note_read(key, found ? found->version : 0);
        if (!found) {
            throw NotFoundError("record not found: " + describe_key(scope, id));
        }
        return *found;
    }

    Record retrieve_by_tag_filter(const std::string& scope, const TagFilter& filter) override {
        auto matches = query(scope, filter);
        if (matches.size() != 1) {
            std::ostringstream oss;
            oss << "expected exactly one " << scope << " record matching filter, found "
                << matches.size();
            throw NotFoundError(oss.str());
        }
        return std::move(matches.front());
    }

    std::vector<Record> query(const std::string& scope, const TagFilter& filter) override {
        std::map<std::string, Record> merged;
        for (auto& r : store_.select(scope, filter)) {
            note_read(MemoryStore::Key(scope, r.id), r.version);
            merged.emplace(r.id, std::move(r));
        }

        // overlay staged writes of this scope
        auto lo = writes_.lower_bound(MemoryStore::Key(scope, std::string()));
        for (auto it = lo; it != writes_.end() && it->first.first == scope; ++it) {
            merged.erase(it->first.second);
            if (!it->second.erase && it->second.record.matches(filter)) {
                merged.emplace(it->first.second, it->second.record);
            }
        }

        std::vector<Record> out;
        out.reserve(merged.size());
        for (auto& [id, r] : merged) {
            out.push_back(std::move(r));
        }
        return out;
    }

    void save(const std::string& scope, Record& record) override {
        if (record.id.empty()) {
            throw StorageError("cannot save " + scope + " record without id");
        }
        auto key = MemoryStore::Key(scope, record.id);
        auto staged = writes_.find(key);
        if (staged != writes_.end()) {
            MemoryStore::Write& w = staged->second;
            if (!w.erase && record.version != w.record.version) {
                throw TransactionConflict("stale copy of " + describe_key(scope, record.id)
                                          + " saved within transaction");
            }
            record.version = w.expected_version + 1;
            w.record = record;
            w.erase = false;
            return;
        }

        MemoryStore::Write w;
        w.expected_version = record.version;
        record.version = w.expected_version + 1;
        w.record = record;
        writes_.emplace(std::move(key), std::move(w));
    }

    void remove(const std::string& scope, const Record& record) override {
        auto key = MemoryStore::Key(scope, record.id);
        auto staged = writes_.find(key);
        if (staged != writes_.end()) {
            if (staged->second.erase) {
                throw NotFoundError("record not found: " + describe_key(scope, record.id));
            }
            if (staged->second.expected_version == 0) {
                // inserted by this transaction, never committed
                writes_.erase(staged);
                return;
            }
            staged->second.erase = true;
            return;
        }

        if (record.version == 0) {
            throw NotFoundError("record not found: " + describe_key(scope, record.id));
        }
        MemoryStore::Write w;
        w.record = record;
        w.erase = true;
        w.expected_version = record.version;
        writes_.emplace(std::move(key), std::move(w));
    }

    void commit() override {
        if (committed_) {
            throw StorageError("transaction already committed");
        }
        store_.apply(reads_, writes_);
        committed_ = true;
        trace() << "[MemoryStore] committed " << writes_.size() << " writes, "
                << reads_.size() << " reads validated";
    }

    void validate() override {
        store_.validate(reads_);
    }

    bool committed() const override { return committed_; }

private:
    void note_read(const MemoryStore::Key& key, uint64_t version) {
        reads_.emplace(key, version);   // keeps the first observed version
    }

    MemoryStore& store_;
    std::map<MemoryStore::Key, uint64_t> reads_;
    std::map<MemoryStore::Key, MemoryStore::Write> writes_;
    bool committed_ = false;
};

// ============================================================================
// Auto-commit session
// ============================================================================

class MemorySession final : public Session {
public:
    explicit MemorySession(MemoryStore& store) : store_(store) {}

    Record retrieve_by_id(const std::string& scope, const std::string& id) override {
        auto found = store_.lookup(scope, id);
        if (!found) {
            throw NotFoundError("record not found: " + describe_key(scope, id));
        }
        return *found;
    }

    Record retrieve_by_tag_filter(const std::string& scope, const TagFilter& filter) override {
        auto matches = store_.select(scope, filter);
        if (matches.size() != 1) {
            std::ostringstream oss;
            oss << "expected exactly one " << scope << " record matching filter, found "
                << matches.size();
            throw NotFoundError(oss.str());
        }
        return std::move(matches.front());
    }

    std::vector<Record> query(const std::string& scope, const TagFilter& filter) override {
        return store_.select(scope, filter);
    }

    void save(const std::string& scope, Record& record) override {
        if (record.id.empty()) {
            throw StorageError("cannot save " + scope + " record without id");
        }
        std::map<MemoryStore::Key, MemoryStore::Write> writes;
        MemoryStore::Write w;
        w.expected_version = record.version;
        w.record = record;
        w.record.version = record.version + 1;
        writes.emplace(MemoryStore::Key(scope, record.id), w);
        store_.apply({}, writes);
        record.version = w.record.version;
    }

    void remove(const std::string& scope, const Record& record) override {
        if (record.version == 0) {
            throw NotFoundError("record not found: " + describe_key(scope, record.id));
        }
        std::map<MemoryStore::Key, MemoryStore::Write> writes;
        MemoryStore::Write w;
        w.record = record;
        w.erase = true;
        w.expected_version = record.version;
        writes.emplace(MemoryStore::Key(scope, record.id), std::move(w));
        store_.apply({}, writes);
    }

private:
    MemoryStore& store_;
};

// ============================================================================
// MemoryStore
// ============================================================================

std::unique_ptr<Session> MemoryStore::session() {
    return std::make_unique<MemorySession>(*this);
}

std::unique_ptr<Transaction> MemoryStore::transaction() {
    return std::make_unique<MemoryTransaction>(*this);
}

std::string MemoryStore::index_key(const std::string& tag, const std::string& value) {
    std::string k;
    k.reserve(tag.size() + value.size() + 1);
    k.append(tag);
    k.push_back('\0');
    k.append(value);
    return k;
}

void MemoryStore::index_add(Table& t, const Record& r) {
    for (const auto& [tag, value] : r.tags) {
        t.index[index_key(tag, value)].insert(r.id);
    }
}

void MemoryStore::index_remove(Table& t, const Record& r) {
    for (const auto& [tag, value] : r.tags) {
        auto it = t.index.find(index_key(tag, value));
        if (it == t.index.end()) continue;
        it->second.erase(r.id);
        if (it->second.empty()) {
            t.index.erase(it);
        }
    }
}

std::optional<Record> MemoryStore::lookup(const std::string& scope, const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto t = tables_.find(scope);
    if (t == tables_.end()) {
        return std::nullopt;
    }
    auto r = t->second.rows.find(id);
    if (r == t->second.rows.end()) {
        return std::nullopt;
    }
    return r->second;
}

std::vector<Record> MemoryStore::select(const std::string& scope, const TagFilter& filter) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Record> out;

    auto t = tables_.find(scope);
    if (t == tables_.end()) {
        return out;
    }
    const Table& table = t->second;

    if (filter.empty()) {
        out.reserve(table.rows.size());
        for (const auto& [id, r] : table.rows) {
            out.push_back(r);
        }
        return out;
    }

    // drive the scan from the smallest posting list
    const std::set<std::string>* best = nullptr;
    for (const auto& [tag, value] : filter) {
        auto it = table.index.find(index_key(tag, value));
        if (it == table.index.end()) {
            return out;
        }
        if (!best || it->second.size() < best->size()) {
            best = &it->second;
        }
    }

    for (const auto& id : *best) {
        const Record& r = table.rows.at(id);
        if (r.matches(filter)) {
            out.push_back(r);
        }
    }
    return out;
}

uint64_t MemoryStore::current_version(const Key& key) const {
    auto t = tables_.find(key.first);
    if (t == tables_.end()) return 0;
    auto r = t->second.rows.find(key.second);
    return r == t->second.rows.end() ? 0 : r->second.version;
}

void MemoryStore::check_reads(const std::map<Key, uint64_t>& reads) {
    for (const auto& [key, version] : reads) {
        if (current_version(key) != version) {
            conflicts_.fetch_add(1, std::memory_order_relaxed);
            throw TransactionConflict("concurrent modification of " + describe_key(key.first, key.second));
        }
    }
}

void MemoryStore::validate(const std::map<Key, uint64_t>& reads) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    check_reads(reads);
}

void MemoryStore::apply(const std::map<Key, uint64_t>& reads, const std::map<Key, Write>& writes) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    check_reads(reads);
    for (const auto& [key, w] : writes) {
        if (current_version(key) != w.expected_version) {
            conflicts_.fetch_add(1, std::memory_order_relaxed);
            throw TransactionConflict(w.expected_version == 0
                ? "record already exists: " + describe_key(key.first, key.second)
                : "concurrent modification of " + describe_key(key.first, key.second));
        }
    }

    for (const auto& [key, w] : writes) {
        Table& table = tables_[key.first];
        auto existing = table.rows.find(key.second);
        if (existing != table.rows.end()) {
            index_remove(table, existing->second);
            table.rows.erase(existing);
        }
        if (!w.erase) {
            Record r = w.record;
            r.version = w.expected_version + 1;
            index_add(table, r);
            table.rows.emplace(key.second, std::move(r));
        }
    }
    commits_.fetch_add(1, std::memory_order_relaxed);
}

size_t MemoryStore::record_count(const std::string& scope) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto t = tables_.find(scope);
    return t == tables_.end() ? 0 : t->second.rows.size();
}

MemoryStore::Stats MemoryStore::stats() const {
    Stats s;
    s.commits = commits_.load(std::memory_order_relaxed);
    s.conflicts = conflicts_.load(std::memory_order_relaxed);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [scope, table] : tables_) {
        s.records += table.rows.size();
    }
    return s;
}

// ============================================================================
// Snapshots
// ============================================================================

std::string MemoryStore::snapshot_path(const std::string& data_dir) {
    std::filesystem::path p(data_dir);
    p /= "records.json";
    return p.string();
}

void MemoryStore::save_snapshot(const std::string& data_dir) const {
    FSResult dir_res = PlatformFS::ensure_directory(data_dir);
    if (!dir_res.ok) {
        throw StorageError("cannot create snapshot directory " + data_dir + ": "
                           + errnoWithDescription(dir_res.err));
    }

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        writer.StartObject();
        writer.Key("version");
        writer.Uint(1);
        writer.Key("created_unix");
        writer.Int64(static_cast<int64_t>(std::time(nullptr)));

        writer.Key("scopes");
        writer.StartObject();
        for (const auto& [scope, table] : tables_) {
            writer.Key(scope.c_str(), static_cast<rapidjson::SizeType>(scope.size()));
            writer.StartArray();
            for (const auto& [id, r] : table.rows) {
                writer.StartObject();
                writer.Key("id");
                writer.String(r.id.c_str(), static_cast<rapidjson::SizeType>(r.id.size()));
                writer.Key("version");
                writer.Uint64(r.version);
                writer.Key("tags");
                writer.StartObject();
                for (const auto& [tag, value] : r.tags) {
                    writer.Key(tag.c_str(), static_cast<rapidjson::SizeType>(tag.size()));
                    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
                }
                writer.EndObject();
                writer.Key("value");
                writer.String(r.value.c_str(), static_cast<rapidjson::SizeType>(r.value.size()));
                writer.EndObject();
            }
            writer.EndArray();
        }
        writer.EndObject();
        writer.EndObject();
    }

    std::string path = snapshot_path(data_dir);
    FSResult res = PlatformFS::write_file_atomic(path,
        std::string_view(buffer.GetString(), buffer.GetSize()));
    if (!res.ok) {
        throw StorageError("failed to write snapshot " + path + ": " + errnoWithDescription(res.err));
    }
    info() << "[MemoryStore] snapshot written to " << path;
}

bool MemoryStore::load_snapshot(const std::string& data_dir) {
    std::string path = snapshot_path(data_dir);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream contents;
    contents << file.rdbuf();
    std::string json_str = contents.str();

    rapidjson::Document doc;
    doc.Parse(json_str.c_str(), json_str.size());
    if (doc.HasParseError()) {
        std::ostringstream oss;
        oss << "snapshot " << path << " parse error at offset " << doc.GetErrorOffset()
            << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        throw StorageError(oss.str());
    }
    if (!doc.IsObject() || !doc.HasMember("scopes") || !doc["scopes"].IsObject()) {
        throw StorageError("snapshot " + path + " has no scopes object");
    }

    std::unordered_map<std::string, Table> tables;
    for (auto s = doc["scopes"].MemberBegin(); s != doc["scopes"].MemberEnd(); ++s) {
        if (!s->value.IsArray()) {
            throw StorageError("snapshot scope is not an array: " + std::string(s->name.GetString()));
        }
        Table& table = tables[s->name.GetString()];
        for (const auto& obj : s->value.GetArray()) {
            if (!obj.IsObject() || !obj.HasMember("id") || !obj["id"].IsString()
                || !obj.HasMember("value") || !obj["value"].IsString()) {
                throw StorageError("malformed record in snapshot " + path);
            }
            Record r;
            r.id = obj["id"].GetString();
            r.value.assign(obj["value"].GetString(), obj["value"].GetStringLength());
            r.version = (obj.HasMember("version") && obj["version"].IsUint64())
                ? obj["version"].GetUint64() : 1;
            if (obj.HasMember("tags") && obj["tags"].IsObject()) {
                for (auto t = obj["tags"].MemberBegin(); t != obj["tags"].MemberEnd(); ++t) {
                    if (t->value.IsString()) {
                        r.tags[t->name.GetString()] = t->value.GetString();
                    }
                }
            }
            index_add(table, r);
            table.rows.emplace(r.id, std::move(r));
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    tables_ = std::move(tables);
    info() << "[MemoryStore] snapshot loaded from " << path;
    return true;
}

} // namespace persist
} // namespace statuslist
