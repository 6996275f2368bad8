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
#include "store_interface.h"
#include <atomic>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace statuslist {
    namespace persist {

        class MemoryTransaction;
        class MemorySession;

        /**
         * In-process record store with tag indexes and optimistic concurrency.
         *
         * Transactions stage their writes privately and remember the version
         * of every record they read or write. commit() validates those
         * versions under the store lock and applies the writes atomically, so
         * two transactions racing on the same record cannot both commit.
         *
         * Thread-safety: all public methods are thread-safe; individual
         * Session/Transaction objects are not and belong to one thread.
         */
        class MemoryStore final : public RecordStore {
        public:
            struct Stats {
                uint64_t commits = 0;
                uint64_t conflicts = 0;
                uint64_t records = 0;
            };

            MemoryStore() = default;
            MemoryStore(const MemoryStore&) = delete;
            MemoryStore& operator=(const MemoryStore&) = delete;

            std::unique_ptr<Session> session() override;
            std::unique_ptr<Transaction> transaction() override;

            size_t record_count(const std::string& scope) const;
            Stats stats() const;

            /**
             * Writes every record to <data_dir>/records.json (temp + rename).
             * Raises StorageError on I/O failure.
             */
            void save_snapshot(const std::string& data_dir) const;

            /**
             * Replaces the store contents with <data_dir>/records.json.
             * @return false if no snapshot exists; StorageError if it is corrupt
             */
            bool load_snapshot(const std::string& data_dir);

            static std::string snapshot_path(const std::string& data_dir);

        private:
            friend class MemoryTransaction;
            friend class MemorySession;

            using Key = std::pair<std::string, std::string>;   // (scope, id)

            struct Write {
                Record record;
                bool erase = false;
                uint64_t expected_version = 0;   // committed version this write was based on
            };

            struct Table {
                std::map<std::string, Record> rows;                 // ordered by id
                std::map<std::string, std::set<std::string>> index; // tag '\0' value -> ids
            };

            std::optional<Record> lookup(const std::string& scope, const std::string& id) const;
            std::vector<Record> select(const std::string& scope, const TagFilter& filter) const;

            // TransactionConflict if any read no longer matches the committed version
            void validate(const std::map<Key, uint64_t>& reads);

            // Validates reads and write bases, then applies all writes. Caller must not hold mutex_.
            void apply(const std::map<Key, uint64_t>& reads, const std::map<Key, Write>& writes);

            // mutex_ held by the caller
            uint64_t current_version(const Key& key) const;
            void check_reads(const std::map<Key, uint64_t>& reads);

            static std::string index_key(const std::string& tag, const std::string& value);
            void index_add(Table& t, const Record& r);
            void index_remove(Table& t, const Record& r);

            mutable std::shared_mutex mutex_;
            std::unordered_map<std::string, Table> tables_;
            std::atomic<uint64_t> commits_{0};
            std::atomic<uint64_t> conflicts_{0};
        };

    }
}
