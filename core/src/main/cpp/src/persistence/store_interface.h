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
#include <memory>
#include <string>
#include <vector>
#include "record.h"

namespace statuslist {
    namespace persist {

        /**
         * Read/write view of a record store.
         *
         * Every operation may raise StorageError. Lookups that must find
         * exactly one record raise NotFoundError otherwise.
         */
        class Session {
        public:
            virtual ~Session() = default;

            // NotFoundError if no record has this id in scope
            virtual Record retrieve_by_id(const std::string& scope, const std::string& id) = 0;

            // NotFoundError unless exactly one record matches
            virtual Record retrieve_by_tag_filter(const std::string& scope, const TagFilter& filter) = 0;

            // All records in scope matching filter (empty filter = all), ordered by id
            virtual std::vector<Record> query(const std::string& scope, const TagFilter& filter) = 0;

            // Insert (record.version == 0) or update; record.version is advanced on success
            virtual void save(const std::string& scope, Record& record) = 0;

            // NotFoundError if the record does not exist
            virtual void remove(const std::string& scope, const Record& record) = 0;
        };

        /**
         * A session whose writes become visible only on commit().
         * Destroying an uncommitted transaction discards its writes.
         */
        class Transaction : public Session {
        public:
            // TransactionConflict if another writer changed a record this transaction used
            virtual void commit() = 0;
            virtual bool committed() const = 0;

            // TransactionConflict if a record read so far has changed since; writes are not checked
            virtual void validate() = 0;
        };

        class RecordStore {
        public:
            virtual ~RecordStore() = default;

            // Auto-committing session: each save/remove is applied immediately
            virtual std::unique_ptr<Session> session() = 0;

            virtual std::unique_ptr<Transaction> transaction() = 0;
        };

    } // namespace persist
} // namespace statuslist
