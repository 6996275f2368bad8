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
#include <exception>
#include <stdexcept>
#include <string>

namespace statuslist {

    enum class ErrorKind {
        NotFound,
        Validation,
        Conflict,
        Storage,
        Signing,
        Sink
    };

    /**
     * Base of every error raised by the status list engine.
     * status_code() is the HTTP-equivalent a boundary layer should map to.
     */
    class StatusListError : public std::runtime_error {
    public:
        StatusListError(ErrorKind kind, const std::string& what)
            : std::runtime_error(what), kind_(kind) {}

        ErrorKind kind() const noexcept { return kind_; }

        int status_code() const noexcept {
            return kind_ == ErrorKind::NotFound ? 404 : 400;
        }

    private:
        ErrorKind kind_;
    };

    class NotFoundError : public StatusListError {
    public:
        explicit NotFoundError(const std::string& what)
            : StatusListError(ErrorKind::NotFound, what) {}
    };

    class ValidationError : public StatusListError {
    public:
        explicit ValidationError(const std::string& what)
            : StatusListError(ErrorKind::Validation, what) {}
    };

    // Deletion blocked by existing dependents
    class ConflictError : public StatusListError {
    public:
        explicit ConflictError(const std::string& what)
            : StatusListError(ErrorKind::Conflict, what) {}
    };

    class StorageError : public StatusListError {
    public:
        explicit StorageError(const std::string& what)
            : StatusListError(ErrorKind::Storage, what) {}
    };

    /**
     * Raised by Transaction::commit() when a record read or written by the
     * transaction was changed by another writer after it was read.
     */
    class TransactionConflict : public StorageError {
    public:
        explicit TransactionConflict(const std::string& what)
            : StorageError(what) {}
    };

    class SigningError : public StatusListError {
    public:
        explicit SigningError(const std::string& what)
            : StatusListError(ErrorKind::Signing, what) {}
    };

    class SinkError : public StatusListError {
    public:
        explicit SinkError(const std::string& what)
            : StatusListError(ErrorKind::Sink, what) {}
    };

    // Flattens a nested exception chain into "outer: inner: ..."
    inline std::string describe(const std::exception& e) {
        std::string msg = e.what();
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& inner) {
            msg += ": " + describe(inner);
        } catch (...) {
            msg += ": unknown error";
        }
        return msg;
    }

} // namespace statuslist
