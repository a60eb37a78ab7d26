// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * ZMEM an in-process, multi-type key-value store.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>

namespace zmem {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::WrongType: return "WrongType";
        case ErrorCode::NotInteger: return "NotInteger";
        case ErrorCode::NotFloat: return "NotFloat";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

std::string defaultMessage(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::WrongType: return "WRONGTYPE Operation against a key holding the wrong kind of value";
        case ErrorCode::NotInteger: return "ERR value is not an integer or out of range";
        case ErrorCode::NotFloat: return "ERR value is not a valid float";
        case ErrorCode::InvalidArg: return "ERR invalid argument";
        default: return "ERR " + toString(code);
    }
}

Error::Error(const ErrorCode& c, std::string w, std::string k) : code {c}, what {std::move(w)}, key {std::move(k)} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, key{} {}
Error::Error(const ErrorCode& c) : code {c}, what {defaultMessage(c)}, key{} {}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << error.code << ": " << error.what;
    if (!error.key.empty()) {
        os << " (key: " << error.key << ")";
    }
    return os;
}

} // namespace zmem
