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
#include "common/Types.hpp"
#include <string>
#include <ostream>
#include <utility>
#include <variant>

namespace zmem {

std::string toString(const Kind& kind) {
    switch (kind)
    {
        case Kind::String: return "string";
        case Kind::List: return "list";
        case Kind::Hash: return "hash";
        case Kind::Set: return "set";
        case Kind::ZSet: return "zset";
    }
    std::unreachable();
}

std::ostream& operator<<(std::ostream& os, const Kind& kind) {
    os << toString(kind);
    return os;
}

bool isNil(const Arg& arg) {
    return std::holds_alternative<std::monostate>(arg);
}

} // namespace zmem
