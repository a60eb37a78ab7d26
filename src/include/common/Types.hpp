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
#ifndef ZMEM_COMMON_TYPES_HPP
#define ZMEM_COMMON_TYPES_HPP

#include <string>
#include <cstdint>
#include <ostream>
#include <variant>

namespace zmem {

// Scalar argument as handed over by a host. std::monostate stands for a
// missing (nil) argument.
using Arg = std::variant<
    std::monostate,
    std::int64_t,
    double,
    std::string
>;

// Alternatives are listed in the same order as in storage::Value.
enum class Kind {
    String = 0,
    List = 1,
    Hash = 2,
    Set = 3,
    ZSet = 4
};

std::string toString(const Kind& kind);

std::ostream& operator<<(std::ostream& os, const Kind& kind);

bool isNil(const Arg& arg);

} // namespace zmem

#endif // ZMEM_COMMON_TYPES_HPP
