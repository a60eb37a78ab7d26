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
#ifndef ZMEM_COMMON_COERCION_HPP
#define ZMEM_COMMON_COERCION_HPP

#include <cstdint>
#include <expected>
#include <string>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace zmem {

// Largest magnitude an integer argument may have without losing precision
// when it passes through a double.
inline constexpr std::int64_t kMaxBoundedInteger = (std::int64_t{1} << 53) - 1;

bool isBoundedInteger(std::int64_t n) noexcept;
bool isBoundedInteger(double x) noexcept;

/*
 * Numeric strings are decimal integers or decimal floating point literals,
 * optionally surrounded by ASCII whitespace. Hexadecimal, "nan" and
 * "inf"-like spellings are not numbers.
 */
std::expected<std::int64_t, Error> toInteger(const Arg& x);

// Same as toInteger, plus the tokens "inf", "+inf" and "-inf".
std::expected<double, Error> toFloat(const Arg& x);

std::string toDisplayString(const Arg& x);

// Throws std::invalid_argument unless x is an integer in [0, 255].
int countSetBits(const Arg& x);

} // namespace zmem

#endif // ZMEM_COMMON_COERCION_HPP
