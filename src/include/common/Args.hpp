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
#ifndef ZMEM_COMMON_ARGS_HPP
#define ZMEM_COMMON_ARGS_HPP

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "common/Types.hpp"

namespace zmem {

/*
 * Argument normalization is the first step of every command. A malformed
 * argument list is a caller bug, so all of these throw std::invalid_argument
 * instead of returning an Error.
 */

// Numbers become their display string; nil throws.
std::string normalizeArg(const Arg& x);

// At least one argument.
std::vector<std::string> normalizeArgs(const std::vector<Arg>& args);

std::vector<std::string> normalizeArgsExact(std::size_t n, const std::vector<Arg>& args);

// Even number of arguments, paired up as key, value. Later keys win.
std::unordered_map<std::string, std::string> normalizeArgsAsMap(const std::vector<Arg>& args);

template <typename... Ts>
std::vector<Arg> argList(Ts&&... xs) {
    return std::vector<Arg>{Arg(std::forward<Ts>(xs))...};
}

} // namespace zmem

#endif // ZMEM_COMMON_ARGS_HPP
