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
#include "common/Args.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include "common/Coercion.hpp"

namespace zmem {

std::string normalizeArg(const Arg& x) {
    if (isNil(x)) {
        throw std::invalid_argument("normalizeArg: argument must be a string or a number");
    }
    return toDisplayString(x);
}

std::vector<std::string> normalizeArgs(const std::vector<Arg>& args) {
    if (args.empty()) {
        throw std::invalid_argument("normalizeArgs: at least one argument is required");
    }
    std::vector<std::string> result;
    result.reserve(args.size());
    for (const auto& arg : args) {
        result.push_back(normalizeArg(arg));
    }
    return result;
}

std::vector<std::string> normalizeArgsExact(std::size_t n, const std::vector<Arg>& args) {
    if (args.size() != n) {
        throw std::invalid_argument("normalizeArgsExact: expected " + std::to_string(n) +
            " arguments, got " + std::to_string(args.size()));
    }
    return normalizeArgs(args);
}

std::unordered_map<std::string, std::string> normalizeArgsAsMap(const std::vector<Arg>& args) {
    auto flat = normalizeArgs(args);
    if (flat.size() % 2 != 0) {
        throw std::invalid_argument("normalizeArgsAsMap: odd number of arguments");
    }
    std::unordered_map<std::string, std::string> result;
    for (std::size_t i = 0; i < flat.size(); i += 2) {
        result.insert_or_assign(std::move(flat[i]), std::move(flat[i + 1]));
    }
    return result;
}

} // namespace zmem
