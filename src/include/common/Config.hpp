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
#ifndef ZMEM_COMMON_CONFIG_HPP
#define ZMEM_COMMON_CONFIG_HPP

#include <cstddef>

namespace zmem {

struct Config {
    Config();
    Config(bool sort, std::size_t maxPattern);
    // Return keys() results in lexicographic order.
    bool sortKeys;
    // Longest glob keys() will compile.
    std::size_t maxPatternLength;
};

} // namespace zmem

#endif // ZMEM_COMMON_CONFIG_HPP
