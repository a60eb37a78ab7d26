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
#include "common/Config.hpp"
#include <stdexcept>
#include <cstddef>

namespace zmem {

Config::Config() : Config(true, 4096) {}

Config::Config(bool sort, std::size_t maxPattern)
    : sortKeys(sort),
      maxPatternLength(maxPattern) {
    if (maxPattern == 0) {
        throw std::invalid_argument("Max pattern length must be > zero.");
    }
}

} // namespace zmem
