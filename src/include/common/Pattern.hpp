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
#ifndef ZMEM_COMMON_PATTERN_HPP
#define ZMEM_COMMON_PATTERN_HPP

#include <bitset>
#include <string>
#include <string_view>
#include <vector>

namespace zmem {

/*
 * Glob syntax used for key enumeration:
 *   *      any run of bytes, including the empty one
 *   ?      exactly one byte
 *   [...]  byte class, [^...] negates it, a-z ranges (z-a is read as a-z)
 *   \x     the literal byte x
 * An unterminated or empty class is taken literally. Everything else matches
 * itself. Keys and globs are byte strings, embedded NULs included.
 */
class Pattern {
public:
    explicit Pattern(std::string glob);
    // Worst case O(key length x glob length). Never recurses.
    bool matches(std::string_view key) const;
    const std::string& glob() const;
    // True when a malformed class in the glob was matched as literal bytes.
    bool degraded() const;
private:
    struct Token {
        // A run token stands for *, every other token consumes one byte
        // from its accepted set.
        bool run;
        std::bitset<256> accepts;
    };

    std::string source;
    std::vector<Token> tokens;
    bool literalBrackets;
};

} // namespace zmem

#endif // ZMEM_COMMON_PATTERN_HPP
