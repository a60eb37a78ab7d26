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
#include "common/Pattern.hpp"
#include <bitset>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <spdlog/spdlog.h>

namespace zmem {

namespace {

using ByteSet = std::bitset<256>;

ByteSet single(unsigned char c) {
    ByteSet s;
    s.set(c);
    return s;
}

// Reads one (possibly escaped) class member starting at i.
std::optional<std::pair<unsigned char, std::size_t>> classChar(std::string_view glob, std::size_t i) {
    if (i >= glob.size()) {
        return std::nullopt;
    }
    if (glob[i] == '\\' && i + 1 < glob.size()) {
        return std::make_pair(static_cast<unsigned char>(glob[i + 1]), i + 2);
    }
    return std::make_pair(static_cast<unsigned char>(glob[i]), i + 1);
}

// Reads the class opening at glob[start] == '['. Returns the accepted bytes
// and the index just past the closing bracket, or nullopt when the class is
// unterminated or empty.
std::optional<std::pair<ByteSet, std::size_t>> readClass(std::string_view glob, std::size_t start) {
    auto i = start + 1;
    bool negate = false;
    if (i < glob.size() && glob[i] == '^') {
        negate = true;
        ++i;
    }
    ByteSet accepts;
    bool any = false;
    while (i < glob.size() && glob[i] != ']') {
        auto lo = classChar(glob, i);
        if (!lo) {
            return std::nullopt;
        }
        i = lo->second;
        unsigned lower = lo->first;
        unsigned upper = lo->first;
        if (i + 1 < glob.size() && glob[i] == '-' && glob[i + 1] != ']') {
            auto hi = classChar(glob, i + 1);
            if (!hi) {
                return std::nullopt;
            }
            i = hi->second;
            upper = hi->first;
            if (lower > upper) {
                std::swap(lower, upper);
            }
        }
        for (auto c = lower; c <= upper; ++c) {
            accepts.set(c);
        }
        any = true;
    }
    if (i >= glob.size() || !any) {
        return std::nullopt;
    }
    if (negate) {
        accepts.flip();
    }
    return std::make_pair(accepts, i + 1);
}

} // namespace

Pattern::Pattern(std::string glob) : source {std::move(glob)}, tokens {}, literalBrackets {false} {
    const std::string_view g {source};
    std::size_t i = 0;
    while (i < g.size()) {
        switch (g[i]) {
            case '*':
                // consecutive stars collapse into one run
                if (tokens.empty() || !tokens.back().run) {
                    tokens.push_back(Token {true, {}});
                }
                ++i;
                break;
            case '?':
                tokens.push_back(Token {false, ByteSet {}.set()});
                ++i;
                break;
            case '\\':
                if (i + 1 < g.size()) {
                    tokens.push_back(Token {false, single(static_cast<unsigned char>(g[i + 1]))});
                    i += 2;
                } else {
                    tokens.push_back(Token {false, single('\\')});
                    ++i;
                }
                break;
            case '[':
                if (auto cls = readClass(g, i)) {
                    tokens.push_back(Token {false, cls->first});
                    i = cls->second;
                } else {
                    literalBrackets = true;
                    tokens.push_back(Token {false, single('[')});
                    ++i;
                }
                break;
            default:
                tokens.push_back(Token {false, single(static_cast<unsigned char>(g[i]))});
                ++i;
        }
    }
    if (literalBrackets) {
        spdlog::warn("Pattern: malformed class in '{}', matching '[' literally", source);
    }
}

bool Pattern::matches(std::string_view key) const {
    constexpr auto none = static_cast<std::size_t>(-1);
    std::size_t t = 0;
    std::size_t k = 0;
    // Most recent run and the key position it currently stops at. On a
    // mismatch the run swallows one more byte and matching resumes after it.
    std::size_t runToken = none;
    std::size_t runKey = 0;
    while (k < key.size()) {
        if (t < tokens.size() && tokens[t].run) {
            runToken = t++;
            runKey = k;
            continue;
        }
        if (t < tokens.size() && tokens[t].accepts.test(static_cast<unsigned char>(key[k]))) {
            ++t;
            ++k;
            continue;
        }
        if (runToken == none) {
            return false;
        }
        t = runToken + 1;
        k = ++runKey;
    }
    while (t < tokens.size() && tokens[t].run) {
        ++t;
    }
    return t == tokens.size();
}

const std::string& Pattern::glob() const {
    return source;
}

bool Pattern::degraded() const {
    return literalBrackets;
}

} // namespace zmem
