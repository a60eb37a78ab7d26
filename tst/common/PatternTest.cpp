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
#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>
#include "common/Pattern.hpp"

using zmem::Pattern;

TEST(PatternTest, PrefixWildcard) {
    const Pattern p {"user:*"};
    EXPECT_TRUE(p.matches("user:42"));
    EXPECT_TRUE(p.matches("user:"));
    EXPECT_FALSE(p.matches("account:42"));
    EXPECT_FALSE(p.matches("xuser:42"));
}

TEST(PatternTest, SingleCharacterWildcard) {
    const Pattern p {"a?c"};
    EXPECT_TRUE(p.matches("abc"));
    EXPECT_TRUE(p.matches("a-c"));
    EXPECT_FALSE(p.matches("ac"));
    EXPECT_FALSE(p.matches("abbc"));
}

TEST(PatternTest, StarMatchesEverythingIncludingNewlines) {
    const Pattern p {"*"};
    EXPECT_TRUE(p.matches(""));
    EXPECT_TRUE(p.matches("plain"));
    EXPECT_TRUE(p.matches("multi\nline"));
}

TEST(PatternTest, CharacterClasses) {
    const Pattern set {"h[ae]llo"};
    EXPECT_TRUE(set.matches("hello"));
    EXPECT_TRUE(set.matches("hallo"));
    EXPECT_FALSE(set.matches("hillo"));

    const Pattern negated {"h[^e]llo"};
    EXPECT_TRUE(negated.matches("hallo"));
    EXPECT_FALSE(negated.matches("hello"));

    const Pattern range {"h[a-b]llo"};
    EXPECT_TRUE(range.matches("hallo"));
    EXPECT_TRUE(range.matches("hbllo"));
    EXPECT_FALSE(range.matches("hcllo"));
}

TEST(PatternTest, ReversedRangeIsNormalized) {
    const Pattern p {"h[b-a]llo"};
    EXPECT_FALSE(p.degraded());
    EXPECT_TRUE(p.matches("hallo"));
    EXPECT_TRUE(p.matches("hbllo"));
}

TEST(PatternTest, ClassContentsAreLiteral) {
    const Pattern dot {"[.]"};
    EXPECT_TRUE(dot.matches("."));
    EXPECT_FALSE(dot.matches("a"));

    const Pattern bracket {"[\\]]"};
    EXPECT_TRUE(bracket.matches("]"));
}

TEST(PatternTest, EscapedWildcardsAreLiteral) {
    const Pattern p {"h\\*llo"};
    EXPECT_TRUE(p.matches("h*llo"));
    EXPECT_FALSE(p.matches("hello"));

    const Pattern q {"what\\?"};
    EXPECT_TRUE(q.matches("what?"));
    EXPECT_FALSE(q.matches("whats"));
}

TEST(PatternTest, MatcherSpecialCharactersAreLiteral) {
    for (const std::string s : {"a.b", "a-b", "50%", "(x)|y", "a+", "^start$", "{1,2}", "a/b"}) {
        const Pattern p {s};
        EXPECT_TRUE(p.matches(s)) << s;
    }
    EXPECT_FALSE(Pattern {"a.b"}.matches("axb"));
    EXPECT_FALSE(Pattern {"a+"}.matches("aa"));
}

TEST(PatternTest, UnterminatedClassIsLiteral) {
    const Pattern p {"a[bc"};
    EXPECT_TRUE(p.degraded());
    EXPECT_TRUE(p.matches("a[bc"));
    EXPECT_FALSE(p.matches("ab"));
}

TEST(PatternTest, EmptyClassIsLiteral) {
    const Pattern p {"x[]"};
    EXPECT_TRUE(p.matches("x[]"));
    EXPECT_FALSE(p.matches("x"));
}

TEST(PatternTest, TrailingBackslashIsLiteral) {
    const Pattern p {"ab\\"};
    EXPECT_TRUE(p.matches("ab\\"));
    EXPECT_FALSE(p.matches("ab"));
}

TEST(PatternTest, CompiledOnceMatchedMany) {
    const Pattern p {"k?:*"};
    const std::vector<std::string> keys {"k1:a", "k2:", "k:x", "k12:b", "kk:zz"};
    std::vector<std::string> hits;
    for (const auto& k : keys) {
        if (p.matches(k)) {
            hits.push_back(k);
        }
    }
    const std::vector<std::string> expected {"k1:a", "k2:", "kk:zz"};
    EXPECT_EQ(hits, expected);
    EXPECT_EQ(p.glob(), "k?:*");
}

TEST(PatternTest, StarMatchesVeryLongKeys) {
    const std::string key(200000, 'k');
    EXPECT_TRUE(Pattern {"*"}.matches(key));
    EXPECT_TRUE(Pattern {"k*k"}.matches(key));
    EXPECT_FALSE(Pattern {"*x"}.matches(key));
}

TEST(PatternTest, ManyStarsDoNotBacktrackExponentially) {
    const Pattern p {"*a*a*a*a*a*a*a*a*a*a*a*b"};
    const std::string key(30, 'a');
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(p.matches(key));
    EXPECT_TRUE(p.matches(key + "b"));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(100));
}

TEST(PatternTest, HighByteRanges) {
    const Pattern p {"k[a-\xe9]"};
    EXPECT_FALSE(p.degraded());
    EXPECT_TRUE(p.matches("kb"));
    EXPECT_TRUE(p.matches("k\xe0"));
    EXPECT_TRUE(p.matches("k\xe9"));
    EXPECT_FALSE(p.matches("k\xf0"));
    EXPECT_FALSE(p.matches("kA"));

    const Pattern reversed {"[\xff-\x80]"};
    EXPECT_TRUE(reversed.matches("\x80"));
    EXPECT_TRUE(reversed.matches("\xc3"));
    EXPECT_FALSE(reversed.matches("a"));
}

TEST(PatternTest, BinaryKeys) {
    const std::string key {"a\0b", 3};
    EXPECT_TRUE(Pattern {"a?b"}.matches(key));
    EXPECT_TRUE(Pattern {"a*"}.matches(key));
    EXPECT_FALSE(Pattern {"a"}.matches(key));
}
