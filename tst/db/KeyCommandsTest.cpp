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
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>
#include "common/Args.hpp"
#include "common/Config.hpp"
#include "common/Error.hpp"
#include "db/Database.hpp"
#include "storage/KeySpace.hpp"
#include "storage/Values.hpp"

using zmem::argList;
using zmem::Config;
using zmem::Database;
using zmem::ErrorCode;
using zmem::KeySpace;
using zmem::ListValue;

class KeyCommandsTest : public ::testing::Test {
protected:
    Database db;
};

TEST_F(KeyCommandsTest, ExistsReflectsWrites) {
    EXPECT_FALSE(db.exists("a"));
    ASSERT_TRUE(db.set("a", "1").has_value());
    EXPECT_TRUE(db.exists("a"));
}

TEST_F(KeyCommandsTest, DeleteCountsOnlyExistingKeys) {
    ASSERT_TRUE(db.set("a", "1").has_value());
    EXPECT_EQ(db.del(argList("a", "b")), 1);
    EXPECT_FALSE(db.exists("a"));
    EXPECT_EQ(db.del(argList("a")), 0);
}

TEST_F(KeyCommandsTest, DeleteRemovesEveryKind) {
    ASSERT_TRUE(db.set("s", "v").has_value());
    ASSERT_TRUE(db.rpush("l", argList("x")).has_value());
    ASSERT_TRUE(db.hset("h", argList("f", "v")).has_value());
    ASSERT_TRUE(db.sadd("st", argList("m")).has_value());
    ASSERT_TRUE(db.zadd("z", argList(1, "m")).has_value());
    EXPECT_EQ(db.del(argList("s", "l", "h", "st", "z", "nope")), 5);
    EXPECT_EQ(db.dbsize(), 0);
}

TEST_F(KeyCommandsTest, DeleteWithoutKeysThrows) {
    EXPECT_THROW(db.del({}), std::invalid_argument);
}

TEST_F(KeyCommandsTest, KeysFiltersAndSorts) {
    for (const auto* k : {"user:2", "user:10", "account:42", "user:1"}) {
        ASSERT_TRUE(db.set(k, "x").has_value());
    }
    auto r = db.keys("user:*");
    ASSERT_TRUE(r.has_value());
    const std::vector<std::string> expected {"user:1", "user:10", "user:2"};
    EXPECT_EQ(r.value(), expected);

    auto all = db.keys("*");
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->size(), 4);

    auto none = db.keys("nothing*");
    ASSERT_TRUE(none.has_value());
    EXPECT_TRUE(none->empty());
}

TEST_F(KeyCommandsTest, KeysSingleCharacterWildcard) {
    for (const auto* k : {"abc", "ac", "abbc"}) {
        ASSERT_TRUE(db.set(k, "x").has_value());
    }
    auto r = db.keys("a?c");
    ASSERT_TRUE(r.has_value());
    const std::vector<std::string> expected {"abc"};
    EXPECT_EQ(r.value(), expected);
}

TEST_F(KeyCommandsTest, KeysHandlesVeryLongKeys) {
    const std::string longKey(200000, 'k');
    ASSERT_TRUE(db.set(longKey, "v").has_value());
    ASSERT_TRUE(db.set("short", "v").has_value());
    auto r = db.keys("*");
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->size(), 2);
    EXPECT_EQ(r->front(), longKey);
    EXPECT_EQ(db.keys("k*k")->size(), 1);
}

TEST_F(KeyCommandsTest, KeysWithManyStarsFinishesQuickly) {
    ASSERT_TRUE(db.set(std::string(30, 'a'), "v").has_value());
    const auto start = std::chrono::steady_clock::now();
    auto r = db.keys("*a*a*a*a*a*a*a*a*a*a*a*b");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->empty());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(100));
}

TEST(KeyCommandsConfigTest, UnsortedKeysStillMatch) {
    Database db {Config {false, 64}};
    ASSERT_TRUE(db.set("b", "1").has_value());
    ASSERT_TRUE(db.set("a", "1").has_value());
    auto r = db.keys("*");
    ASSERT_TRUE(r.has_value());
    auto names = r.value();
    std::ranges::sort(names);
    const std::vector<std::string> expected {"a", "b"};
    EXPECT_EQ(names, expected);
}

TEST(KeyCommandsConfigTest, PatternTooLongIsRejected) {
    Database db {Config {true, 4}};
    auto r = db.keys("abcde");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArg);
    EXPECT_TRUE(db.keys("abcd").has_value());
}

TEST_F(KeyCommandsTest, TypeNamesKinds) {
    ASSERT_TRUE(db.set("s", "v").has_value());
    ASSERT_TRUE(db.lpush("l", argList("x")).has_value());
    ASSERT_TRUE(db.hset("h", argList("f", "v")).has_value());
    ASSERT_TRUE(db.sadd("st", argList("m")).has_value());
    ASSERT_TRUE(db.zadd("z", argList(1, "m")).has_value());
    EXPECT_EQ(db.type("s"), "string");
    EXPECT_EQ(db.type("l"), "list");
    EXPECT_EQ(db.type("h"), "hash");
    EXPECT_EQ(db.type("st"), "set");
    EXPECT_EQ(db.type("z"), "zset");
    EXPECT_EQ(db.type("missing"), "none");
}

TEST_F(KeyCommandsTest, NumericKeysAreNormalized) {
    ASSERT_TRUE(db.set(7, "seven").has_value());
    EXPECT_TRUE(db.exists("7"));
    EXPECT_TRUE(db.exists(7.0));
}

TEST_F(KeyCommandsTest, NilKeyThrows) {
    EXPECT_THROW(db.exists(zmem::Arg{}), std::invalid_argument);
}

TEST_F(KeyCommandsTest, FlushAndSize) {
    ASSERT_TRUE(db.set("a", "1").has_value());
    ASSERT_TRUE(db.set("b", "1").has_value());
    EXPECT_EQ(db.dbsize(), 2);
    db.flushdb();
    EXPECT_EQ(db.dbsize(), 0);
    EXPECT_FALSE(db.exists("a"));
}

TEST_F(KeyCommandsTest, TransactionRunsExternalCommandBody) {
    // a command body that lives outside Database
    ASSERT_TRUE(db.rpush("l", argList("a", "b", "c")).has_value());
    const auto popped = db.transaction([](KeySpace& ks) {
        auto w = ks.write<ListValue>("l");
        if (!w.has_value()) {
            return 0;
        }
        int n = 0;
        while (w->get().popBack()) {
            ++n;
        }
        ks.cleanup("l");
        return n;
    });
    EXPECT_EQ(popped, 3);
    EXPECT_FALSE(db.exists("l"));
}
