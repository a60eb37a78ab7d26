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
#include <stdexcept>
#include <string>
#include <vector>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/KeySpace.hpp"
#include "storage/Values.hpp"

using zmem::ErrorCode;
using zmem::HashValue;
using zmem::KeySpace;
using zmem::Kind;
using zmem::ListValue;
using zmem::SetValue;
using zmem::StringValue;
using zmem::ZSetValue;

class KeySpaceTest : public ::testing::Test {
protected:
    KeySpace ks;
};

TEST_F(KeySpaceTest, ReadAbsentKeyReturnsDefaultWithoutCreating) {
    auto r = ks.read<ListValue>("missing");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->get().empty());
    EXPECT_FALSE(ks.contains("missing"));
    EXPECT_EQ(ks.size(), 0);
}

TEST_F(KeySpaceTest, WriteCreatesEntry) {
    auto w = ks.write<SetValue>("s");
    ASSERT_TRUE(w.has_value());
    w->get().insert("member");
    EXPECT_TRUE(ks.contains("s"));
    EXPECT_EQ(ks.kindOf("s"), Kind::Set);

    auto r = ks.read<SetValue>("s");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->get().contains("member"));
}

TEST_F(KeySpaceTest, WriteReturnsTheSameValueOnSecondCall) {
    ks.write<HashValue>("h")->get().emplace("f", "1");
    auto w = ks.write<HashValue>("h");
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(w->get().at("f"), "1");
}

TEST_F(KeySpaceTest, ReadWithWrongKindFails) {
    ks.write<StringValue>("k")->get().cell = "v";
    auto r = ks.read<ListValue>("k");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::WrongType);
    EXPECT_EQ(r.error().key, "k");
}

TEST_F(KeySpaceTest, WriteWithWrongKindFailsAndLeavesValue) {
    ks.write<StringValue>("k")->get().cell = "v";
    auto w = ks.write<ZSetValue>("k");
    ASSERT_FALSE(w.has_value());
    EXPECT_EQ(w.error().code, ErrorCode::WrongType);
    EXPECT_EQ(ks.read<StringValue>("k")->get().cell, "v");
}

TEST_F(KeySpaceTest, TypeStabilityAcrossAllKinds) {
    ks.write<ListValue>("l")->get().pushBack("x");
    EXPECT_FALSE(ks.read<StringValue>("l").has_value());
    EXPECT_FALSE(ks.read<HashValue>("l").has_value());
    EXPECT_FALSE(ks.read<SetValue>("l").has_value());
    EXPECT_FALSE(ks.read<ZSetValue>("l").has_value());
    EXPECT_FALSE(ks.write<StringValue>("l").has_value());
    EXPECT_FALSE(ks.write<HashValue>("l").has_value());
    EXPECT_FALSE(ks.write<SetValue>("l").has_value());
    EXPECT_FALSE(ks.write<ZSetValue>("l").has_value());
    EXPECT_TRUE(ks.read<ListValue>("l").has_value());
}

TEST_F(KeySpaceTest, WriteReplacesEmptyPlaceholderOfAnotherKind) {
    ASSERT_TRUE(ks.write<ListValue>("k").has_value());
    EXPECT_TRUE(ks.isEmpty("k"));
    auto w = ks.write<HashValue>("k");
    ASSERT_TRUE(w.has_value());
    w->get().emplace("f", "v");
    EXPECT_EQ(ks.kindOf("k"), Kind::Hash);
}

TEST_F(KeySpaceTest, CleanupRemovesOnlyEmptyKeys) {
    auto w = ks.write<ListValue>("l");
    w->get().pushBack("x");
    EXPECT_FALSE(ks.cleanup("l"));
    EXPECT_TRUE(ks.contains("l"));

    ks.write<ListValue>("l")->get().popBack();
    EXPECT_TRUE(ks.isEmpty("l"));
    EXPECT_TRUE(ks.cleanup("l"));
    EXPECT_FALSE(ks.contains("l"));
    EXPECT_FALSE(ks.cleanup("l"));
}

TEST_F(KeySpaceTest, IsEmptyPerKind) {
    EXPECT_TRUE(ks.isEmpty("absent"));
    ks.write<StringValue>("s")->get().cell = "";
    EXPECT_FALSE(ks.isEmpty("s"));
    ks.write<ZSetValue>("z")->get().insert("m", 1.0);
    EXPECT_FALSE(ks.isEmpty("z"));
    ks.write<ZSetValue>("z")->get().erase("m");
    EXPECT_TRUE(ks.isEmpty("z"));
}

TEST_F(KeySpaceTest, IncoherentZSetIsFatal) {
    ks.write<ZSetValue>("z")->get().scores.emplace("ghost", 1.0);
    EXPECT_THROW(ks.isEmpty("z"), std::logic_error);
    EXPECT_THROW(ks.cleanup("z"), std::logic_error);
}

TEST_F(KeySpaceTest, EraseClearAndKeyNames) {
    ks.write<StringValue>("a")->get().cell = "1";
    ks.write<StringValue>("b")->get().cell = "2";
    ks.write<SetValue>("c")->get().insert("x");
    EXPECT_EQ(ks.size(), 3);

    auto names = ks.keyNames();
    std::ranges::sort(names);
    const std::vector<std::string> expected {"a", "b", "c"};
    EXPECT_EQ(names, expected);

    EXPECT_TRUE(ks.erase("a"));
    EXPECT_FALSE(ks.erase("a"));
    EXPECT_FALSE(ks.kindOf("a").has_value());
    ks.clear();
    EXPECT_EQ(ks.size(), 0);
}
