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
#ifndef ZMEM_STORAGE_VALUES_HPP
#define ZMEM_STORAGE_VALUES_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include "common/Types.hpp"

namespace zmem {

struct StringValue {
    // An absent cell is the empty value, "" is not.
    std::optional<std::string> cell;

    bool empty() const;
};

// Double-ended list. head and tail are logical cursors: pushing to the front
// moves head down, pushing to the back moves tail up. The list is empty when
// they meet.
class ListValue {
public:
    using const_iterator = std::deque<std::string>::const_iterator;

    void pushFront(std::string v);
    void pushBack(std::string v);
    std::optional<std::string> popFront();
    std::optional<std::string> popBack();

    const std::string& at(std::size_t i) const;
    std::size_t size() const;
    bool empty() const;
    std::int64_t head() const;
    std::int64_t tail() const;

    const_iterator begin() const;
    const_iterator end() const;
private:
    std::deque<std::string> items;
    std::int64_t headCursor = 0;
    std::int64_t tailCursor = 0;
};

using HashValue = std::unordered_map<std::string, std::string>;

using SetValue = std::unordered_set<std::string>;

// Sorted set. scores maps member to score, ordered holds the same members
// sorted by (score, member). Both must always describe the same membership.
struct ZSetValue {
    std::unordered_map<std::string, double> scores;
    std::set<std::pair<double, std::string>> ordered;

    // Returns true when member was not present before.
    bool insert(const std::string& member, double score);
    bool erase(const std::string& member);
    std::optional<double> score(const std::string& member) const;
    std::size_t size() const;
    bool coherent() const;
};

using Value = std::variant<
    StringValue,
    ListValue,
    HashValue,
    SetValue,
    ZSetValue
>;

template <typename T> struct KindOf;
template <> struct KindOf<StringValue> { static constexpr Kind value = Kind::String; };
template <> struct KindOf<ListValue> { static constexpr Kind value = Kind::List; };
template <> struct KindOf<HashValue> { static constexpr Kind value = Kind::Hash; };
template <> struct KindOf<SetValue> { static constexpr Kind value = Kind::Set; };
template <> struct KindOf<ZSetValue> { static constexpr Kind value = Kind::ZSet; };

template <typename T>
inline constexpr Kind kindOf = KindOf<T>::value;

Kind kindOfValue(const Value& v);

Value defaultValue(Kind kind);

// Throws std::logic_error when a sorted set's two parts disagree.
bool isEmptyValue(const Value& v);

} // namespace zmem

#endif // ZMEM_STORAGE_VALUES_HPP
