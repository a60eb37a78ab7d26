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
#include "storage/Values.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <spdlog/spdlog.h>

namespace zmem {

bool StringValue::empty() const {
    return !cell.has_value();
}

void ListValue::pushFront(std::string v) {
    items.push_front(std::move(v));
    --headCursor;
}

void ListValue::pushBack(std::string v) {
    items.push_back(std::move(v));
    ++tailCursor;
}

std::optional<std::string> ListValue::popFront() {
    if (empty()) {
        return std::nullopt;
    }
    auto v = std::move(items.front());
    items.pop_front();
    ++headCursor;
    return v;
}

std::optional<std::string> ListValue::popBack() {
    if (empty()) {
        return std::nullopt;
    }
    auto v = std::move(items.back());
    items.pop_back();
    --tailCursor;
    return v;
}

const std::string& ListValue::at(std::size_t i) const {
    return items.at(i);
}

std::size_t ListValue::size() const {
    return static_cast<std::size_t>(tailCursor - headCursor);
}

bool ListValue::empty() const {
    return headCursor == tailCursor;
}

std::int64_t ListValue::head() const {
    return headCursor;
}

std::int64_t ListValue::tail() const {
    return tailCursor;
}

ListValue::const_iterator ListValue::begin() const {
    return items.begin();
}

ListValue::const_iterator ListValue::end() const {
    return items.end();
}

bool ZSetValue::insert(const std::string& member, double score) {
    auto i = scores.find(member);
    if (i != scores.end()) {
        if (i->second != score) {
            ordered.erase({i->second, member});
            ordered.emplace(score, member);
            i->second = score;
        }
        return false;
    }
    scores.emplace(member, score);
    ordered.emplace(score, member);
    return true;
}

bool ZSetValue::erase(const std::string& member) {
    auto i = scores.find(member);
    if (i == scores.end()) {
        return false;
    }
    ordered.erase({i->second, member});
    scores.erase(i);
    return true;
}

std::optional<double> ZSetValue::score(const std::string& member) const {
    auto i = scores.find(member);
    if (i == scores.end()) {
        return std::nullopt;
    }
    return i->second;
}

std::size_t ZSetValue::size() const {
    return scores.size();
}

bool ZSetValue::coherent() const {
    if (scores.size() != ordered.size()) {
        return false;
    }
    for (const auto& [score, member] : ordered) {
        auto i = scores.find(member);
        if (i == scores.end() || i->second != score) {
            return false;
        }
    }
    return true;
}

Kind kindOfValue(const Value& v) {
    return static_cast<Kind>(v.index());
}

Value defaultValue(Kind kind) {
    switch (kind)
    {
        case Kind::String: return Value {std::in_place_type<StringValue>};
        case Kind::List: return Value {std::in_place_type<ListValue>};
        case Kind::Hash: return Value {std::in_place_type<HashValue>};
        case Kind::Set: return Value {std::in_place_type<SetValue>};
        case Kind::ZSet: return Value {std::in_place_type<ZSetValue>};
    }
    std::unreachable();
}

bool isEmptyValue(const Value& v) {
    return std::visit([](const auto& value) -> bool {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, ZSetValue>) {
            if (value.ordered.empty() != value.scores.empty()) {
                spdlog::error("ZSetValue: incoherent sorted set ({} scores, {} ordered)", value.scores.size(), value.ordered.size());
                throw std::logic_error("incoherent sorted set");
            }
            return value.scores.empty();
        } else {
            return value.empty();
        }
    }, v);
}

} // namespace zmem
