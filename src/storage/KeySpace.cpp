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
#include "storage/KeySpace.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "common/Error.hpp"

namespace zmem {

KeySpace::KeySpace() : entries{} {}

bool KeySpace::isEmpty(const std::string& key) const {
    auto i = entries.find(key);
    if (i == entries.end()) {
        return true;
    }
    return isEmptyValue(i->second);
}

bool KeySpace::cleanup(const std::string& key) {
    auto i = entries.find(key);
    if (i == entries.end() || !isEmptyValue(i->second)) {
        return false;
    }
    entries.erase(i);
    spdlog::debug("KeySpace: removed empty key '{}'", key);
    return true;
}

bool KeySpace::contains(const std::string& key) const {
    return entries.contains(key);
}

bool KeySpace::erase(const std::string& key) {
    return entries.erase(key) > 0;
}

std::optional<Kind> KeySpace::kindOf(const std::string& key) const {
    auto i = entries.find(key);
    if (i == entries.end()) {
        return std::nullopt;
    }
    return kindOfValue(i->second);
}

std::size_t KeySpace::size() const {
    return entries.size();
}

void KeySpace::clear() {
    entries.clear();
}

std::vector<std::string> KeySpace::keyNames() const {
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        names.push_back(key);
    }
    return names;
}

Error KeySpace::wrongType(const std::string& key) {
    return Error {ErrorCode::WrongType, defaultMessage(ErrorCode::WrongType), key};
}

} // namespace zmem
