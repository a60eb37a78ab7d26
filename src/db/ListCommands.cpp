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
#include "db/Database.hpp"
#include <cstddef>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "common/Args.hpp"
#include "common/Error.hpp"
#include "storage/Values.hpp"

namespace zmem {

std::expected<std::size_t, Error> Database::lpush(const Arg& key, const std::vector<Arg>& values) {
    const auto k = normalizeArgsExact(1, {key}).front();
    auto items = normalizeArgs(values);
    const std::unique_lock lock {m};
    auto w = keySpace.write<ListValue>(k);
    if (!w.has_value()) {
        return std::unexpected {w.error()};
    }
    auto& list = w->get();
    for (auto& item : items) {
        list.pushFront(std::move(item));
    }
    return list.size();
}

std::expected<std::size_t, Error> Database::rpush(const Arg& key, const std::vector<Arg>& values) {
    const auto k = normalizeArgsExact(1, {key}).front();
    auto items = normalizeArgs(values);
    const std::unique_lock lock {m};
    auto w = keySpace.write<ListValue>(k);
    if (!w.has_value()) {
        return std::unexpected {w.error()};
    }
    auto& list = w->get();
    for (auto& item : items) {
        list.pushBack(std::move(item));
    }
    return list.size();
}

std::expected<std::optional<std::string>, Error> Database::lpop(const Arg& key) {
    const auto k = normalizeArgsExact(1, {key}).front();
    const std::unique_lock lock {m};
    auto r = keySpace.read<ListValue>(k);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    if (r->get().empty()) {
        return std::nullopt;
    }
    auto w = keySpace.write<ListValue>(k);
    if (!w.has_value()) {
        return std::unexpected {w.error()};
    }
    auto v = w->get().popFront();
    keySpace.cleanup(k);
    return v;
}

std::expected<std::optional<std::string>, Error> Database::rpop(const Arg& key) {
    const auto k = normalizeArgsExact(1, {key}).front();
    const std::unique_lock lock {m};
    auto r = keySpace.read<ListValue>(k);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    if (r->get().empty()) {
        return std::nullopt;
    }
    auto w = keySpace.write<ListValue>(k);
    if (!w.has_value()) {
        return std::unexpected {w.error()};
    }
    auto v = w->get().popBack();
    keySpace.cleanup(k);
    return v;
}

std::expected<std::size_t, Error> Database::llen(const Arg& key) const {
    const auto k = normalizeArgsExact(1, {key}).front();
    const std::unique_lock lock {m};
    auto r = keySpace.read<ListValue>(k);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    return r->get().size();
}

std::expected<std::vector<std::string>, Error> Database::lrange(const Arg& key, const Arg& start, const Arg& stop) const {
    const auto args = normalizeArgsExact(3, {key, start, stop});
    auto bounds = rangeArgs(args[1], args[2]);
    if (!bounds.has_value()) {
        return std::unexpected {bounds.error()};
    }
    const std::unique_lock lock {m};
    auto r = keySpace.read<ListValue>(args[0]);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    const auto& list = r->get();
    std::vector<std::string> result;
    if (auto range = clampRange(bounds->first, bounds->second, list.size())) {
        for (auto i = range->first; i <= range->second; ++i) {
            result.push_back(list.at(i));
        }
    }
    return result;
}

} // namespace zmem
