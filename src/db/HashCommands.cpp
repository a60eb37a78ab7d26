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
#include <vector>
#include "common/Args.hpp"
#include "common/Error.hpp"
#include "storage/Values.hpp"

namespace zmem {

std::expected<std::size_t, Error> Database::hset(const Arg& key, const std::vector<Arg>& fieldValues) {
    const auto k = normalizeArgsExact(1, {key}).front();
    auto fields = normalizeArgsAsMap(fieldValues);
    const std::unique_lock lock {m};
    auto w = keySpace.write<HashValue>(k);
    if (!w.has_value()) {
        return std::unexpected {w.error()};
    }
    auto& hash = w->get();
    std::size_t added = 0;
    for (auto& [field, value] : fields) {
        if (hash.insert_or_assign(field, std::move(value)).second) {
            ++added;
        }
    }
    return added;
}

std::expected<std::optional<std::string>, Error> Database::hget(const Arg& key, const Arg& field) const {
    const auto args = normalizeArgsExact(2, {key, field});
    const std::unique_lock lock {m};
    auto r = keySpace.read<HashValue>(args[0]);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    const auto& hash = r->get();
    auto i = hash.find(args[1]);
    if (i == hash.end()) {
        return std::nullopt;
    }
    return i->second;
}

std::expected<std::size_t, Error> Database::hdel(const Arg& key, const std::vector<Arg>& fields) {
    const auto k = normalizeArgsExact(1, {key}).front();
    const auto names = normalizeArgs(fields);
    const std::unique_lock lock {m};
    auto r = keySpace.read<HashValue>(k);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    if (r->get().empty()) {
        return 0;
    }
    auto w = keySpace.write<HashValue>(k);
    if (!w.has_value()) {
        return std::unexpected {w.error()};
    }
    std::size_t removed = 0;
    for (const auto& name : names) {
        removed += w->get().erase(name);
    }
    keySpace.cleanup(k);
    return removed;
}

std::expected<std::size_t, Error> Database::hlen(const Arg& key) const {
    const auto k = normalizeArgsExact(1, {key}).front();
    const std::unique_lock lock {m};
    auto r = keySpace.read<HashValue>(k);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    return r->get().size();
}

} // namespace zmem
