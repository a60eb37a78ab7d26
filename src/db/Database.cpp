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
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include "common/Args.hpp"
#include "common/Coercion.hpp"
#include "common/Error.hpp"
#include "common/Pattern.hpp"

namespace zmem {

Database::Database() : Database(Config {}) {}

Database::Database(const Config& c) : config {c}, keySpace {}, m {} {}

bool Database::exists(const Arg& key) const {
    const auto k = normalizeArgsExact(1, {key}).front();
    const std::unique_lock lock {m};
    return keySpace.contains(k);
}

std::size_t Database::del(const std::vector<Arg>& keys) {
    const auto ks = normalizeArgs(keys);
    const std::unique_lock lock {m};
    std::size_t removed = 0;
    for (const auto& k : ks) {
        if (keySpace.erase(k)) {
            ++removed;
        }
    }
    return removed;
}

std::expected<std::vector<std::string>, Error> Database::keys(const Arg& pattern) const {
    auto glob = normalizeArgsExact(1, {pattern}).front();
    if (glob.size() > config.maxPatternLength) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "ERR pattern longer than " + std::to_string(config.maxPatternLength) + " bytes"}};
    }
    const Pattern p {std::move(glob)};
    std::vector<std::string> names;
    {
        const std::unique_lock lock {m};
        names = keySpace.keyNames();
    }
    // match on the snapshot, outside the lock
    std::vector<std::string> result;
    for (auto& k : names) {
        if (p.matches(k)) {
            result.push_back(std::move(k));
        }
    }
    if (config.sortKeys) {
        std::ranges::sort(result);
    }
    return result;
}

std::string Database::type(const Arg& key) const {
    const auto k = normalizeArgsExact(1, {key}).front();
    const std::unique_lock lock {m};
    const auto kind = keySpace.kindOf(k);
    if (!kind) {
        return "none";
    }
    return toString(*kind);
}

std::size_t Database::dbsize() const {
    const std::unique_lock lock {m};
    return keySpace.size();
}

void Database::flushdb() {
    const std::unique_lock lock {m};
    spdlog::debug("Database: flushing {} keys", keySpace.size());
    keySpace.clear();
}

std::optional<std::pair<std::size_t, std::size_t>> Database::clampRange(std::int64_t start, std::int64_t stop, std::size_t len) {
    const auto n = static_cast<std::int64_t>(len);
    if (start < 0) {
        start += n;
    }
    if (stop < 0) {
        stop += n;
    }
    start = std::max<std::int64_t>(start, 0);
    stop = std::min<std::int64_t>(stop, n - 1);
    if (start > stop) {
        return std::nullopt;
    }
    return std::make_pair(static_cast<std::size_t>(start), static_cast<std::size_t>(stop));
}

std::expected<std::pair<std::int64_t, std::int64_t>, Error> Database::rangeArgs(const Arg& start, const Arg& stop) const {
    auto s = toInteger(start);
    if (!s.has_value()) {
        return std::unexpected {s.error()};
    }
    auto e = toInteger(stop);
    if (!e.has_value()) {
        return std::unexpected {e.error()};
    }
    return std::make_pair(s.value(), e.value());
}

} // namespace zmem
