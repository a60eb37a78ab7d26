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
#include <iterator>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "common/Args.hpp"
#include "common/Coercion.hpp"
#include "common/Error.hpp"
#include "storage/Values.hpp"

namespace zmem {

std::expected<std::size_t, Error> Database::zadd(const Arg& key, const std::vector<Arg>& scoreMembers) {
    const auto k = normalizeArgsExact(1, {key}).front();
    auto args = normalizeArgs(scoreMembers);
    if (args.size() % 2 != 0) {
        throw std::invalid_argument("zadd: expected score/member pairs");
    }
    // all scores are checked before the key is touched
    std::vector<std::pair<double, std::string>> pairs;
    pairs.reserve(args.size() / 2);
    for (std::size_t i = 0; i < args.size(); i += 2) {
        auto score = toFloat(args[i]);
        if (!score.has_value()) {
            return std::unexpected {score.error()};
        }
        pairs.emplace_back(score.value(), std::move(args[i + 1]));
    }
    const std::unique_lock lock {m};
    auto w = keySpace.write<ZSetValue>(k);
    if (!w.has_value()) {
        return std::unexpected {w.error()};
    }
    std::size_t added = 0;
    for (const auto& [score, member] : pairs) {
        if (w->get().insert(member, score)) {
            ++added;
        }
    }
    return added;
}

std::expected<std::size_t, Error> Database::zrem(const Arg& key, const std::vector<Arg>& members) {
    const auto k = normalizeArgsExact(1, {key}).front();
    const auto items = normalizeArgs(members);
    const std::unique_lock lock {m};
    auto r = keySpace.read<ZSetValue>(k);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    if (r->get().size() == 0) {
        return 0;
    }
    auto w = keySpace.write<ZSetValue>(k);
    if (!w.has_value()) {
        return std::unexpected {w.error()};
    }
    std::size_t removed = 0;
    for (const auto& item : items) {
        if (w->get().erase(item)) {
            ++removed;
        }
    }
    keySpace.cleanup(k);
    return removed;
}

std::expected<std::optional<double>, Error> Database::zscore(const Arg& key, const Arg& member) const {
    const auto args = normalizeArgsExact(2, {key, member});
    const std::unique_lock lock {m};
    auto r = keySpace.read<ZSetValue>(args[0]);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    return r->get().score(args[1]);
}

std::expected<std::size_t, Error> Database::zcard(const Arg& key) const {
    const auto k = normalizeArgsExact(1, {key}).front();
    const std::unique_lock lock {m};
    auto r = keySpace.read<ZSetValue>(k);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    return r->get().size();
}

std::expected<std::vector<std::string>, Error> Database::zrange(const Arg& key, const Arg& start, const Arg& stop) const {
    const auto args = normalizeArgsExact(3, {key, start, stop});
    auto bounds = rangeArgs(args[1], args[2]);
    if (!bounds.has_value()) {
        return std::unexpected {bounds.error()};
    }
    const std::unique_lock lock {m};
    auto r = keySpace.read<ZSetValue>(args[0]);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    const auto& ordered = r->get().ordered;
    std::vector<std::string> result;
    if (auto range = clampRange(bounds->first, bounds->second, ordered.size())) {
        auto i = std::next(ordered.begin(), static_cast<std::ptrdiff_t>(range->first));
        for (auto n = range->first; n <= range->second; ++n, ++i) {
            result.push_back(i->second);
        }
    }
    return result;
}

} // namespace zmem
