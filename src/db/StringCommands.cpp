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
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include "common/Args.hpp"
#include "common/Coercion.hpp"
#include "common/Error.hpp"
#include "storage/Values.hpp"

namespace zmem {

std::expected<std::monostate, Error> Database::set(const Arg& key, const Arg& value) {
    auto args = normalizeArgsExact(2, {key, value});
    const std::unique_lock lock {m};
    // SET replaces a value of any kind.
    keySpace.erase(args[0]);
    auto w = keySpace.write<StringValue>(args[0]);
    if (!w.has_value()) {
        return std::unexpected {w.error()};
    }
    w->get().cell = std::move(args[1]);
    return {};
}

std::expected<std::optional<std::string>, Error> Database::get(const Arg& key) const {
    const auto k = normalizeArgsExact(1, {key}).front();
    const std::unique_lock lock {m};
    auto r = keySpace.read<StringValue>(k);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    return r->get().cell;
}

std::expected<std::int64_t, Error> Database::incrby(const Arg& key, const Arg& increment) {
    const auto args = normalizeArgsExact(2, {key, increment});
    const auto& k = args[0];
    auto by = toInteger(args[1]);
    if (!by.has_value()) {
        return std::unexpected {by.error()};
    }
    const std::unique_lock lock {m};
    auto r = keySpace.read<StringValue>(k);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    std::int64_t current = 0;
    if (const auto& cell = r->get().cell) {
        auto parsed = toInteger(*cell);
        if (!parsed.has_value()) {
            return std::unexpected {Error {parsed.error().code, parsed.error().what, k}};
        }
        current = parsed.value();
    }
    // both operands are bounded, so the sum cannot overflow int64_t
    const auto result = current + by.value();
    if (!isBoundedInteger(result)) {
        return std::unexpected {Error {ErrorCode::NotInteger, "ERR increment or decrement would overflow", k}};
    }
    auto w = keySpace.write<StringValue>(k);
    if (!w.has_value()) {
        return std::unexpected {w.error()};
    }
    w->get().cell = toDisplayString(result);
    return result;
}

std::expected<std::int64_t, Error> Database::bitcount(const Arg& key) const {
    const auto k = normalizeArgsExact(1, {key}).front();
    const std::unique_lock lock {m};
    auto r = keySpace.read<StringValue>(k);
    if (!r.has_value()) {
        return std::unexpected {r.error()};
    }
    std::int64_t bits = 0;
    if (const auto& cell = r->get().cell) {
        for (const char c : *cell) {
            bits += countSetBits(std::int64_t{static_cast<unsigned char>(c)});
        }
    }
    return bits;
}

} // namespace zmem
