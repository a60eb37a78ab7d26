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
#include "common/Coercion.hpp"
#include <bit>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <variant>
#include <fmt/format.h>

namespace zmem {

namespace {

constexpr std::string_view whitespace {" \t\n\r\f\v"};

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

template <typename T>
std::optional<T> parseWhole(std::string_view s) {
    T v{};
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return v;
}

// Decimal literals past the double range saturate to +-inf and those below
// it flush toward zero, the way strtod reports them.
std::optional<double> parseDouble(std::string_view s) {
    double v{};
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    if (ptr != end) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        return std::strtod(std::string {s}.c_str(), nullptr);
    }
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return v;
}

// A parsed numeric string keeps the integer form when it has one so that
// large integers are not routed through a double.
using Number = std::variant<std::int64_t, double>;

std::optional<Number> parseNumber(std::string_view text) {
    auto s = trim(text);
    if (s.empty()) {
        return std::nullopt;
    }
    bool negative = false;
    if (s.front() == '+' || s.front() == '-') {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    // from_chars would accept "inf" and "nan", which are not numbers here
    if (s.empty() || !(std::isdigit(static_cast<unsigned char>(s.front())) || s.front() == '.')) {
        return std::nullopt;
    }
    if (auto i = parseWhole<std::int64_t>(s)) {
        return Number{negative ? -*i : *i};
    }
    if (auto d = parseDouble(s)) {
        return Number{negative ? -*d : *d};
    }
    return std::nullopt;
}

std::expected<std::int64_t, Error> fromDouble(double x) {
    if (!isBoundedInteger(x)) {
        return std::unexpected {Error {ErrorCode::NotInteger}};
    }
    return static_cast<std::int64_t>(x);
}

} // namespace

bool isBoundedInteger(std::int64_t n) noexcept {
    return n >= -kMaxBoundedInteger && n <= kMaxBoundedInteger;
}

bool isBoundedInteger(double x) noexcept {
    return std::isfinite(x) && std::trunc(x) == x &&
        x >= -static_cast<double>(kMaxBoundedInteger) &&
        x <= static_cast<double>(kMaxBoundedInteger);
}

std::expected<std::int64_t, Error> toInteger(const Arg& x) {
    if (const auto* n = std::get_if<std::int64_t>(&x)) {
        if (!isBoundedInteger(*n)) {
            return std::unexpected {Error {ErrorCode::NotInteger}};
        }
        return *n;
    }
    if (const auto* d = std::get_if<double>(&x)) {
        return fromDouble(*d);
    }
    if (const auto* s = std::get_if<std::string>(&x)) {
        const auto number = parseNumber(*s);
        if (!number) {
            return std::unexpected {Error {ErrorCode::NotInteger}};
        }
        if (const auto* i = std::get_if<std::int64_t>(&*number)) {
            return toInteger(Arg{*i});
        }
        return fromDouble(std::get<double>(*number));
    }
    return std::unexpected {Error {ErrorCode::NotInteger}};
}

std::expected<double, Error> toFloat(const Arg& x) {
    if (const auto* n = std::get_if<std::int64_t>(&x)) {
        return static_cast<double>(*n);
    }
    if (const auto* d = std::get_if<double>(&x)) {
        if (std::isnan(*d)) {
            return std::unexpected {Error {ErrorCode::NotFloat}};
        }
        return *d;
    }
    if (const auto* s = std::get_if<std::string>(&x)) {
        if (const auto number = parseNumber(*s)) {
            return std::visit([](auto v) { return static_cast<double>(v); }, *number);
        }
        if (*s == "inf" || *s == "+inf") {
            return std::numeric_limits<double>::infinity();
        }
        if (*s == "-inf") {
            return -std::numeric_limits<double>::infinity();
        }
    }
    return std::unexpected {Error {ErrorCode::NotFloat}};
}

std::string toDisplayString(const Arg& x) {
    if (const auto* n = std::get_if<std::int64_t>(&x)) {
        return fmt::format("{}", *n);
    }
    if (const auto* d = std::get_if<double>(&x)) {
        if (isBoundedInteger(*d)) {
            return fmt::format("{}", static_cast<std::int64_t>(*d));
        }
        // shortest form that parses back to the same double; "inf", "-inf", "nan"
        return fmt::format("{}", *d);
    }
    if (const auto* s = std::get_if<std::string>(&x)) {
        return *s;
    }
    return "nil";
}

int countSetBits(const Arg& x) {
    std::int64_t byte = -1;
    if (const auto* n = std::get_if<std::int64_t>(&x)) {
        byte = *n;
    } else if (const auto* d = std::get_if<double>(&x)) {
        if (std::trunc(*d) == *d && *d >= 0.0 && *d < 256.0) {
            byte = static_cast<std::int64_t>(*d);
        }
    } else {
        throw std::invalid_argument("countSetBits: expected a number");
    }
    if (byte < 0 || byte > 255) {
        throw std::invalid_argument("countSetBits: " + toDisplayString(x) + " is not a byte value");
    }
    return std::popcount(static_cast<unsigned char>(byte));
}

} // namespace zmem
