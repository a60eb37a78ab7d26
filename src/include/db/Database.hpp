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
#ifndef ZMEM_DB_DATABASE_HPP
#define ZMEM_DB_DATABASE_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "common/Config.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/KeySpace.hpp"

namespace zmem {

/*
 * Hosts a KeySpace behind one mutex. Every command normalizes its arguments,
 * then runs its whole read-modify-cleanup sequence under the lock.
 * Malformed argument lists throw std::invalid_argument; user errors come
 * back as Error.
 */
class Database {
public:
    Database();
    explicit Database(const Config& c);
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Runs f(KeySpace&) under the database lock. Command bodies living
    // outside this class go through here.
    template <typename F>
    decltype(auto) transaction(F&& f) {
        const std::unique_lock lock {m};
        return std::forward<F>(f)(keySpace);
    }

    // keys
    bool exists(const Arg& key) const;
    std::size_t del(const std::vector<Arg>& keys);
    std::expected<std::vector<std::string>, Error> keys(const Arg& pattern) const;
    std::string type(const Arg& key) const;
    std::size_t dbsize() const;
    void flushdb();

    // strings
    std::expected<std::monostate, Error> set(const Arg& key, const Arg& value);
    std::expected<std::optional<std::string>, Error> get(const Arg& key) const;
    std::expected<std::int64_t, Error> incrby(const Arg& key, const Arg& increment);
    std::expected<std::int64_t, Error> bitcount(const Arg& key) const;

    // lists
    std::expected<std::size_t, Error> lpush(const Arg& key, const std::vector<Arg>& values);
    std::expected<std::size_t, Error> rpush(const Arg& key, const std::vector<Arg>& values);
    std::expected<std::optional<std::string>, Error> lpop(const Arg& key);
    std::expected<std::optional<std::string>, Error> rpop(const Arg& key);
    std::expected<std::size_t, Error> llen(const Arg& key) const;
    std::expected<std::vector<std::string>, Error> lrange(const Arg& key, const Arg& start, const Arg& stop) const;

    // hashes
    std::expected<std::size_t, Error> hset(const Arg& key, const std::vector<Arg>& fieldValues);
    std::expected<std::optional<std::string>, Error> hget(const Arg& key, const Arg& field) const;
    std::expected<std::size_t, Error> hdel(const Arg& key, const std::vector<Arg>& fields);
    std::expected<std::size_t, Error> hlen(const Arg& key) const;

    // sets
    std::expected<std::size_t, Error> sadd(const Arg& key, const std::vector<Arg>& members);
    std::expected<std::size_t, Error> srem(const Arg& key, const std::vector<Arg>& members);
    std::expected<bool, Error> sismember(const Arg& key, const Arg& member) const;
    std::expected<std::size_t, Error> scard(const Arg& key) const;

    // sorted sets
    std::expected<std::size_t, Error> zadd(const Arg& key, const std::vector<Arg>& scoreMembers);
    std::expected<std::size_t, Error> zrem(const Arg& key, const std::vector<Arg>& members);
    std::expected<std::optional<double>, Error> zscore(const Arg& key, const Arg& member) const;
    std::expected<std::size_t, Error> zcard(const Arg& key) const;
    std::expected<std::vector<std::string>, Error> zrange(const Arg& key, const Arg& start, const Arg& stop) const;

    const Config config;
private:
    // Inclusive [start, stop] with negative indexes counted from the end,
    // clamped to a sequence of length len. nullopt when the range is empty.
    static std::optional<std::pair<std::size_t, std::size_t>> clampRange(std::int64_t start, std::int64_t stop, std::size_t len);
    std::expected<std::pair<std::int64_t, std::int64_t>, Error> rangeArgs(const Arg& start, const Arg& stop) const;

    KeySpace keySpace;
    mutable std::mutex m;
};

} // namespace zmem

#endif // ZMEM_DB_DATABASE_HPP
