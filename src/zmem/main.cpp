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
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include "common/Args.hpp"
#include "common/Config.hpp"
#include "common/Error.hpp"
#include "common/Logging.hpp"
#include "db/Database.hpp"

using zmem::Database;
using zmem::Config;
using zmem::argList;

int main(int /*argc*/, char** /*argv*/) {
    zmem::setupLogging(zmem::LogOptions {.level = spdlog::level::debug});
    // SPDLOG_LEVEL=warn and the like override the level above
    spdlog::cfg::load_env_levels();
    spdlog::info("ZMEM! Starting...");
    Database db {Config {}};

    const auto check = [](const auto& result, const std::string& what) {
        if (!result.has_value()) {
            spdlog::error("{} failed: {}", what, result.error().what);
        }
    };
    check(db.set("greeting", "hello"), "set");
    check(db.rpush("queue", argList("a", "b", "c")), "rpush");
    check(db.hset("user:42", argList("name", "ada", "visits", 3)), "hset");
    check(db.zadd("board", argList(10, "ada", "inf", "bob")), "zadd");

    const auto visits = db.incrby("counter", 41);
    if (visits.has_value()) {
        spdlog::info("counter: {}", visits.value());
    }

    const auto wrong = db.llen("greeting");
    if (!wrong.has_value()) {
        spdlog::info("llen greeting: {}", wrong.error().what);
    }

    while (true) {
        const auto item = db.lpop("queue");
        if (!item.has_value() || !item.value().has_value()) {
            break;
        }
        spdlog::info("popped {}", item.value().value());
    }
    spdlog::info("queue exists after draining: {}", db.exists("queue"));

    const auto names = db.keys("*");
    if (names.has_value()) {
        for (const auto& name : names.value()) {
            spdlog::info("{} -> {}", name, db.type(name));
        }
    }
    spdlog::info("deleted {} keys", db.del(argList("greeting", "missing")));
    zmem::shutdownLogging();
    return 0;
}
