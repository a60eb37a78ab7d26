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
#ifndef ZMEM_COMMON_LOGGING_HPP
#define ZMEM_COMMON_LOGGING_HPP

#include <cstddef>
#include <string>
#include <spdlog/common.h>

namespace zmem {

struct LogOptions {
    std::string loggerName {"zmem"};
    // Empty means console only.
    std::string file;
    std::size_t maxFileSize {1024 * 1024 * 5};
    std::size_t maxFiles {3};
    spdlog::level::level_enum level {spdlog::level::info};
};

// Installs an async logger with a colour console sink, plus a rotating file
// sink when options.file is set, as the spdlog default logger.
void setupLogging(const LogOptions& options);

// Flushes and drops every logger. Call once before exit.
void shutdownLogging();

} // namespace zmem

#endif // ZMEM_COMMON_LOGGING_HPP
