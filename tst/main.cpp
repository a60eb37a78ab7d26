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
#include <gtest/gtest.h>
#include <spdlog/common.h>
#include "common/Logging.hpp"

int main(int argc, char** argv) {
    zmem::setupLogging(zmem::LogOptions {
        .loggerName = "zmemTests",
        .file = "logs/zmem_tests.txt",
        .level = spdlog::level::debug});
    testing::InitGoogleTest(&argc, argv);
    const int result = RUN_ALL_TESTS();
    zmem::shutdownLogging();
    return result;
}
