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
#ifndef ZMEM_STORAGE_KEY_SPACE_HPP
#define ZMEM_STORAGE_KEY_SPACE_HPP

#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <spdlog/spdlog.h>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/Values.hpp"

namespace zmem {

/*
 * The keyed container. Not synchronized: Database serializes access.
 *
 * read<T> never creates an entry, absent keys read as an empty T.
 * write<T> creates the entry on first use. The returned reference is only
 * valid until the next call into the KeySpace. Callers that may have emptied
 * the value must call cleanup() once they are done with it.
 */
class KeySpace {
public:
    template <typename T>
    using ReadResult = std::expected<std::reference_wrapper<const T>, Error>;
    template <typename T>
    using WriteResult = std::expected<std::reference_wrapper<T>, Error>;

    KeySpace();
    KeySpace(const KeySpace&) = delete;
    KeySpace& operator=(const KeySpace&) = delete;

    template <typename T>
    ReadResult<T> read(const std::string& key) const {
        static const T emptyValue {};
        auto i = entries.find(key);
        if (i == entries.end()) {
            return std::cref(emptyValue);
        }
        const auto* v = std::get_if<T>(&i->second);
        if (v == nullptr) {
            return std::unexpected {wrongType(key)};
        }
        return std::cref(*v);
    }

    template <typename T>
    WriteResult<T> write(const std::string& key) {
        auto i = entries.find(key);
        if (i != entries.end() && !isEmptyValue(i->second)) {
            auto* v = std::get_if<T>(&i->second);
            if (v == nullptr) {
                return std::unexpected {wrongType(key)};
            }
            return std::ref(*v);
        }
        if (i == entries.end()) {
            i = entries.emplace(key, Value {std::in_place_type<T>}).first;
            spdlog::debug("KeySpace: created {} key '{}'", toString(zmem::kindOf<T>), key);
        } else {
            i->second.template emplace<T>();
        }
        return std::ref(std::get<T>(i->second));
    }

    // Absent keys are empty.
    bool isEmpty(const std::string& key) const;
    // Removes key if its value is empty. Returns true when it was removed.
    bool cleanup(const std::string& key);

    bool contains(const std::string& key) const;
    bool erase(const std::string& key);
    std::optional<Kind> kindOf(const std::string& key) const;
    std::size_t size() const;
    void clear();
    std::vector<std::string> keyNames() const;
private:
    static Error wrongType(const std::string& key);

    std::unordered_map<std::string, Value> entries;
};

} // namespace zmem

#endif // ZMEM_STORAGE_KEY_SPACE_HPP
