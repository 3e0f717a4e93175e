/*
  This file is part of Chessd.
  Copyright (C) 2026 The Chessd Authors

  Chessd is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  Chessd is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with Chessd.  If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <absl/container/flat_hash_map.h>

#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

#include "utils/exception.h"

namespace chessd {

// Dictionary of typed values that falls back to its parent for missing keys.
template <typename K, typename... V>
class CascadingDict {
 public:
  explicit CascadingDict(const CascadingDict* parent = nullptr)
      : parent_(parent) {}

  // Returns value of given type. Throws exception if not found.
  template <typename T>
  T Get(const K& key) const;

  // Returns the own value of given type (doesn't fall back to querying parent).
  // Returns nullopt if doesn't exist.
  template <typename T>
  std::optional<T> OwnGet(const K& key) const;

  // Sets value for a given type.
  template <typename T>
  void Set(const K& key, const T& value);

  // Get reference to assign value to.
  template <typename T>
  T& GetOwnRef(const K& key);

  // Returns true when the value is not set anywhere except maybe the root
  // dictionary.
  bool IsDefault(const K& key) const;

 private:
  static std::string KeyAsString(const K& key);

  const CascadingDict* parent_ = nullptr;
  absl::flat_hash_map<K, std::variant<V...>> dict_;
};

template <typename K, typename... V>
template <typename T>
T CascadingDict<K, V...>::Get(const K& key) const {
  const auto value = OwnGet<T>(key);
  if (value) return *value;
  if (parent_) return parent_->template Get<T>(key);
  throw Exception("Key [" + KeyAsString(key) + "] was not set in options.");
}

template <typename K, typename... V>
template <typename T>
std::optional<T> CascadingDict<K, V...>::OwnGet(const K& key) const {
  const auto it = dict_.find(key);
  if (it == dict_.end()) return std::nullopt;
  if (!std::holds_alternative<T>(it->second)) {
    throw Exception("Key [" + KeyAsString(key) + "] is not of expected type.");
  }
  return std::get<T>(it->second);
}

template <typename K, typename... V>
template <typename T>
void CascadingDict<K, V...>::Set(const K& key, const T& value) {
  GetOwnRef<T>(key) = value;
}

template <typename K, typename... V>
template <typename T>
T& CascadingDict<K, V...>::GetOwnRef(const K& key) {
  auto it = dict_.find(key);
  if (it != dict_.end() && !std::holds_alternative<T>(it->second)) {
    throw Exception("Key [" + KeyAsString(key) + "] is not of expected type.");
  }
  if (it == dict_.end()) {
    it = dict_.emplace(key, std::variant<V...>(std::in_place_type<T>)).first;
  }
  return std::get<T>(it->second);
}

template <typename K, typename... V>
bool CascadingDict<K, V...>::IsDefault(const K& key) const {
  if (!parent_) return true;
  if (dict_.find(key) != dict_.end()) return false;
  return parent_->IsDefault(key);
}

template <typename K, typename... V>
std::string CascadingDict<K, V...>::KeyAsString(const K& key) {
  if constexpr (std::is_convertible_v<K, std::string>) {
    return std::string(key);
  } else {
    std::ostringstream oss;
    oss << key;
    return oss.str();
  }
}

}  // namespace chessd
