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

#include <functional>
#include <ostream>
#include <string>

#include "utils/cascading_dict.h"

namespace chessd {

class OptionId {
 public:
  struct OptionsParams {
    const char* long_flag = nullptr;
    const char* help_text = nullptr;
    char short_flag = '\0';
  };

  OptionId(const OptionsParams& params)
      : long_flag_(params.long_flag),
        help_text_(params.help_text),
        short_flag_(params.short_flag) {}

  OptionId(const OptionId& other) = delete;
  bool operator==(const OptionId& other) const { return this == &other; }

  const char* long_flag() const { return long_flag_; }
  const char* help_text() const { return help_text_; }
  char short_flag() const { return short_flag_; }

 private:
  const char* const long_flag_;
  const char* const help_text_;
  const char short_flag_;
};

inline std::ostream& operator<<(std::ostream& os, const OptionId& id) {
  os << "OptionId [";
  if (id.long_flag() && *id.long_flag()) os << "--" << id.long_flag();
  if (id.short_flag()) os << " -" << id.short_flag();
  return os << "]";
}

// Hashes and compares the referenced object by identity.
template <typename T>
struct Ref : public std::reference_wrapper<T> {
  using std::reference_wrapper<T>::reference_wrapper;
  template <typename H>
  friend H AbslHashValue(H h, const Ref& c) {
    return H::combine(std::move(h), &c.get());
  }
  bool operator==(const Ref& other) const {
    return &this->get() == &other.get();
  }
  friend std::ostream& operator<<(std::ostream& os, const Ref& c) {
    return os << c.get();
  }
};

using OptionsDict =
    CascadingDict<Ref<const OptionId>, bool, int, std::string>;

}  // namespace chessd
