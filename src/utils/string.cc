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

#include "utils/string.h"

#include <algorithm>
#include <cctype>

namespace chessd {

std::vector<std::string> StrSplit(const std::string& str,
                                  const std::string& delim) {
  std::vector<std::string> result;
  for (std::string::size_type pos = 0, next = 0; pos != std::string::npos;
       pos = next) {
    next = str.find(delim, pos);
    result.push_back(str.substr(pos, next - pos));
    if (next != std::string::npos) next += delim.size();
  }
  return result;
}

std::string Trim(std::string str) {
  const auto last = std::find_if(str.rbegin(), str.rend(),
                                 [](int ch) { return !std::isspace(ch); });
  str.erase(last.base(), str.end());
  const auto first = std::find_if(str.begin(), str.end(),
                                  [](int ch) { return !std::isspace(ch); });
  str.erase(str.begin(), first);
  return str;
}

std::vector<std::string> FlowText(const std::string& src, size_t width) {
  std::vector<std::string> result;
  for (const auto& paragraph : StrSplit(src, "\n")) {
    result.emplace_back();
    for (const auto& word : StrSplit(paragraph, " ")) {
      if (result.back().empty()) {
        // First word in line, always add.
      } else if (result.back().size() + word.size() + 1 > width) {
        result.emplace_back();
      } else {
        result.back() += " ";
      }
      result.back() += word;
    }
  }
  return result;
}

}  // namespace chessd
