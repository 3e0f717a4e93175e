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

#include <string>
#include <vector>

namespace chessd {

// Split string by delimiter.
std::vector<std::string> StrSplit(const std::string& str,
                                  const std::string& delim);

// Trims a string of whitespace from both ends.
std::string Trim(std::string str);

// Flow text into lines of width up to @width.
std::vector<std::string> FlowText(const std::string& src, size_t width);

}  // namespace chessd
