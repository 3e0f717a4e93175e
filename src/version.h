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

// Versioning is performed according to the standard at <https://semver.org/>

#include <cstdint>
#include <string>

#include "version.inc"

std::string GetVersionStr(int major = CHESSD_VERSION_MAJOR,
                          int minor = CHESSD_VERSION_MINOR,
                          int patch = CHESSD_VERSION_PATCH,
                          const std::string& postfix = CHESSD_VERSION_POSTFIX);
