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

#include <random>

#include "utils/mutex.h"

namespace chessd {

// Process-wide source of randomness, safe to use from any thread.
class Random {
 public:
  static Random& Get();
  // Both sides are included.
  int GetInt(int min, int max);

 private:
  Random();

  Mutex mutex_;
  std::mt19937 gen_ CHESSD_GUARDED_BY(mutex_);
};

}  // namespace chessd
