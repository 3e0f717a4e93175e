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

#include "utils/random.h"

namespace chessd {

Random::Random() : gen_(std::random_device()()) {}

Random& Random::Get() {
  static Random rand;
  return rand;
}

int Random::GetInt(int min, int max) {
  Mutex::Lock lock(mutex_);
  std::uniform_int_distribution<> dist(min, max);
  return dist(gen_);
}

}  // namespace chessd
