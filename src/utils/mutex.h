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

#include <mutex>

#include "utils/cppattributes.h"

namespace chessd {

// std::mutex wrapper for clang thread safety annotation.
class CHESSD_CAPABILITY("mutex") Mutex {
 public:
  // std::unique_lock<std::mutex> wrapper.
  class CHESSD_SCOPED_CAPABILITY Lock {
   public:
    Lock(Mutex& m) CHESSD_ACQUIRE(m) : lock_(m.get_raw()) {}
    ~Lock() CHESSD_RELEASE() {}

   private:
    std::unique_lock<std::mutex> lock_;
  };

  void lock() CHESSD_ACQUIRE() { mutex_.lock(); }
  void unlock() CHESSD_RELEASE() { mutex_.unlock(); }
  std::mutex& get_raw() { return mutex_; }

 private:
  std::mutex mutex_;
};

}  // namespace chessd
