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

// Clang thread safety annotations. Other compilers see no-ops.
#if defined(__clang__)
#define CHESSD_ATTRIBUTE(x) __attribute__((x))
#else
#define CHESSD_ATTRIBUTE(x)  // no-op
#endif

#define CHESSD_CAPABILITY(x) CHESSD_ATTRIBUTE(capability(x))
#define CHESSD_SCOPED_CAPABILITY CHESSD_ATTRIBUTE(scoped_lockable)
#define CHESSD_GUARDED_BY(x) CHESSD_ATTRIBUTE(guarded_by(x))
#define CHESSD_ACQUIRE(...) CHESSD_ATTRIBUTE(acquire_capability(__VA_ARGS__))
#define CHESSD_RELEASE(...) CHESSD_ATTRIBUTE(release_capability(__VA_ARGS__))
