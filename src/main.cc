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

#include <iostream>

#include "server/server_loop.h"
#include "utils/commandline.h"
#include "utils/logging.h"
#include "version.h"

int main(int argc, const char** argv) {
  using namespace chessd;
  LOGFILE << "Chessd started.";
  CERR << "Chessd v" << GetVersionStr() << " built " << __DATE__;

  try {
    CommandLine::Init(argc, argv);
    RunServer();
  } catch (std::exception& e) {
    std::cerr << "Unhandled exception: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
