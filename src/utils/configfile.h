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

class OptionsParser;

class ConfigFile {
 public:
  ConfigFile() = delete;

  // This function must be called after PopulateOptions.
  static bool Init();

  // Returns the command line arguments from the config file.
  static const std::vector<std::string>& Arguments() { return arguments_; }

  // Add the config file parameter to the options dictionary.
  static void PopulateOptions(OptionsParser* options);

  // Parses the config file into the arguments vector. Exposed for tests.
  static bool ParseFile(std::string& filename);

 private:
  // Returns the config file path given in the arguments.
  static std::string ProcessConfigFlag(const std::vector<std::string>& args);

  static std::vector<std::string> arguments_;
};

}  // namespace chessd
