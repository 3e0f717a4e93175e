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

#include "utils/configfile.h"

#include <fstream>

#include "utils/commandline.h"
#include "utils/logging.h"
#include "utils/optionsparser.h"
#include "utils/string.h"

namespace chessd {
namespace {
const OptionId kConfigFileId{
    {.long_flag = "config",
     .help_text =
         "Path to a configuration file. The format of the file is one command "
         "line parameter per line, e.g.:\n--port=1812",
     .short_flag = 'c'}};
const char* kDefaultConfigFile = "chessd.config";
const char* kDefaultConfigFileParam = "<default>";
}  // namespace

std::vector<std::string> ConfigFile::arguments_;

void ConfigFile::PopulateOptions(OptionsParser* options) {
  options->Add<StringOption>(kConfigFileId) = kDefaultConfigFile;
}

// Looks up the config file before ProcessAllFlags() runs, as the latter needs
// the config file contents.
std::string ConfigFile::ProcessConfigFlag(
    const std::vector<std::string>& args) {
  std::string filename = kDefaultConfigFileParam;
  for (auto iter = args.begin(), end = args.end(); iter != end; ++iter) {
    std::string param = *iter;
    if (param.substr(0, 2) == "--") {
      param = param.substr(2);
      const auto pos = param.find('=');
      if (pos != std::string::npos &&
          param.substr(0, pos) == kConfigFileId.long_flag()) {
        filename = param.substr(pos + 1);
      }
    } else if (param.size() == 2 && param[0] == '-' &&
               param[1] == kConfigFileId.short_flag() && iter + 1 != end) {
      filename = *(iter + 1);
      ++iter;
    }
  }
  return filename;
}

bool ConfigFile::Init() {
  arguments_.clear();
  std::string filename = ProcessConfigFlag(CommandLine::Arguments());
  // Empty name disables the config file, including the default one.
  if (filename.empty()) return true;
  return ParseFile(filename);
}

bool ConfigFile::ParseFile(std::string& filename) {
  const bool using_default_config =
      filename == std::string(kDefaultConfigFileParam);

  std::ifstream input;
  if (using_default_config) {
    filename = CommandLine::BinaryDirectory() + '/' + kDefaultConfigFile;
  }
  input.open(filename);

  if (!input.is_open()) {
    // The default file is optional.
    if (using_default_config) return true;
    CERR << "Could not open configuration file: " << filename;
    return false;
  }

  CERR << "Found configuration file: " << filename;

  for (std::string line; getline(input, line);) {
    line = Trim(line);
    if (line.empty() || line[0] == '#') continue;
    // Allow long form arguments that omit '--'.
    if (line[0] != '-') line = "--" + line;
    if (line.substr(0, 2) != "--") {
      CERR << "Only '--' arguments are supported in the "
           << "configuration file: '" << line << "'.";
      return false;
    }
    arguments_.emplace_back(line);
  }

  return true;
}

}  // namespace chessd
