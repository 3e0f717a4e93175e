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

#include <chrono>
#include <deque>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

#include "utils/mutex.h"

namespace chessd {

class Logging {
 public:
  static Logging& Get();

  // Sets the name of the log. Empty name keeps the log in memory only, the
  // special name <stderr> routes the log to stderr.
  void SetFilename(const std::string& filename);

 private:
  // Writes line to the log, and appends new line character.
  void WriteLineRaw(const std::string& line);

  Mutex mutex_;
  std::string filename_ CHESSD_GUARDED_BY(mutex_);
  std::ofstream file_ CHESSD_GUARDED_BY(mutex_);
  std::deque<std::string> buffer_ CHESSD_GUARDED_BY(mutex_);

  Logging() = default;
  friend class LogMessage;
};

class LogMessage : public std::ostringstream {
 public:
  LogMessage(const char* file, int line);
  ~LogMessage();
};

class StderrLogMessage : public std::ostringstream {
 public:
  StderrLogMessage(const char* file, int line);
  ~StderrLogMessage();

 private:
  LogMessage log_;
};

class StdoutLogMessage : public std::ostringstream {
 public:
  StdoutLogMessage(const char* file, int line);
  ~StdoutLogMessage();

 private:
  LogMessage log_;
};

std::string FormatTime(std::chrono::time_point<std::chrono::system_clock> time);

}  // namespace chessd

#define LOGFILE ::chessd::LogMessage(__FILE__, __LINE__)
#define CERR ::chessd::StderrLogMessage(__FILE__, __LINE__)
#define COUT ::chessd::StdoutLogMessage(__FILE__, __LINE__)
