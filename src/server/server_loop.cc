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

#include "server/server_loop.h"

#include <absl/cleanup/cleanup.h>

#include <asio.hpp>
#include <csignal>

#include "server/game_server.h"
#include "server/tcp_server.h"
#include "utils/configfile.h"
#include "utils/exception.h"
#include "utils/logging.h"
#include "utils/optionsparser.h"

namespace chessd {
namespace {
const OptionId kLogFileId{
    {.long_flag = "logfile",
     .help_text = "Write log to that file. Special value <stderr> to "
                  "output the log to the console.",
     .short_flag = 'l'}};
}  // namespace

void RunServer() {
  // Populate options from various sources.
  OptionsParser options_parser;
  options_parser.Add<StringOption>(kLogFileId);
  ConfigFile::PopulateOptions(&options_parser);
  TcpServer::PopulateOptions(&options_parser);

  // Parse flags, show help, initialize logging, read config etc.
  if (!ConfigFile::Init() || !options_parser.ProcessAllFlags()) return;
  const auto options = options_parser.GetOptionsDict();
  Logging::Get().SetFilename(options.Get<std::string>(kLogFileId));

  try {
    asio::io_context io_context;
    GameServer game_server;
    TcpServer server(io_context, &game_server, options);
    absl::Cleanup stop_server = [&server] {
      server.Stop();
      CERR << "Server stopped.";
    };

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&io_context](std::error_code ec, int signal) {
      if (ec) return;
      CERR << "Received signal " << signal << ", shutting down.";
      io_context.stop();
    });

    io_context.run();
  } catch (Exception& ex) {
    CERR << ex.what();
  }
}

}  // namespace chessd
