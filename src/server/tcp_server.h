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

#include <asio.hpp>
#include <chrono>
#include <cstddef>

#include "server/game_server.h"
#include "utils/optionsdict.h"
#include "utils/optionsparser.h"

namespace chessd {

// Accepts TCP connections and feeds their traffic into a GameServer. Runs
// entirely on the thread which runs the io_context.
class TcpServer {
 public:
  static const OptionId kHostId;
  static const OptionId kPortId;
  static const OptionId kTickMsId;
  static const OptionId kMaxConnectionsId;
  static const OptionId kTcpNoDelayId;

  static void PopulateOptions(OptionsParser* options);

  // Binds the listening socket. Throws Exception if the address can't be
  // resolved or bound.
  TcpServer(asio::io_context& ctx, GameServer* game_server,
            const OptionsDict& options);

  // Stops accepting and ticking. Open connections stay until the io_context
  // is stopped.
  void Stop();

  GameServer* game_server() const { return game_server_; }
  // Socket of connection @id is closed.
  void OnClosed(ConnectionId id);

 private:
  void DoAccept();
  void ScheduleTick();

  asio::ip::tcp::acceptor acceptor_;
  asio::steady_timer timer_;
  GameServer* const game_server_;
  const std::chrono::milliseconds tick_interval_;
  const size_t max_connections_;
  const bool tcp_nodelay_;

  ConnectionId next_connection_id_ = 0;
  size_t open_connections_ = 0;
  bool accepting_ = false;
};

}  // namespace chessd
