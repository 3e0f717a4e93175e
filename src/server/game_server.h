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

#include <absl/container/flat_hash_map.h>

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "chess/game_end.h"
#include "chess/gamestate.h"
#include "server/messages.h"

namespace chessd {

// Capability of a connected client. Implemented by the network transport and
// by test fakes. The server never owns the socket behind it.
class Client {
 public:
  virtual ~Client() = default;
  virtual ConnectionId id() const = 0;
  // Queues a message for delivery.
  virtual void Send(const ServerMessage& message) = 0;
  // Closes the connection once queued messages are delivered. Idempotent.
  virtual void Disconnect() = 0;
};

// Matchmaking and session registry. All methods must be called from a single
// thread, one event at a time.
class GameServer {
 public:
  // Returns a uniformly distributed integer in [min, max].
  using RandomIntFunc = std::function<int(int min, int max)>;

  GameServer();
  explicit GameServer(RandomIntFunc random);

  // Adds a freshly accepted connection to the waiting queue.
  void OnConnect(std::shared_ptr<Client> client);
  void OnMessage(ConnectionId id, const ClientMessage& message);
  // The connection is gone. Ends its game, or removes it from the queue.
  void OnDisconnect(ConnectionId id);
  // Pairs waiting connections while at least two are queued.
  void Tick();

  // Pairs two connected clients in a game starting from @initial. Both are
  // taken out of the waiting queue. Throws Exception if either is unknown or
  // already playing.
  GameId StartGame(ConnectionId white, ConnectionId black,
                   const GameState& initial = GameState());

  size_t waiting_count() const { return waiting_.size(); }
  size_t game_count() const { return games_.size(); }
  std::optional<GameId> FindGame(ConnectionId id) const;
  // Returns nullptr if there is no such game.
  const GameState* GetGameState(GameId id) const;

 private:
  struct Game {
    GameId id;
    GameState state;
    MoveHistory history;
    // Indexed by color.
    std::array<ConnectionId, 2> players;
    // Side which has an outstanding draw offer.
    std::optional<Color> draw_offer;

    ConnectionId player(Color color) const {
      return players[static_cast<int>(color)];
    }
    Color ColorOf(ConnectionId id) const {
      return players[0] == id ? Color::kWhite : Color::kBlack;
    }
  };

  void Handle(Game* game, Color color, const MoveCommand& command);
  void Handle(Game* game, Color color, const PromoteCommand& command);
  void Handle(Game* game, Color color, const RequestDrawCommand& command);
  void Handle(Game* game, Color color, const ReconnectCommand& command);
  void Handle(Game* game, Color color, const ResignCommand& command);

  Game* GetGame(ConnectionId id);
  void Send(ConnectionId id, const ServerMessage& message);
  void SendSnapshot(const Game& game, Color color);
  // Records the completed move and ends the game if it is over.
  void CompleteMove(Game* game);
  // Notifies both players and tears the game down.
  void EndGame(Game* game, const GameOutcome& outcome);
  // Removes the game with its connections from the registry and disconnects
  // both players.
  void TearDown(GameId id);
  // Removes a connection which isn't playing.
  void DropConnection(ConnectionId id);

  RandomIntFunc random_;
  GameId next_game_id_ = 0;

  absl::flat_hash_map<ConnectionId, std::shared_ptr<Client>> clients_;
  std::vector<ConnectionId> waiting_;
  absl::flat_hash_map<ConnectionId, GameId> connection_to_game_;
  absl::flat_hash_map<GameId, Game> games_;
};

}  // namespace chessd
