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

#include <cstdint>
#include <ostream>
#include <variant>

#include "chess/game_end.h"
#include "chess/gamestate.h"
#include "chess/types.h"

namespace chessd {

// Opaque identity of a client connection, assigned by the transport.
using ConnectionId = uint64_t;
using GameId = uint32_t;

// Commands received from clients.
struct MoveCommand {
  Move move;
  bool operator==(const MoveCommand&) const = default;
};
struct PromoteCommand {
  PieceType piece;
  bool operator==(const PromoteCommand&) const = default;
};
struct RequestDrawCommand {
  bool operator==(const RequestDrawCommand&) const = default;
};
struct ReconnectCommand {
  bool operator==(const ReconnectCommand&) const = default;
};
struct ResignCommand {
  bool operator==(const ResignCommand&) const = default;
};

using ClientMessage = std::variant<MoveCommand, PromoteCommand,
                                   RequestDrawCommand, ReconnectCommand,
                                   ResignCommand>;

// Notifications sent to clients.
struct MatchFound {
  Color color;
  bool operator==(const MatchFound&) const = default;
};
struct MoveApplied {
  Move move;
  bool operator==(const MoveApplied&) const = default;
};
struct PromotionApplied {
  PieceType piece;
  bool operator==(const PromotionApplied&) const = default;
};
// Full state of the game. Serves both as rejection echo and reconnect resync.
struct StateSnapshot {
  GameState state;
  bool operator==(const StateSnapshot&) const = default;
};
struct DrawOffered {
  bool operator==(const DrawOffered&) const = default;
};
struct GameEnded {
  GameOutcome outcome;
  bool operator==(const GameEnded&) const = default;
};

using ServerMessage = std::variant<MatchFound, MoveApplied, PromotionApplied,
                                   StateSnapshot, DrawOffered, GameEnded>;

std::ostream& operator<<(std::ostream& os, const ClientMessage& message);
std::ostream& operator<<(std::ostream& os, const ServerMessage& message);

}  // namespace chessd
