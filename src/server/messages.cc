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

#include "server/messages.h"

namespace chessd {
namespace {

struct ClientMessagePrinter {
  std::ostream& os;
  void operator()(const MoveCommand& m) {
    os << "Move(" << m.move.ToString() << ")";
  }
  void operator()(const PromoteCommand& m) {
    os << "Promote(" << m.piece.ToString() << ")";
  }
  void operator()(const RequestDrawCommand&) { os << "RequestDraw"; }
  void operator()(const ReconnectCommand&) { os << "Reconnect"; }
  void operator()(const ResignCommand&) { os << "Resign"; }
};

struct ServerMessagePrinter {
  std::ostream& os;
  void operator()(const MatchFound& m) {
    os << "MatchFound(" << ColorToString(m.color) << ")";
  }
  void operator()(const MoveApplied& m) {
    os << "MoveApplied(" << m.move.ToString() << ")";
  }
  void operator()(const PromotionApplied& m) {
    os << "PromotionApplied(" << m.piece.ToString() << ")";
  }
  void operator()(const StateSnapshot& m) {
    os << "StateSnapshot(" << m.state.board().ToFen() << ")";
  }
  void operator()(const DrawOffered&) { os << "DrawOffered"; }
  void operator()(const GameEnded& m) {
    os << "GameEnded(" << m.outcome << ")";
  }
};

}  // namespace

std::ostream& operator<<(std::ostream& os, const ClientMessage& message) {
  std::visit(ClientMessagePrinter{os}, message);
  return os;
}

std::ostream& operator<<(std::ostream& os, const ServerMessage& message) {
  std::visit(ServerMessagePrinter{os}, message);
  return os;
}

}  // namespace chessd
