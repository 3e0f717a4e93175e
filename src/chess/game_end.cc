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

#include "chess/game_end.h"

#include <algorithm>

#include "chess/rules.h"

namespace chessd {
namespace {
const int kFiftyMoveClock = 50;
const int kRepetitions = 3;
}  // namespace

std::ostream& operator<<(std::ostream& os, GameResult result) {
  switch (result) {
    case GameResult::kWhiteWins:
      return os << "WhiteWins";
    case GameResult::kBlackWins:
      return os << "BlackWins";
    case GameResult::kDraw:
      return os << "Draw";
  }
  return os;
}

std::ostream& operator<<(std::ostream& os, EndReason reason) {
  switch (reason) {
    case EndReason::kCheckmate:
      return os << "Checkmate";
    case EndReason::kStalemate:
      return os << "Stalemate";
    case EndReason::kResignation:
      return os << "Resignation";
    case EndReason::kAgreement:
      return os << "Agreement";
    case EndReason::kInsufficientMaterial:
      return os << "InsufficientMaterial";
    case EndReason::kFiftyMoveRule:
      return os << "FiftyMoveRule";
    case EndReason::kThreefoldRepetition:
      return os << "ThreefoldRepetition";
  }
  return os;
}

std::ostream& operator<<(std::ostream& os, const GameOutcome& outcome) {
  return os << outcome.result << '(' << outcome.reason << ')';
}

GameOutcome WinFor(Color winner, EndReason reason) {
  return {winner == Color::kWhite ? GameResult::kWhiteWins
                                  : GameResult::kBlackWins,
          reason};
}

bool IsInsufficientMaterial(const Board& board) {
  const int count = board.PieceCount();
  if (count == 2) return true;
  if (count != 3) return false;
  for (uint8_t idx = 0; idx < 64; ++idx) {
    const auto& piece = board.at(Square::FromIdx(idx));
    if (!piece || piece->type == kKing) continue;
    return piece->type == kBishop || piece->type == kKnight;
  }
  return false;
}

std::optional<GameOutcome> CheckGameEnd(const GameState& state,
                                        const MoveHistory& history) {
  if (state.half_move_clock() >= kFiftyMoveClock) {
    return GameOutcome{GameResult::kDraw, EndReason::kFiftyMoveRule};
  }

  const CompactBoard current = state.board().Compact();
  if (std::count(history.begin(), history.end(), current) >= kRepetitions) {
    return GameOutcome{GameResult::kDraw, EndReason::kThreefoldRepetition};
  }

  if (IsInsufficientMaterial(state.board())) {
    return GameOutcome{GameResult::kDraw, EndReason::kInsufficientMaterial};
  }

  if (HasLegalMove(state)) return std::nullopt;

  if (IsInCheck(state, state.turn())) {
    return WinFor(Opponent(state.turn()), EndReason::kCheckmate);
  }
  return GameOutcome{GameResult::kDraw, EndReason::kStalemate};
}

}  // namespace chessd
