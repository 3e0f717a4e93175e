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
#include <optional>
#include <ostream>
#include <vector>

#include "chess/board.h"
#include "chess/gamestate.h"

namespace chessd {

enum class GameResult : uint8_t { kWhiteWins, kBlackWins, kDraw };

enum class EndReason : uint8_t {
  kCheckmate,
  kStalemate,
  kResignation,
  kAgreement,
  kInsufficientMaterial,
  kFiftyMoveRule,
  kThreefoldRepetition,
};

struct GameOutcome {
  GameResult result;
  EndReason reason;
  bool operator==(const GameOutcome& other) const = default;
};

std::ostream& operator<<(std::ostream& os, GameResult result);
std::ostream& operator<<(std::ostream& os, EndReason reason);
std::ostream& operator<<(std::ostream& os, const GameOutcome& outcome);

// Win for @winner.
GameOutcome WinFor(Color winner, EndReason reason);

// Compact boards, one per completed move.
using MoveHistory = std::vector<CompactBoard>;

// Classifies the position after a completed move. Checks run in this order
// and the first match wins: fifty-move rule, threefold repetition of the
// current board within @history, insufficient material, then the legal move
// sweep for checkmate or stalemate. Returns nullopt while the game goes on.
std::optional<GameOutcome> CheckGameEnd(const GameState& state,
                                        const MoveHistory& history);

// Bare kings, or kings with a single bishop or knight.
bool IsInsufficientMaterial(const Board& board);

}  // namespace chessd
