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

#include "chess/gamestate.h"
#include "chess/types.h"

namespace chessd {

// Move legality is split in two tiers. Pseudo-legality follows the movement
// pattern of the piece and board occupancy only. Full legality additionally
// requires that the mover's king is not attacked afterwards. Attack detection
// uses pseudo-legality only, so the tiers never recurse into each other.

// Whether @move follows the movement rules for the piece on its source square.
// Always false if source equals destination, the source is empty, or the
// piece doesn't belong to the side to move.
bool IsPseudoLegal(const GameState& state, Move move);

// Whether any piece of color @by has a pseudo-legal move landing on @square.
// Castling never attacks.
bool IsSquareAttacked(const GameState& state, Square square, Color by);

// Relocates the moving piece on a copy of the board (no castling or en
// passant side effects) and checks whether the mover's king is attacked.
// Throws Exception if the mover has no king.
bool LeavesKingInCheck(const GameState& state, Move move);

// Pseudo-legal and doesn't leave own king in check.
bool IsLegalMove(const GameState& state, Move move);

// Whether the king of @color is attacked. Throws Exception if it's missing.
bool IsInCheck(const GameState& state, Color color);

// All fully legal moves of the side to move, ordered by source square and
// then by destination square, both from a1 to h8.
MoveList GenerateLegalMoves(const GameState& state);

// Same as !GenerateLegalMoves(state).empty(), but stops at the first move.
bool HasLegalMove(const GameState& state);

}  // namespace chessd
