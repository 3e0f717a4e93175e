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
#include <string>
#include <string_view>

#include "chess/board.h"
#include "chess/types.h"
#include "utils/expected.h"

namespace chessd {

enum class MoveError : uint8_t {
  // The move fails the legality rules or arrives while play is suspended.
  kInvalidMove,
  // No promotion is pending, or the chosen piece kind is not allowed.
  kInvalidPromotionRequest,
};

std::ostream& operator<<(std::ostream& os, MoveError error);

// Irreversible "has moved" flags. A flag is raised as soon as the original
// square of the king or corner rook is vacated or occupied.
struct MovedFlags {
  bool white_king = false;
  bool black_king = false;
  bool white_a_rook = false;
  bool black_a_rook = false;
  bool white_h_rook = false;
  bool black_h_rook = false;

  bool king(Color c) const {
    return c == Color::kWhite ? white_king : black_king;
  }
  bool a_rook(Color c) const {
    return c == Color::kWhite ? white_a_rook : black_a_rook;
  }
  bool h_rook(Color c) const {
    return c == Color::kWhite ? white_h_rook : black_h_rook;
  }
  bool operator==(const MovedFlags& other) const = default;
};

// Authoritative record of a single game.
class GameState {
 public:
  // Standard starting position, white to move.
  GameState();
  GameState(const Board& board, Color turn, std::optional<File> en_passant,
            uint8_t half_move_clock, const MovedFlags& moved,
            std::optional<Square> pending_promotion);

  // Parses a full six-field FEN string. Missing castling rights are mapped
  // onto the moved flags. Throws Exception on malformed input.
  static GameState FromFen(std::string_view fen);

  const Board& board() const { return board_; }
  Color turn() const { return turn_; }
  // File of a pawn that has just advanced two squares.
  std::optional<File> en_passant_file() const { return en_passant_; }
  uint8_t half_move_clock() const { return half_move_clock_; }
  const MovedFlags& moved() const { return moved_; }
  bool pending_promotion() const { return promotion_square_.has_value(); }
  // Square of the pawn waiting to be promoted.
  std::optional<Square> promotion_square() const { return promotion_square_; }

  // Applies a fully legal move for the side to move. Returns whether more
  // than the two named squares changed (castling and en passant). The state
  // is left untouched on error.
  Expected<bool, MoveError> ApplyMove(Move move);

  // Replaces the pawn waiting on the last rank with a piece of @type. Returns
  // the square of the promoted piece.
  Expected<Square, MoveError> Promote(PieceType type);

  // Attack evaluation pretends the other side is on move.
  GameState WithTurn(Color turn) const;
  Board* mutable_board() { return &board_; }

  std::string DebugString() const;

  bool operator==(const GameState& other) const = default;

 private:
  Board board_;
  Color turn_ = Color::kWhite;
  std::optional<File> en_passant_;
  uint8_t half_move_clock_ = 0;
  MovedFlags moved_;
  std::optional<Square> promotion_square_;
};

}  // namespace chessd
