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

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "chess/types.h"

namespace chessd {

// 64 squares at 4 bits each. Square i is the low nibble of byte i / 2 when i
// is even and the high nibble when odd. A nibble is the kind code (king 1,
// queen 2, rook 3, knight 4, bishop 5, pawn 6) with bit 3 set for black pieces.
// Empty squares are 0.
using CompactBoard = std::array<uint8_t, 32>;

// Piece placement on an 8x8 board.
class Board {
 public:
  // Empty board.
  Board() = default;

  static const char* kStartposPlacement;
  static Board StartingPosition();

  // Parses the piece placement field of a FEN string. Throws Exception on
  // malformed input.
  static Board FromFen(std::string_view placement);

  // Inverse of Compact(). Returns nullopt if any nibble is not a valid code.
  static std::optional<Board> FromCompact(const CompactBoard& compact);

  const std::optional<Piece>& at(Square square) const {
    return squares_[square.as_idx()];
  }
  void Set(Square square, const std::optional<Piece>& piece) {
    squares_[square.as_idx()] = piece;
  }
  void Clear(Square square) { squares_[square.as_idx()].reset(); }
  // Moves whatever stands on @from to @to, overwriting it.
  void Relocate(Square from, Square to);

  // Total number of pieces of both colors.
  int PieceCount() const;
  // Square of the king of given color. A missing king is an invariant
  // violation and throws Exception.
  Square KingSquare(Color color) const;

  CompactBoard Compact() const;
  // Returns the placement field of a FEN string.
  std::string ToFen() const;
  // Eight rows, rank 8 first. Uppercase is white, '.' is an empty square.
  std::string DebugString() const;

  bool operator==(const Board& other) const = default;

 private:
  std::array<std::optional<Piece>, 64> squares_;
};

}  // namespace chessd
