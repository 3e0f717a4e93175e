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

#include "chess/board.h"

#include <cctype>
#include <sstream>

#include "utils/exception.h"

namespace chessd {

const char* Board::kStartposPlacement =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR";

Board Board::StartingPosition() { return FromFen(kStartposPlacement); }

Board Board::FromFen(std::string_view placement) {
  const std::string fen(placement);
  Board board;
  int row = 7;
  int col = 0;
  for (char c : placement) {
    if (c == '/') {
      if (col != 8) throw Exception("Bad fen string (short row): " + fen);
      --row;
      if (row < 0) throw Exception("Bad fen string (too many rows): " + fen);
      col = 0;
      continue;
    }
    if (c >= '1' && c <= '8') {
      col += c - '0';
      if (col > 8) {
        throw Exception("Bad fen string (too many columns): " + fen);
      }
      continue;
    }
    if (col >= 8) throw Exception("Bad fen string (too many columns): " + fen);
    const auto type = PieceType::Parse(c);
    if (!type) throw Exception("Bad fen string: " + fen);
    const Color color =
        std::isupper(static_cast<unsigned char>(c)) ? Color::kWhite
                                                    : Color::kBlack;
    board.Set(Square(File::FromIdx(col), Rank::FromIdx(row)),
              Piece{color, *type});
    ++col;
  }
  if (row != 0 || col != 8) {
    throw Exception("Bad fen string (too few squares): " + fen);
  }
  return board;
}

std::optional<Board> Board::FromCompact(const CompactBoard& compact) {
  Board board;
  for (uint8_t idx = 0; idx < 64; ++idx) {
    const uint8_t nibble =
        (idx % 2 == 0) ? compact[idx / 2] & 0x0f : compact[idx / 2] >> 4;
    if (nibble == 0) continue;
    const uint8_t code = nibble & 0b0111;
    if (code == 0 || code == 7) return std::nullopt;
    const Color color = (nibble & 0b1000) ? Color::kBlack : Color::kWhite;
    board.squares_[idx] = Piece{color, PieceType::FromIdx(code - 1)};
  }
  return board;
}

void Board::Relocate(Square from, Square to) {
  squares_[to.as_idx()] = squares_[from.as_idx()];
  squares_[from.as_idx()].reset();
}

int Board::PieceCount() const {
  int count = 0;
  for (const auto& square : squares_) count += square.has_value();
  return count;
}

Square Board::KingSquare(Color color) const {
  for (uint8_t idx = 0; idx < 64; ++idx) {
    const auto& piece = squares_[idx];
    if (piece && piece->type == kKing && piece->color == color) {
      return Square::FromIdx(idx);
    }
  }
  throw Exception("No " + ColorToString(color) + " king on board " + ToFen());
}

CompactBoard Board::Compact() const {
  CompactBoard result{};
  for (uint8_t idx = 0; idx < 64; ++idx) {
    const auto& piece = squares_[idx];
    if (!piece) continue;
    uint8_t nibble = piece->type.idx + 1;
    if (piece->color == Color::kBlack) nibble |= 0b1000;
    result[idx / 2] |= (idx % 2 == 0) ? nibble : nibble << 4;
  }
  return result;
}

std::string Board::ToFen() const {
  std::string result;
  for (int row = 7; row >= 0; --row) {
    int empty = 0;
    for (int col = 0; col < 8; ++col) {
      const auto& piece = squares_[row * 8 + col];
      if (!piece) {
        ++empty;
        continue;
      }
      if (empty) result += std::to_string(empty);
      empty = 0;
      result += piece->ToChar();
    }
    if (empty) result += std::to_string(empty);
    if (row > 0) result += '/';
  }
  return result;
}

std::string Board::DebugString() const {
  std::ostringstream result;
  for (int row = 7; row >= 0; --row) {
    for (int col = 0; col < 8; ++col) {
      const auto& piece = squares_[row * 8 + col];
      result << (piece ? piece->ToChar() : '.');
    }
    result << '\n';
  }
  return result.str();
}

}  // namespace chessd
