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

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chessd {

enum class Color : uint8_t { kWhite = 0, kBlack = 1 };

inline constexpr Color Opponent(Color color) {
  return color == Color::kWhite ? Color::kBlack : Color::kWhite;
}

inline std::string ColorToString(Color color) {
  return color == Color::kWhite ? "white" : "black";
}

// Piece kind. Indices are ordered so that idx + 1 is the kind code used by the
// compact board encoding.
struct PieceType {
  uint8_t idx;
  static constexpr PieceType FromIdx(uint8_t idx) { return PieceType{idx}; }
  // Returns nullopt for characters which don't name a piece.
  static std::optional<PieceType> Parse(char c);
  std::string ToString(bool uppercase = false) const {
    return std::string(1, "kqrnbp"[idx] + (uppercase ? 'A' - 'a' : 0));
  }
  // Pawns promote into anything but a king or a pawn.
  bool CanPromoteInto() const { return idx >= 1 && idx <= 4; }
  bool IsValid() const { return idx < 6; }
  bool operator==(const PieceType& other) const = default;
  bool operator!=(const PieceType& other) const = default;

 private:
  constexpr explicit PieceType(uint8_t idx) : idx(idx) {}
};

constexpr PieceType kKing = PieceType::FromIdx(0),
                    kQueen = PieceType::FromIdx(1),
                    kRook = PieceType::FromIdx(2),
                    kKnight = PieceType::FromIdx(3),
                    kBishop = PieceType::FromIdx(4),
                    kPawn = PieceType::FromIdx(5);

struct File {
  uint8_t idx;
  static constexpr File FromIdx(uint8_t idx) { return File{idx}; }
  // Maps any integer onto a file, wrapping modulo 8.
  static constexpr File FromInt(int value) {
    return File{static_cast<uint8_t>(((value % 8) + 8) % 8)};
  }
  static File Parse(char c) {
    return File(static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) - 'a'));
  }
  constexpr bool IsValid() const { return idx < 8; }
  std::string ToString(bool uppercase = false) const {
    return std::string(1, (uppercase ? 'A' : 'a') + idx);
  }
  auto operator<=>(const File& other) const = default;

 private:
  constexpr explicit File(uint8_t idx) : idx(idx) {}
};

constexpr File kFileA = File::FromIdx(0), kFileB = File::FromIdx(1),
               kFileC = File::FromIdx(2), kFileD = File::FromIdx(3),
               kFileE = File::FromIdx(4), kFileF = File::FromIdx(5),
               kFileG = File::FromIdx(6), kFileH = File::FromIdx(7);

struct Rank {
  uint8_t idx;
  static constexpr Rank FromIdx(uint8_t idx) { return Rank{idx}; }
  // Maps any integer onto a rank, wrapping modulo 8.
  static constexpr Rank FromInt(int value) {
    return Rank{static_cast<uint8_t>(((value % 8) + 8) % 8)};
  }
  static constexpr Rank Parse(char c) {
    return Rank(static_cast<uint8_t>(c - '1'));
  }
  constexpr bool IsValid() const { return idx < 8; }
  std::string ToString() const { return std::string(1, '1' + idx); }
  auto operator<=>(const Rank& other) const = default;

 private:
  constexpr explicit Rank(uint8_t idx) : idx(idx) {}
};

constexpr Rank kRank1 = Rank::FromIdx(0), kRank2 = Rank::FromIdx(1),
               kRank3 = Rank::FromIdx(2), kRank4 = Rank::FromIdx(3),
               kRank5 = Rank::FromIdx(4), kRank6 = Rank::FromIdx(5),
               kRank7 = Rank::FromIdx(6), kRank8 = Rank::FromIdx(7);

inline int operator-(File a, File b) { return static_cast<int>(a.idx) - b.idx; }
inline int operator-(Rank a, Rank b) { return static_cast<int>(a.idx) - b.idx; }

// Stores a coordinates of a single square.
class Square {
 public:
  constexpr Square() = default;
  constexpr Square(File file, Rank rank) : idx_(rank.idx * 8 + file.idx) {}
  static constexpr Square FromIdx(uint8_t idx) { return Square{idx}; }
  // Parses "e4". Returns nullopt for anything else.
  static std::optional<Square> Parse(std::string_view str);
  constexpr File file() const { return File::FromIdx(idx_ % 8); }
  constexpr Rank rank() const { return Rank::FromIdx(idx_ / 8); }
  std::string ToString(bool uppercase = false) const {
    return file().ToString(uppercase) + rank().ToString();
  }
  constexpr bool operator==(const Square& other) const = default;
  constexpr bool operator!=(const Square& other) const = default;
  constexpr uint8_t as_idx() const { return idx_; }

 private:
  explicit constexpr Square(uint8_t idx) : idx_(idx) {}

  // 0 is a1, 1 is b1, 8 is a2, 63 is h8.
  uint8_t idx_ = 0;
};

constexpr Square kSquareA1 = Square(kFileA, kRank1),
                 kSquareE1 = Square(kFileE, kRank1),
                 kSquareH1 = Square(kFileH, kRank1),
                 kSquareA8 = Square(kFileA, kRank8),
                 kSquareE8 = Square(kFileE, kRank8),
                 kSquareH8 = Square(kFileH, kRank8);

struct Piece {
  Color color;
  PieceType type;

  // FEN letter, uppercase for white.
  char ToChar() const {
    return type.ToString(color == Color::kWhite)[0];
  }
  bool operator==(const Piece& other) const = default;
};

// A (from, to) pair. Promotion choice travels separately.
class Move {
 public:
  constexpr Move() = default;
  constexpr Move(Square from, Square to) : from_(from), to_(to) {}
  // Parses "e2e4". Returns nullopt on malformed input.
  static std::optional<Move> Parse(std::string_view str);

  constexpr Square from() const { return from_; }
  constexpr Square to() const { return to_; }
  std::string ToString() const { return from_.ToString() + to_.ToString(); }
  bool operator==(const Move& other) const = default;

 private:
  Square from_;
  Square to_;
};

using MoveList = std::vector<Move>;

inline std::optional<PieceType> PieceType::Parse(char c) {
  switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'k':
      return kKing;
    case 'q':
      return kQueen;
    case 'r':
      return kRook;
    case 'n':
      return kKnight;
    case 'b':
      return kBishop;
    case 'p':
      return kPawn;
    default:
      return std::nullopt;
  }
}

inline std::optional<Square> Square::Parse(std::string_view str) {
  if (str.size() != 2) return std::nullopt;
  const File file = File::Parse(str[0]);
  const Rank rank = Rank::Parse(str[1]);
  if (!file.IsValid() || !rank.IsValid()) return std::nullopt;
  return Square(file, rank);
}

inline std::optional<Move> Move::Parse(std::string_view str) {
  if (str.size() != 4) return std::nullopt;
  const auto from = Square::Parse(str.substr(0, 2));
  const auto to = Square::Parse(str.substr(2, 2));
  if (!from || !to) return std::nullopt;
  return Move(*from, *to);
}

}  // namespace chessd
