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

#include "chess/rules.h"

#include <cstdlib>

namespace chessd {
namespace {

int Sign(int x) { return (x > 0) - (x < 0); }

Rank HomeRank(Color color) {
  return color == Color::kWhite ? kRank1 : kRank8;
}

// Squares strictly between @from and @to on a straight or diagonal line must
// be empty.
bool IsRayClear(const Board& board, Square from, Square to) {
  const int dr = Sign(to.rank() - from.rank());
  const int df = Sign(to.file() - from.file());
  int rank = from.rank().idx + dr;
  int file = from.file().idx + df;
  while (rank != to.rank().idx || file != to.file().idx) {
    if (board.at(Square(File::FromIdx(file), Rank::FromIdx(rank)))) {
      return false;
    }
    rank += dr;
    file += df;
  }
  return true;
}

bool IsRookMove(const Board& board, Square from, Square to) {
  if (from.rank() != to.rank() && from.file() != to.file()) return false;
  return IsRayClear(board, from, to);
}

bool IsBishopMove(const Board& board, Square from, Square to) {
  if (std::abs(to.rank() - from.rank()) != std::abs(to.file() - from.file())) {
    return false;
  }
  return IsRayClear(board, from, to);
}

bool IsKnightMove(Square from, Square to) {
  const int dr = std::abs(to.rank() - from.rank());
  const int df = std::abs(to.file() - from.file());
  return (dr == 1 && df == 2) || (dr == 2 && df == 1);
}

bool IsPawnMove(const GameState& state, Color color, Square from, Square to) {
  const Board& board = state.board();
  const int dir = color == Color::kWhite ? 1 : -1;
  const int dr = to.rank() - from.rank();
  const int df = to.file() - from.file();

  if (df == 0) {
    if (board.at(to)) return false;
    if (dr == dir) return true;
    const Rank start_rank = color == Color::kWhite ? kRank2 : kRank7;
    if (dr == 2 * dir && from.rank() == start_rank) {
      const Square passed(from.file(), Rank::FromIdx(from.rank().idx + dir));
      return !board.at(passed);
    }
    return false;
  }

  if (std::abs(df) != 1 || dr != dir) return false;
  // Destination can't hold an own piece at this point.
  if (board.at(to)) return true;

  // En passant: the enemy pawn stands beside the capturing pawn.
  const Rank ep_rank = color == Color::kWhite ? kRank5 : kRank4;
  if (!state.en_passant_file() || *state.en_passant_file() != to.file() ||
      from.rank() != ep_rank) {
    return false;
  }
  const auto& victim = board.at(Square(to.file(), from.rank()));
  return victim && victim->color != color && victim->type == kPawn;
}

bool IsCastling(const GameState& state, Color color, Square from, Square to) {
  const Board& board = state.board();
  const Rank home = HomeRank(color);
  if (from != Square(kFileE, home) || to.rank() != home) return false;
  if (state.moved().king(color)) return false;

  const bool king_side = to.file() == kFileG;
  if (!king_side && to.file() != kFileC) return false;
  if (king_side ? state.moved().h_rook(color) : state.moved().a_rook(color)) {
    return false;
  }
  const auto& rook = board.at(Square(king_side ? kFileH : kFileA, home));
  if (!rook || rook->color != color || rook->type != kRook) return false;

  const File first_between = king_side ? kFileF : kFileB;
  const File last_between = king_side ? kFileG : kFileD;
  for (uint8_t f = first_between.idx; f <= last_between.idx; ++f) {
    if (board.at(Square(File::FromIdx(f), home))) return false;
  }

  // King start, path and destination squares.
  const Color enemy = Opponent(color);
  const File first_walked = king_side ? kFileE : kFileC;
  const File last_walked = king_side ? kFileG : kFileE;
  for (uint8_t f = first_walked.idx; f <= last_walked.idx; ++f) {
    if (IsSquareAttacked(state, Square(File::FromIdx(f), home), enemy)) {
      return false;
    }
  }
  return true;
}

bool IsPseudoLegalImpl(const GameState& state, Move move, bool with_castling) {
  const Square from = move.from();
  const Square to = move.to();
  if (from == to) return false;
  const auto& piece = state.board().at(from);
  if (!piece || piece->color != state.turn()) return false;
  const auto& target = state.board().at(to);
  if (target && target->color == piece->color) return false;

  const Board& board = state.board();
  switch (piece->type.idx) {
    case kKing.idx:
      if (std::abs(to.rank() - from.rank()) <= 1 &&
          std::abs(to.file() - from.file()) <= 1) {
        return true;
      }
      return with_castling && IsCastling(state, piece->color, from, to);
    case kQueen.idx:
      return IsRookMove(board, from, to) || IsBishopMove(board, from, to);
    case kRook.idx:
      return IsRookMove(board, from, to);
    case kBishop.idx:
      return IsBishopMove(board, from, to);
    case kKnight.idx:
      return IsKnightMove(from, to);
    case kPawn.idx:
      return IsPawnMove(state, piece->color, from, to);
  }
  return false;
}

}  // namespace

bool IsPseudoLegal(const GameState& state, Move move) {
  return IsPseudoLegalImpl(state, move, /*with_castling=*/true);
}

bool IsSquareAttacked(const GameState& state, Square square, Color by) {
  GameState sentinel = state.WithTurn(by);
  // Anything landing on the square has to capture there, pawns included.
  sentinel.mutable_board()->Set(square, Piece{Opponent(by), kPawn});
  for (uint8_t idx = 0; idx < 64; ++idx) {
    const Square from = Square::FromIdx(idx);
    const auto& piece = sentinel.board().at(from);
    if (!piece || piece->color != by) continue;
    if (IsPseudoLegalImpl(sentinel, Move(from, square),
                          /*with_castling=*/false)) {
      return true;
    }
  }
  return false;
}

bool LeavesKingInCheck(const GameState& state, Move move) {
  const Color mover = state.turn();
  GameState after = state;
  after.mutable_board()->Relocate(move.from(), move.to());
  return IsSquareAttacked(after, after.board().KingSquare(mover),
                          Opponent(mover));
}

bool IsLegalMove(const GameState& state, Move move) {
  return IsPseudoLegal(state, move) && !LeavesKingInCheck(state, move);
}

bool IsInCheck(const GameState& state, Color color) {
  return IsSquareAttacked(state, state.board().KingSquare(color),
                          Opponent(color));
}

MoveList GenerateLegalMoves(const GameState& state) {
  MoveList result;
  for (uint8_t from = 0; from < 64; ++from) {
    const auto& piece = state.board().at(Square::FromIdx(from));
    if (!piece || piece->color != state.turn()) continue;
    for (uint8_t to = 0; to < 64; ++to) {
      const Move move(Square::FromIdx(from), Square::FromIdx(to));
      if (IsLegalMove(state, move)) result.push_back(move);
    }
  }
  return result;
}

bool HasLegalMove(const GameState& state) {
  for (uint8_t from = 0; from < 64; ++from) {
    const auto& piece = state.board().at(Square::FromIdx(from));
    if (!piece || piece->color != state.turn()) continue;
    for (uint8_t to = 0; to < 64; ++to) {
      const Move move(Square::FromIdx(from), Square::FromIdx(to));
      if (IsLegalMove(state, move)) return true;
    }
  }
  return false;
}

}  // namespace chessd
