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

#include "chess/gamestate.h"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "chess/rules.h"
#include "utils/exception.h"

namespace chessd {

std::ostream& operator<<(std::ostream& os, MoveError error) {
  switch (error) {
    case MoveError::kInvalidMove:
      return os << "InvalidMove";
    case MoveError::kInvalidPromotionRequest:
      return os << "InvalidPromotionRequest";
  }
  return os;
}

GameState::GameState() : board_(Board::StartingPosition()) {}

GameState::GameState(const Board& board, Color turn,
                     std::optional<File> en_passant, uint8_t half_move_clock,
                     const MovedFlags& moved,
                     std::optional<Square> pending_promotion)
    : board_(board),
      turn_(turn),
      en_passant_(en_passant),
      half_move_clock_(half_move_clock),
      moved_(moved),
      promotion_square_(pending_promotion) {}

GameState GameState::FromFen(std::string_view fen_view) {
  const std::string fen(fen_view);
  std::istringstream fen_str(fen);
  std::string placement;
  std::string who_to_move = "w";
  std::string castlings = "-";
  std::string en_passant = "-";
  int half_moves = 0;
  fen_str >> placement;
  if (!fen_str.eof()) fen_str >> who_to_move;
  if (!fen_str.eof()) fen_str >> castlings;
  if (!fen_str.eof()) fen_str >> en_passant;
  if (!fen_str.eof()) fen_str >> half_moves;
  if (!fen_str) throw Exception("Bad fen string: " + fen);

  GameState state;
  state.board_ = Board::FromFen(placement);

  if (who_to_move == "w") {
    state.turn_ = Color::kWhite;
  } else if (who_to_move == "b") {
    state.turn_ = Color::kBlack;
  } else {
    throw Exception("Bad fen string (side to move): " + fen);
  }

  if (castlings != "-" &&
      castlings.find_first_not_of("KQkq") != std::string::npos) {
    throw Exception("Bad fen string (castlings): " + fen);
  }
  auto has = [&castlings](char c) {
    return castlings.find(c) != std::string::npos;
  };
  state.moved_.white_h_rook = !has('K');
  state.moved_.white_a_rook = !has('Q');
  state.moved_.white_king = !has('K') && !has('Q');
  state.moved_.black_h_rook = !has('k');
  state.moved_.black_a_rook = !has('q');
  state.moved_.black_king = !has('k') && !has('q');

  if (en_passant != "-") {
    const auto square = Square::Parse(en_passant);
    if (!square) throw Exception("Bad fen string (en passant): " + fen);
    state.en_passant_ = square->file();
  }

  if (half_moves < 0 || half_moves > 255) {
    throw Exception("Bad fen string (half move clock): " + fen);
  }
  state.half_move_clock_ = static_cast<uint8_t>(half_moves);
  return state;
}

Expected<bool, MoveError> GameState::ApplyMove(Move move) {
  if (pending_promotion() || !IsLegalMove(*this, move)) {
    return Unexpected(MoveError::kInvalidMove);
  }
  const Square from = move.from();
  const Square to = move.to();
  const Piece piece = *board_.at(from);
  const bool is_pawn = piece.type == kPawn;
  bool capture = board_.at(to).has_value();
  bool redraw = false;

  // En passant: a pawn changing file onto an empty square.
  if (is_pawn && !capture && from.file() != to.file()) {
    board_.Clear(Square(to.file(), from.rank()));
    capture = true;
    redraw = true;
  }

  if (capture || is_pawn) {
    half_move_clock_ = 0;
  } else if (half_move_clock_ < 255) {
    ++half_move_clock_;
  }

  board_.Relocate(from, to);

  if (is_pawn && std::abs(to.rank() - from.rank()) == 2) {
    en_passant_ = to.file();
  } else {
    en_passant_.reset();
  }

  for (const Square square : {from, to}) {
    if (square == kSquareE1) moved_.white_king = true;
    if (square == kSquareE8) moved_.black_king = true;
    if (square == kSquareA1) moved_.white_a_rook = true;
    if (square == kSquareA8) moved_.black_a_rook = true;
    if (square == kSquareH1) moved_.white_h_rook = true;
    if (square == kSquareH8) moved_.black_h_rook = true;
  }

  if (piece.type == kKing && std::abs(to.file() - from.file()) == 2) {
    const bool king_side = to.file() == kFileG;
    board_.Relocate(Square(king_side ? kFileH : kFileA, from.rank()),
                    Square(king_side ? kFileF : kFileD, from.rank()));
    redraw = true;
  }

  const Rank last_rank = piece.color == Color::kWhite ? kRank8 : kRank1;
  if (is_pawn && to.rank() == last_rank) promotion_square_ = to;

  turn_ = Opponent(turn_);
  return redraw;
}

Expected<Square, MoveError> GameState::Promote(PieceType type) {
  if (!promotion_square_ || !type.CanPromoteInto()) {
    return Unexpected(MoveError::kInvalidPromotionRequest);
  }
  const Square square = *promotion_square_;
  const auto& pawn = board_.at(square);
  const Color color = pawn ? pawn->color : Opponent(turn_);
  board_.Set(square, Piece{color, type});
  promotion_square_.reset();
  return square;
}

GameState GameState::WithTurn(Color turn) const {
  GameState result = *this;
  result.turn_ = turn;
  return result;
}

std::string GameState::DebugString() const {
  std::ostringstream result;
  result << board_.DebugString();
  result << "turn " << ColorToString(turn_) << ", en passant "
         << (en_passant_ ? en_passant_->ToString() : "-") << ", clock "
         << static_cast<int>(half_move_clock_);
  if (promotion_square_) {
    result << ", promotion pending on " << promotion_square_->ToString();
  }
  result << '\n';
  return result.str();
}

}  // namespace chessd
