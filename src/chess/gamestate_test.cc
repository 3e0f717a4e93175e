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

#include <gtest/gtest.h>

#include "chess/rules.h"
#include "utils/exception.h"

namespace chessd {
namespace {

Move M(std::string_view str) { return *Move::Parse(str); }
Square Sq(std::string_view str) { return *Square::Parse(str); }

void Play(GameState* state, std::initializer_list<std::string_view> moves) {
  for (const auto move : moves) {
    ASSERT_TRUE(state->ApplyMove(M(move))) << move;
  }
}

}  // namespace

TEST(GameState, DoublePawnPushSetsEnPassantFile) {
  GameState state;
  const auto result = state.ApplyMove(M("e2e4"));
  ASSERT_TRUE(result);
  EXPECT_FALSE(result.value());
  EXPECT_EQ(state.en_passant_file(), kFileE);
  EXPECT_EQ(state.turn(), Color::kBlack);
  EXPECT_EQ(state.half_move_clock(), 0);
  Play(&state, {"g8f6"});
  EXPECT_FALSE(state.en_passant_file());
}

TEST(GameState, MatchesFen) {
  GameState state;
  Play(&state, {"e2e4"});
  EXPECT_EQ(state,
            GameState::FromFen("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR "
                               "b KQkq e3 0 1"));
}

TEST(GameState, HalfMoveClock) {
  GameState state;
  Play(&state, {"g1f3"});
  EXPECT_EQ(state.half_move_clock(), 1);
  Play(&state, {"g8f6"});
  EXPECT_EQ(state.half_move_clock(), 2);
  Play(&state, {"e2e3"});
  EXPECT_EQ(state.half_move_clock(), 0);
  Play(&state, {"f6e4", "f3e5"});
  EXPECT_EQ(state.half_move_clock(), 2);
  Play(&state, {"e4f2"});  // Capture.
  EXPECT_EQ(state.half_move_clock(), 0);
}

TEST(GameState, RejectedMoveLeavesStateUntouched) {
  GameState state;
  const GameState before = state;
  for (const auto move : {"e2e5", "e7e5", "e1e2", "a1a3", "b1b3"}) {
    const auto result = state.ApplyMove(M(move));
    ASSERT_FALSE(result) << move;
    EXPECT_EQ(result.error(), MoveError::kInvalidMove);
    EXPECT_EQ(state, before);
  }
}

TEST(GameState, EnPassantCapture) {
  GameState state = GameState::FromFen("4k3/8/8/3Pp3/8/8/8/4K3 w - e6 7 1");
  const auto result = state.ApplyMove(M("d5e6"));
  ASSERT_TRUE(result);
  EXPECT_TRUE(result.value());
  EXPECT_FALSE(state.board().at(Sq("e5")));
  EXPECT_FALSE(state.board().at(Sq("d5")));
  EXPECT_EQ(state.board().at(Sq("e6")), (Piece{Color::kWhite, kPawn}));
  EXPECT_EQ(state.half_move_clock(), 0);
  EXPECT_FALSE(state.en_passant_file());
}

TEST(GameState, KingSideCastling) {
  GameState state = GameState::FromFen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
  const auto result = state.ApplyMove(M("e1g1"));
  ASSERT_TRUE(result);
  EXPECT_TRUE(result.value());
  EXPECT_EQ(state.board().at(Sq("g1")), (Piece{Color::kWhite, kKing}));
  EXPECT_EQ(state.board().at(Sq("f1")), (Piece{Color::kWhite, kRook}));
  EXPECT_FALSE(state.board().at(kSquareH1));
  EXPECT_FALSE(state.board().at(kSquareE1));
  EXPECT_TRUE(state.moved().white_king);
  EXPECT_FALSE(state.moved().black_king);
}

TEST(GameState, QueenSideCastling) {
  GameState state = GameState::FromFen("r3k2r/8/8/8/8/8/8/R3K2R b KQkq - 0 1");
  ASSERT_TRUE(state.ApplyMove(M("e8c8")));
  EXPECT_EQ(state.board().at(Sq("c8")), (Piece{Color::kBlack, kKing}));
  EXPECT_EQ(state.board().at(Sq("d8")), (Piece{Color::kBlack, kRook}));
  EXPECT_FALSE(state.board().at(kSquareA8));
  EXPECT_TRUE(state.moved().black_king);
}

TEST(GameState, ReturningKingDoesNotRestoreCastling) {
  GameState state = GameState::FromFen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
  const Board board = state.board();
  Play(&state, {"e1f1", "e8f8", "f1e1", "f8e8"});
  EXPECT_EQ(state.board(), board);
  EXPECT_FALSE(state.ApplyMove(M("e1g1")));
  EXPECT_FALSE(state.ApplyMove(M("e1c1")));
}

TEST(GameState, CapturedCornerRookRaisesFlags) {
  GameState state = GameState::FromFen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
  Play(&state, {"a1a8"});
  EXPECT_TRUE(state.moved().white_a_rook);
  EXPECT_TRUE(state.moved().black_a_rook);
  EXPECT_FALSE(state.moved().black_king);
  EXPECT_FALSE(IsLegalMove(state, M("e8c8")));
}

TEST(GameState, Promotion) {
  GameState state = GameState::FromFen("4k3/P7/8/8/8/8/8/4K3 w - - 0 1");
  EXPECT_FALSE(state.Promote(kQueen));
  ASSERT_TRUE(state.ApplyMove(M("a7a8")));
  EXPECT_TRUE(state.pending_promotion());
  EXPECT_EQ(state.promotion_square(), kSquareA8);
  EXPECT_EQ(state.turn(), Color::kBlack);

  // Play is suspended until the pawn is replaced.
  const auto blocked = state.ApplyMove(M("e8d7"));
  ASSERT_FALSE(blocked);
  EXPECT_EQ(blocked.error(), MoveError::kInvalidMove);

  EXPECT_EQ(state.Promote(kKing).error(), MoveError::kInvalidPromotionRequest);
  EXPECT_EQ(state.Promote(kPawn).error(), MoveError::kInvalidPromotionRequest);
  EXPECT_TRUE(state.pending_promotion());

  const auto square = state.Promote(kKnight);
  ASSERT_TRUE(square);
  EXPECT_EQ(square.value(), kSquareA8);
  EXPECT_EQ(state.board().at(kSquareA8), (Piece{Color::kWhite, kKnight}));
  EXPECT_FALSE(state.pending_promotion());
  EXPECT_FALSE(state.Promote(kQueen));
  EXPECT_TRUE(state.ApplyMove(M("e8d7")));
}

TEST(GameState, BlackPromotion) {
  GameState state = GameState::FromFen("4k3/8/8/8/8/8/7p/K7 b - - 0 1");
  ASSERT_TRUE(state.ApplyMove(M("h2h1")));
  ASSERT_TRUE(state.Promote(kQueen));
  EXPECT_EQ(state.board().at(kSquareH1), (Piece{Color::kBlack, kQueen}));
}

TEST(GameState, ReverseRelocationRestoresBoardOnly) {
  const GameState start;
  for (const Move& move : GenerateLegalMoves(start)) {
    GameState state = start;
    ASSERT_TRUE(state.ApplyMove(move));
    state.mutable_board()->Relocate(move.to(), move.from());
    EXPECT_EQ(state.board(), start.board()) << move.ToString();
    // Turn, clock and en passant file stay changed.
    EXPECT_NE(state, start) << move.ToString();
  }
}

TEST(GameState, BadFenThrows) {
  EXPECT_THROW(GameState::FromFen("xyz"), Exception);
  EXPECT_THROW(GameState::FromFen("8/8/8/8/8/8/8/4K2k x - - 0 1"), Exception);
  EXPECT_THROW(GameState::FromFen("8/8/8/8/8/8/8/4K2k w X - 0 1"), Exception);
  EXPECT_THROW(GameState::FromFen("8/8/8/8/8/8/8/4K2k w - z9 0 1"), Exception);
  EXPECT_THROW(GameState::FromFen("8/8/8/8/8/8/8/4K2k w - - 300 1"), Exception);
}

TEST(GameState, DebugString) {
  GameState state;
  Play(&state, {"e2e4"});
  EXPECT_EQ(state.DebugString(),
            "rnbqkbnr\n"
            "pppppppp\n"
            "........\n"
            "........\n"
            "....P...\n"
            "........\n"
            "PPPP.PPP\n"
            "RNBQKBNR\n"
            "turn black, en passant e, clock 0\n");
}

}  // namespace chessd

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
