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

#include <gtest/gtest.h>

namespace chessd {
namespace {

// Plays moves the way the server does: the board is appended to the history
// after each completed move and then classified.
class GameEndTest : public ::testing::Test {
 protected:
  std::optional<GameOutcome> Play(std::string_view move) {
    EXPECT_TRUE(state_.ApplyMove(*Move::Parse(move))) << move;
    history_.push_back(state_.board().Compact());
    return CheckGameEnd(state_, history_);
  }

  GameState state_;
  MoveHistory history_;
};

std::optional<GameOutcome> Classify(std::string_view fen) {
  return CheckGameEnd(GameState::FromFen(fen), {});
}

}  // namespace

TEST_F(GameEndTest, FoolsMate) {
  EXPECT_FALSE(Play("f2f3"));
  EXPECT_FALSE(Play("e7e5"));
  EXPECT_FALSE(Play("g2g4"));
  EXPECT_EQ(Play("d8h4"),
            (GameOutcome{GameResult::kBlackWins, EndReason::kCheckmate}));
}

TEST_F(GameEndTest, BackRankMate) {
  state_ = GameState::FromFen("6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1");
  EXPECT_EQ(Play("a1a8"),
            (GameOutcome{GameResult::kWhiteWins, EndReason::kCheckmate}));
}

TEST_F(GameEndTest, ThreefoldRepetition) {
  const char* kCycle[] = {"g1f3", "g8f6", "f3g1", "f6g8"};
  for (int i = 0; i < 8; ++i) EXPECT_FALSE(Play(kCycle[i % 4])) << i;
  // The board after g1f3 appears for the third time.
  EXPECT_EQ(Play("g1f3"), (GameOutcome{GameResult::kDraw,
                                       EndReason::kThreefoldRepetition}));
}

TEST_F(GameEndTest, FiftyMoveRule) {
  state_ = GameState::FromFen("4k3/8/8/8/8/8/8/R3K3 w - - 48 1");
  EXPECT_FALSE(Play("a1a2"));
  EXPECT_EQ(state_.half_move_clock(), 49);
  EXPECT_EQ(Play("e8d8"),
            (GameOutcome{GameResult::kDraw, EndReason::kFiftyMoveRule}));
}

TEST_F(GameEndTest, PawnMoveResetsClock) {
  state_ = GameState::FromFen("4k3/8/8/8/8/8/P7/4K3 w - - 49 1");
  EXPECT_FALSE(Play("a2a3"));
  EXPECT_EQ(state_.half_move_clock(), 0);
}

TEST_F(GameEndTest, FiftyMoveRuleTakesPriorityOverCheckmate) {
  state_ = GameState::FromFen("6k1/5ppp/8/8/8/8/8/R5K1 w - - 49 1");
  EXPECT_EQ(Play("a1a8"),
            (GameOutcome{GameResult::kDraw, EndReason::kFiftyMoveRule}));
}

TEST(GameEnd, Stalemate) {
  EXPECT_EQ(Classify("k7/1RK5/8/8/8/8/8/8 b - - 0 1"),
            (GameOutcome{GameResult::kDraw, EndReason::kStalemate}));
  EXPECT_FALSE(Classify("k7/1RK5/8/8/8/8/8/8 w - - 0 1"));
}

TEST(GameEnd, InsufficientMaterial) {
  const GameOutcome draw{GameResult::kDraw, EndReason::kInsufficientMaterial};
  EXPECT_EQ(Classify("4k3/8/8/8/8/8/8/4K3 w - - 0 1"), draw);
  EXPECT_EQ(Classify("4k3/8/8/8/8/8/8/4KB2 w - - 0 1"), draw);
  EXPECT_EQ(Classify("4k3/8/8/8/8/8/8/1n2K3 w - - 0 1"), draw);
  EXPECT_FALSE(Classify("4k3/8/8/8/8/8/8/4KR2 w - - 0 1"));
  EXPECT_FALSE(Classify("4k3/8/8/8/8/8/4P3/4K3 w - - 0 1"));
  EXPECT_FALSE(Classify("4k3/8/8/8/8/8/8/2B1KB2 w - - 0 1"));
}

TEST(GameEnd, StartingPositionGoesOn) {
  EXPECT_FALSE(CheckGameEnd(GameState(), {}));
}

TEST(GameEnd, WinFor) {
  EXPECT_EQ(WinFor(Color::kWhite, EndReason::kResignation),
            (GameOutcome{GameResult::kWhiteWins, EndReason::kResignation}));
  EXPECT_EQ(WinFor(Color::kBlack, EndReason::kCheckmate),
            (GameOutcome{GameResult::kBlackWins, EndReason::kCheckmate}));
}

}  // namespace chessd

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
