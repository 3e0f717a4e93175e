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

#include "server/game_server.h"

#include <gtest/gtest.h>

#include <deque>
#include <string_view>

#include "utils/exception.h"

namespace chessd {
namespace {

class FakeClient : public Client {
 public:
  explicit FakeClient(ConnectionId id) : id_(id) {}

  ConnectionId id() const override { return id_; }
  void Send(const ServerMessage& message) override {
    messages_.push_back(message);
  }
  void Disconnect() override { disconnected_ = true; }

  std::vector<ServerMessage> TakeMessages() {
    std::vector<ServerMessage> result;
    result.swap(messages_);
    return result;
  }
  bool disconnected() const { return disconnected_; }

 private:
  const ConnectionId id_;
  std::vector<ServerMessage> messages_;
  bool disconnected_ = false;
};

using Messages = std::vector<ServerMessage>;

Move M(std::string_view move) { return *Move::Parse(move); }

// Random numbers come from randoms_ and default to the low end of the range.
class GameServerTest : public ::testing::Test {
 protected:
  GameServerTest()
      : server_([this](int min, int max) {
          if (randoms_.empty()) return min;
          const int value = randoms_.front();
          randoms_.pop_front();
          EXPECT_GE(value, min);
          EXPECT_LE(value, max);
          return value;
        }) {}

  std::shared_ptr<FakeClient> Connect(ConnectionId id) {
    auto client = std::make_shared<FakeClient>(id);
    server_.OnConnect(client);
    return client;
  }

  // Connections 1 (white) and 2 (black) in a game, with the match
  // notifications consumed.
  GameId StartGame(const GameState& initial = GameState()) {
    white_ = Connect(1);
    black_ = Connect(2);
    const GameId id = server_.StartGame(1, 2, initial);
    white_->TakeMessages();
    black_->TakeMessages();
    return id;
  }

  void Play(ConnectionId id, std::string_view move) {
    server_.OnMessage(id, MoveCommand{M(move)});
  }

  std::deque<int> randoms_;
  GameServer server_;
  std::shared_ptr<FakeClient> white_;
  std::shared_ptr<FakeClient> black_;
};

}  // namespace

TEST_F(GameServerTest, PairsTwoConnections) {
  auto first = Connect(1);
  auto second = Connect(2);
  EXPECT_EQ(server_.waiting_count(), 2u);
  EXPECT_TRUE(first->TakeMessages().empty());

  server_.Tick();
  EXPECT_EQ(server_.waiting_count(), 0u);
  EXPECT_EQ(server_.game_count(), 1u);
  EXPECT_EQ(first->TakeMessages(), Messages{MatchFound{Color::kWhite}});
  EXPECT_EQ(second->TakeMessages(), Messages{MatchFound{Color::kBlack}});
  EXPECT_EQ(server_.FindGame(1), server_.FindGame(2));
}

TEST_F(GameServerTest, PairingUsesRandomPicksAndColors) {
  auto first = Connect(1);
  auto second = Connect(2);
  auto third = Connect(3);
  // Picks connection 3, then connection 1, then swaps colors.
  randoms_ = {2, 0, 1};
  server_.Tick();
  EXPECT_TRUE(randoms_.empty());
  EXPECT_EQ(first->TakeMessages(), Messages{MatchFound{Color::kWhite}});
  EXPECT_EQ(third->TakeMessages(), Messages{MatchFound{Color::kBlack}});
  EXPECT_TRUE(second->TakeMessages().empty());
  EXPECT_EQ(server_.waiting_count(), 1u);
  EXPECT_FALSE(server_.FindGame(2));
}

TEST_F(GameServerTest, SingleConnectionWaits) {
  auto client = Connect(1);
  server_.Tick();
  server_.Tick();
  EXPECT_EQ(server_.waiting_count(), 1u);
  EXPECT_EQ(server_.game_count(), 0u);
  EXPECT_TRUE(client->TakeMessages().empty());
}

TEST_F(GameServerTest, PairsEveryoneInOneTick) {
  for (ConnectionId id = 1; id <= 5; ++id) Connect(id);
  server_.Tick();
  EXPECT_EQ(server_.game_count(), 2u);
  EXPECT_EQ(server_.waiting_count(), 1u);
  EXPECT_NE(server_.FindGame(1), server_.FindGame(3));
}

TEST_F(GameServerTest, StartGameRejectsUnknownOrPlayingConnections) {
  Connect(1);
  Connect(2);
  Connect(3);
  EXPECT_THROW(server_.StartGame(1, 9), Exception);
  EXPECT_THROW(server_.StartGame(1, 1), Exception);
  server_.StartGame(1, 2);
  EXPECT_THROW(server_.StartGame(3, 2), Exception);
  EXPECT_EQ(server_.waiting_count(), 1u);
}

TEST_F(GameServerTest, RelaysMoveToOpponentOnly) {
  const GameId id = StartGame();
  Play(1, "e2e4");
  EXPECT_EQ(black_->TakeMessages(), Messages{MoveApplied{M("e2e4")}});
  EXPECT_TRUE(white_->TakeMessages().empty());
  EXPECT_EQ(server_.GetGameState(id)->turn(), Color::kBlack);

  Play(2, "e7e5");
  EXPECT_EQ(white_->TakeMessages(), Messages{MoveApplied{M("e7e5")}});
  EXPECT_TRUE(black_->TakeMessages().empty());
}

TEST_F(GameServerTest, MoveOutOfTurnGetsSnapshot) {
  StartGame();
  Play(2, "e7e5");
  EXPECT_EQ(black_->TakeMessages(), Messages{StateSnapshot{GameState()}});
  EXPECT_TRUE(white_->TakeMessages().empty());
}

TEST_F(GameServerTest, IllegalMoveGetsSnapshot) {
  const GameId id = StartGame();
  Play(1, "e2e5");
  EXPECT_EQ(white_->TakeMessages(), Messages{StateSnapshot{GameState()}});
  EXPECT_TRUE(black_->TakeMessages().empty());
  EXPECT_EQ(*server_.GetGameState(id), GameState());
}

TEST_F(GameServerTest, Promotion) {
  const GameId id =
      StartGame(GameState::FromFen("k7/4P3/8/8/8/8/8/K7 w - - 0 1"));
  Play(1, "e7e8");
  EXPECT_EQ(black_->TakeMessages(), Messages{MoveApplied{M("e7e8")}});
  const GameState pending = *server_.GetGameState(id);
  EXPECT_TRUE(pending.pending_promotion());

  // Black has to wait for the choice.
  Play(2, "a8b8");
  EXPECT_EQ(black_->TakeMessages(), Messages{StateSnapshot{pending}});
  server_.OnMessage(2, PromoteCommand{kQueen});
  EXPECT_EQ(black_->TakeMessages(), Messages{StateSnapshot{pending}});
  server_.OnMessage(1, PromoteCommand{kKing});
  EXPECT_EQ(white_->TakeMessages(), Messages{StateSnapshot{pending}});

  server_.OnMessage(1, PromoteCommand{kQueen});
  EXPECT_EQ(black_->TakeMessages(), Messages{PromotionApplied{kQueen}});
  EXPECT_TRUE(white_->TakeMessages().empty());
  const GameState* state = server_.GetGameState(id);
  EXPECT_FALSE(state->pending_promotion());
  EXPECT_EQ(state->board().at(*Square::Parse("e8")),
            (Piece{Color::kWhite, kQueen}));
  EXPECT_EQ(server_.game_count(), 1u);

  Play(2, "a8a7");
  EXPECT_EQ(white_->TakeMessages(), Messages{MoveApplied{M("a8a7")}});
}

TEST_F(GameServerTest, PromotionCanMate) {
  StartGame(GameState::FromFen("7k/P7/6K1/8/8/8/8/8 w - - 0 1"));
  // Nothing is decided until the piece is chosen.
  Play(1, "a7a8");
  EXPECT_EQ(black_->TakeMessages(), Messages{MoveApplied{M("a7a8")}});
  EXPECT_EQ(server_.game_count(), 1u);

  server_.OnMessage(1, PromoteCommand{kQueen});
  const GameEnded ended{WinFor(Color::kWhite, EndReason::kCheckmate)};
  EXPECT_EQ(white_->TakeMessages(), Messages{ended});
  EXPECT_EQ(black_->TakeMessages(),
            (Messages{PromotionApplied{kQueen}, ended}));
  EXPECT_TRUE(white_->disconnected());
  EXPECT_TRUE(black_->disconnected());
  EXPECT_EQ(server_.game_count(), 0u);
}

TEST_F(GameServerTest, PromotionWithoutPendingPawnGetsSnapshot) {
  StartGame();
  server_.OnMessage(1, PromoteCommand{kQueen});
  EXPECT_EQ(white_->TakeMessages(), Messages{StateSnapshot{GameState()}});
}

TEST_F(GameServerTest, DrawByAgreement) {
  StartGame();
  server_.OnMessage(1, RequestDrawCommand{});
  EXPECT_EQ(black_->TakeMessages(), Messages{DrawOffered{}});
  // Repeating the offer changes nothing.
  server_.OnMessage(1, RequestDrawCommand{});
  EXPECT_TRUE(black_->TakeMessages().empty());
  EXPECT_TRUE(white_->TakeMessages().empty());

  server_.OnMessage(2, RequestDrawCommand{});
  const Messages ended{
      GameEnded{GameOutcome{GameResult::kDraw, EndReason::kAgreement}}};
  EXPECT_EQ(white_->TakeMessages(), ended);
  EXPECT_EQ(black_->TakeMessages(), ended);
  EXPECT_TRUE(white_->disconnected());
  EXPECT_TRUE(black_->disconnected());
  EXPECT_EQ(server_.game_count(), 0u);
}

TEST_F(GameServerTest, MoveWithdrawsDrawOffer) {
  StartGame();
  server_.OnMessage(1, RequestDrawCommand{});
  Play(1, "e2e4");
  EXPECT_EQ(black_->TakeMessages(),
            (Messages{DrawOffered{}, MoveApplied{M("e2e4")}}));
  server_.OnMessage(2, RequestDrawCommand{});
  EXPECT_EQ(white_->TakeMessages(), Messages{DrawOffered{}});
  EXPECT_EQ(server_.game_count(), 1u);
}

TEST_F(GameServerTest, Resign) {
  StartGame();
  server_.OnMessage(2, ResignCommand{});
  const Messages ended{
      GameEnded{WinFor(Color::kWhite, EndReason::kResignation)}};
  EXPECT_EQ(white_->TakeMessages(), ended);
  EXPECT_EQ(black_->TakeMessages(), ended);
  EXPECT_TRUE(white_->disconnected());
  EXPECT_TRUE(black_->disconnected());
  EXPECT_FALSE(server_.FindGame(1));
  EXPECT_FALSE(server_.FindGame(2));
}

TEST_F(GameServerTest, CheckmateEndsGame) {
  StartGame();
  Play(1, "f2f3");
  Play(2, "e7e5");
  Play(1, "g2g4");
  Play(2, "d8h4");
  const GameEnded ended{WinFor(Color::kBlack, EndReason::kCheckmate)};
  EXPECT_EQ(white_->TakeMessages(),
            (Messages{MoveApplied{M("e7e5")}, MoveApplied{M("d8h4")}, ended}));
  EXPECT_EQ(black_->TakeMessages(),
            (Messages{MoveApplied{M("f2f3")}, MoveApplied{M("g2g4")}, ended}));
  EXPECT_TRUE(white_->disconnected());
  EXPECT_TRUE(black_->disconnected());
  EXPECT_EQ(server_.game_count(), 0u);

  // The transport reports the closed sockets afterwards.
  server_.OnDisconnect(1);
  server_.OnDisconnect(2);
  EXPECT_TRUE(white_->TakeMessages().empty());
  EXPECT_TRUE(black_->TakeMessages().empty());
}

TEST_F(GameServerTest, ThreefoldRepetitionEndsGame) {
  StartGame();
  const char* kCycle[] = {"g1f3", "g8f6", "f3g1", "f6g8"};
  for (int i = 0; i < 8; ++i) {
    Play(i % 2 == 0 ? 1 : 2, kCycle[i % 4]);
    ASSERT_EQ(server_.game_count(), 1u) << i;
  }
  white_->TakeMessages();
  black_->TakeMessages();

  // The board after g1f3 appears for the third time.
  Play(1, "g1f3");
  const GameEnded ended{
      GameOutcome{GameResult::kDraw, EndReason::kThreefoldRepetition}};
  EXPECT_EQ(white_->TakeMessages(), Messages{ended});
  EXPECT_EQ(black_->TakeMessages(),
            (Messages{MoveApplied{M("g1f3")}, ended}));
  EXPECT_TRUE(white_->disconnected());
  EXPECT_TRUE(black_->disconnected());
  EXPECT_EQ(server_.game_count(), 0u);
}

TEST_F(GameServerTest, DisconnectForfeitsGame) {
  StartGame();
  server_.OnDisconnect(1);
  const GameEnded ended{WinFor(Color::kBlack, EndReason::kResignation)};
  EXPECT_EQ(black_->TakeMessages(), Messages{ended});
  EXPECT_TRUE(black_->disconnected());
  EXPECT_TRUE(white_->TakeMessages().empty());
  EXPECT_FALSE(white_->disconnected());
  EXPECT_EQ(server_.game_count(), 0u);
}

TEST_F(GameServerTest, DisconnectLeavesQueue) {
  auto first = Connect(1);
  Connect(2);
  auto third = Connect(3);
  server_.OnDisconnect(2);
  EXPECT_EQ(server_.waiting_count(), 2u);
  server_.Tick();
  EXPECT_EQ(first->TakeMessages(), Messages{MatchFound{Color::kWhite}});
  EXPECT_EQ(third->TakeMessages(), Messages{MatchFound{Color::kBlack}});
}

TEST_F(GameServerTest, ReconnectSendsSnapshot) {
  const GameId id = StartGame();
  Play(1, "e2e4");
  black_->TakeMessages();
  server_.OnMessage(2, ReconnectCommand{});
  EXPECT_EQ(black_->TakeMessages(),
            Messages{StateSnapshot{*server_.GetGameState(id)}});
  EXPECT_FALSE(black_->disconnected());
}

TEST_F(GameServerTest, ReconnectWithoutGameDisconnects) {
  auto client = Connect(1);
  server_.OnMessage(1, ReconnectCommand{});
  EXPECT_TRUE(client->disconnected());
  EXPECT_TRUE(client->TakeMessages().empty());
  EXPECT_EQ(server_.waiting_count(), 0u);
}

TEST_F(GameServerTest, CommandsWithoutGameAreIgnored) {
  auto client = Connect(1);
  server_.OnMessage(1, ResignCommand{});
  server_.OnMessage(1, MoveCommand{M("e2e4")});
  server_.OnMessage(7, RequestDrawCommand{});
  EXPECT_TRUE(client->TakeMessages().empty());
  EXPECT_FALSE(client->disconnected());
  EXPECT_EQ(server_.waiting_count(), 1u);
}

TEST_F(GameServerTest, BrokenPositionAbortsGame) {
  // No white king: move validation can't run.
  StartGame(GameState::FromFen("4k3/8/8/8/8/8/4P3/8 w - - 0 1"));
  Play(1, "e2e3");
  EXPECT_TRUE(white_->disconnected());
  EXPECT_TRUE(black_->disconnected());
  EXPECT_TRUE(white_->TakeMessages().empty());
  EXPECT_TRUE(black_->TakeMessages().empty());
  EXPECT_EQ(server_.game_count(), 0u);
}

}  // namespace chessd

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
