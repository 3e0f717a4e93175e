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

#include "protocol/protocol.h"

#include <gtest/gtest.h>

#include <initializer_list>

namespace chessd::protocol {
namespace {

std::vector<char> Bytes(std::initializer_list<int> values) {
  std::vector<char> result;
  for (int value : values) result.push_back(static_cast<char>(value));
  return result;
}

std::vector<char> Encoded(const ServerMessage& message) {
  auto encoded = EncodeMessage(message);
  EXPECT_TRUE(encoded);
  return encoded ? encoded.value() : std::vector<char>{};
}

std::vector<char> Encoded(const ClientMessage& message) {
  auto encoded = EncodeMessage(message);
  EXPECT_TRUE(encoded);
  return encoded ? encoded.value() : std::vector<char>{};
}

}  // namespace

TEST(Protocol, MoveFrameLayout) {
  const ClientMessage message = MoveCommand{*Move::Parse("e2e4")};
  EXPECT_EQ(Encoded(message), Bytes({'C', 'H', 'S', 'D', 2, MOVE, 12, 28}));
}

TEST(Protocol, EmptyBodyFrameLayout) {
  const ServerMessage message = DrawOffered{};
  EXPECT_EQ(Encoded(message), Bytes({'C', 'H', 'S', 'D', 0, DRAW_OFFERED}));
}

TEST(Protocol, DecodesClientMove) {
  ClientMessage message;
  const auto consumed =
      DecodeMessage(Bytes({'C', 'H', 'S', 'D', 2, MOVE, 8, 63}), &message);
  ASSERT_TRUE(consumed);
  EXPECT_EQ(consumed.value(), 8u);
  EXPECT_EQ(message, ClientMessage(MoveCommand{*Move::Parse("a2h8")}));
}

TEST(Protocol, PartialFrameNeedsMoreData) {
  const ClientMessage message = PromoteCommand{kKnight};
  const std::vector<char> frame = Encoded(message);
  ASSERT_FALSE(frame.empty());
  ClientMessage decoded;
  for (size_t size = 0; size < frame.size(); ++size) {
    const auto consumed =
        DecodeMessage(std::span<const char>(frame.data(), size), &decoded);
    ASSERT_TRUE(consumed) << size;
    EXPECT_EQ(consumed.value(), 0u) << size;
  }
  const auto consumed = DecodeMessage(frame, &decoded);
  ASSERT_TRUE(consumed);
  EXPECT_EQ(consumed.value(), frame.size());
  EXPECT_EQ(decoded, message);
}

TEST(Protocol, ConsecutiveFrames) {
  std::vector<char> stream = Encoded(ClientMessage(RequestDrawCommand{}));
  const size_t first_size = stream.size();
  const std::vector<char> second = Encoded(ClientMessage(ResignCommand{}));
  stream.insert(stream.end(), second.begin(), second.end());

  ClientMessage message;
  auto consumed = DecodeMessage(stream, &message);
  ASSERT_TRUE(consumed);
  EXPECT_EQ(consumed.value(), first_size);
  EXPECT_EQ(message, ClientMessage(RequestDrawCommand{}));

  consumed = DecodeMessage(std::span<const char>(stream).subspan(first_size),
                           &message);
  ASSERT_TRUE(consumed);
  EXPECT_EQ(consumed.value(), second.size());
  EXPECT_EQ(message, ClientMessage(ResignCommand{}));
}

TEST(Protocol, RejectsBadMagic) {
  ClientMessage message;
  const auto result =
      DecodeMessage(Bytes({'C', 'H', 'E', 'S', 0, RESIGN}), &message);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), ArchiveError::kInvalidData);
}

TEST(Protocol, RejectsOversizedFrame) {
  // Body size 2000 as a varint.
  ClientMessage message;
  const auto result =
      DecodeMessage(Bytes({'C', 'H', 'S', 'D', 0xD0, 0x0F, MOVE}), &message);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), ArchiveError::kInvalidData);
}

TEST(Protocol, RejectsUnknownType) {
  ClientMessage message;
  const auto result =
      DecodeMessage(Bytes({'C', 'H', 'S', 'D', 0, 7}), &message);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), ArchiveError::kInvalidData);
}

TEST(Protocol, RejectsMessageOfOtherDirection) {
  ClientMessage client_message;
  const auto result =
      DecodeMessage(Encoded(ServerMessage(DrawOffered{})), &client_message);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), ArchiveError::kInvalidData);

  ServerMessage server_message;
  const auto result2 = DecodeMessage(
      Encoded(ClientMessage(ReconnectCommand{})), &server_message);
  ASSERT_FALSE(result2);
  EXPECT_EQ(result2.error(), ArchiveError::kInvalidData);
}

TEST(Protocol, RejectsOutOfRangeValues) {
  ClientMessage message;
  auto result =
      DecodeMessage(Bytes({'C', 'H', 'S', 'D', 2, MOVE, 64, 0}), &message);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), ArchiveError::kInvalidData);

  result = DecodeMessage(Bytes({'C', 'H', 'S', 'D', 1, PROMOTE, 6}), &message);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), ArchiveError::kInvalidData);

  ServerMessage server_message;
  auto server_result = DecodeMessage(
      Bytes({'C', 'H', 'S', 'D', 2, GAME_ENDED, 2, 7}), &server_message);
  ASSERT_FALSE(server_result);
  EXPECT_EQ(server_result.error(), ArchiveError::kInvalidData);

  server_result = DecodeMessage(Bytes({'C', 'H', 'S', 'D', 1, MATCH_FOUND, 2}),
                                &server_message);
  ASSERT_FALSE(server_result);
  EXPECT_EQ(server_result.error(), ArchiveError::kInvalidData);
}

TEST(Protocol, RejectsBodySizeMismatch) {
  ClientMessage message;
  // Trailing byte after an empty body.
  auto result =
      DecodeMessage(Bytes({'C', 'H', 'S', 'D', 1, REQUEST_DRAW, 0}), &message);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), ArchiveError::kInvalidData);

  // Body shorter than its fields.
  result = DecodeMessage(Bytes({'C', 'H', 'S', 'D', 1, MOVE, 12}), &message);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), ArchiveError::kInvalidData);
}

TEST(Protocol, StateSnapshot) {
  GameState state = GameState::FromFen("4k3/P7/8/8/8/8/8/R3K3 w Q - 7 1");
  ASSERT_TRUE(state.ApplyMove(*Move::Parse("a7a8")));
  ASSERT_TRUE(state.pending_promotion());

  const std::vector<char> frame = Encoded(ServerMessage(StateSnapshot{state}));
  // Header, 32 board bytes, turn, en passant, clock, 6 flags, promotion.
  ASSERT_EQ(frame.size(), 6u + 42u);
  EXPECT_EQ(frame[4], 42);
  EXPECT_EQ(static_cast<uint8_t>(frame[6 + 32 + 1]), kNone);
  EXPECT_EQ(frame.back(), 56);  // a8

  ServerMessage decoded;
  const auto consumed = DecodeMessage(frame, &decoded);
  ASSERT_TRUE(consumed);
  EXPECT_EQ(consumed.value(), frame.size());
  ASSERT_TRUE(std::holds_alternative<StateSnapshot>(decoded));
  EXPECT_EQ(std::get<StateSnapshot>(decoded).state, state);
}

TEST(Protocol, StateSnapshotWithEnPassantFile) {
  GameState state;
  ASSERT_TRUE(state.ApplyMove(*Move::Parse("d2d4")));
  const std::vector<char> frame = Encoded(ServerMessage(StateSnapshot{state}));
  ASSERT_EQ(frame.size(), 48u);
  EXPECT_EQ(frame[6 + 32 + 1], 3);  // d file

  ServerMessage decoded;
  ASSERT_TRUE(DecodeMessage(frame, &decoded));
  EXPECT_EQ(decoded, ServerMessage(StateSnapshot{state}));
}

TEST(Protocol, StateSnapshotRejectsInvalidBoard) {
  std::vector<char> frame = Encoded(ServerMessage(StateSnapshot{GameState()}));
  ASSERT_EQ(frame.size(), 48u);
  frame[6] = 0x07;
  ServerMessage decoded;
  const auto result = DecodeMessage(frame, &decoded);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), ArchiveError::kInvalidData);
}

TEST(Protocol, GameEnded) {
  const ServerMessage message =
      GameEnded{GameOutcome{GameResult::kDraw, EndReason::kAgreement}};
  const std::vector<char> frame = Encoded(message);
  EXPECT_EQ(frame, Bytes({'C', 'H', 'S', 'D', 2, GAME_ENDED, 2, 3}));
  ServerMessage decoded;
  ASSERT_TRUE(DecodeMessage(frame, &decoded));
  EXPECT_EQ(decoded, message);
}

}  // namespace chessd::protocol

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
