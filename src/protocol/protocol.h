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
#include <span>
#include <vector>

#include "protocol/archive.h"
#include "server/messages.h"
#include "utils/expected.h"

namespace chessd::protocol {

enum MessageType : uint8_t {
  // Client to server.
  MOVE = 0,
  PROMOTE = 1,
  REQUEST_DRAW = 2,
  RECONNECT = 3,
  RESIGN = 4,
  // Server to client.
  MATCH_FOUND = 16,
  MOVE_APPLIED = 17,
  PROMOTION_APPLIED = 18,
  STATE_SNAPSHOT = 19,
  DRAW_OFFERED = 20,
  GAME_ENDED = 21,
};

using MagicType = uint32_t;

static constexpr MagicType kMagic = 'C' << 0 | 'H' << 8 | 'S' << 16 | 'D' << 24;
// Must be incremented when any structure changes.
static constexpr unsigned kProtocolVersion = 0;
// Upper limit of a message body.
static constexpr size_t kMaxMessageSize = 1024;
// Square or file field which holds no value.
static constexpr uint8_t kNone = 0xFF;

struct MessageHeader {
  MagicType magic_ = kMagic;  // "CHSD"
  uint32_t size_;
  uint8_t type_;

  template <typename Archive>
  Archive::ResultType Serialize(Archive& ar,
                                [[maybe_unused]] const unsigned version) {
    auto r = ar & FixedInteger{magic_};
    r = r.and_then([this](Archive& ar) { return ar & size_; });
    r = r.and_then([this](Archive& ar) { return ar & type_; });
    return r;
  }
};

// Squares are rank * 8 + file. Colors, piece kinds, results and reasons use
// the declaration order of the corresponding enums.
struct MoveMessage {
  MessageHeader header_ = {kMagic, 0, MessageType::MOVE};
  uint8_t from_{};
  uint8_t to_{};

  template <typename Archive>
  Archive::ResultType Serialize(Archive& ar,
                                [[maybe_unused]] const unsigned version) {
    typename Archive::ResultType r{ar};
    r = Archive::is_saving ? ar & header_ : r;
    r = r.and_then([this](Archive& ar) { return ar & FixedInteger{from_}; });
    r = r.and_then([this](Archive& ar) { return ar & FixedInteger{to_}; });
    return r;
  }
};

struct PromoteMessage {
  MessageHeader header_ = {kMagic, 0, MessageType::PROMOTE};
  uint8_t piece_{};

  template <typename Archive>
  Archive::ResultType Serialize(Archive& ar,
                                [[maybe_unused]] const unsigned version) {
    typename Archive::ResultType r{ar};
    r = Archive::is_saving ? ar & header_ : r;
    r = r.and_then([this](Archive& ar) { return ar & piece_; });
    return r;
  }
};

// Messages without a body.
template <MessageType kType>
struct EmptyMessage {
  MessageHeader header_ = {kMagic, 0, kType};

  template <typename Archive>
  Archive::ResultType Serialize(Archive& ar,
                                [[maybe_unused]] const unsigned version) {
    typename Archive::ResultType r{ar};
    r = Archive::is_saving ? ar & header_ : r;
    return r;
  }
};

using RequestDrawMessage = EmptyMessage<MessageType::REQUEST_DRAW>;
using ReconnectMessage = EmptyMessage<MessageType::RECONNECT>;
using ResignMessage = EmptyMessage<MessageType::RESIGN>;
using DrawOfferedMessage = EmptyMessage<MessageType::DRAW_OFFERED>;

struct MatchFoundMessage {
  MessageHeader header_ = {kMagic, 0, MessageType::MATCH_FOUND};
  uint8_t color_{};

  template <typename Archive>
  Archive::ResultType Serialize(Archive& ar,
                                [[maybe_unused]] const unsigned version) {
    typename Archive::ResultType r{ar};
    r = Archive::is_saving ? ar & header_ : r;
    r = r.and_then([this](Archive& ar) { return ar & color_; });
    return r;
  }
};

struct MoveAppliedMessage {
  MessageHeader header_ = {kMagic, 0, MessageType::MOVE_APPLIED};
  uint8_t from_{};
  uint8_t to_{};

  template <typename Archive>
  Archive::ResultType Serialize(Archive& ar,
                                [[maybe_unused]] const unsigned version) {
    typename Archive::ResultType r{ar};
    r = Archive::is_saving ? ar & header_ : r;
    r = r.and_then([this](Archive& ar) { return ar & FixedInteger{from_}; });
    r = r.and_then([this](Archive& ar) { return ar & FixedInteger{to_}; });
    return r;
  }
};

struct PromotionAppliedMessage {
  MessageHeader header_ = {kMagic, 0, MessageType::PROMOTION_APPLIED};
  uint8_t piece_{};

  template <typename Archive>
  Archive::ResultType Serialize(Archive& ar,
                                [[maybe_unused]] const unsigned version) {
    typename Archive::ResultType r{ar};
    r = Archive::is_saving ? ar & header_ : r;
    r = r.and_then([this](Archive& ar) { return ar & piece_; });
    return r;
  }
};

struct StateSnapshotMessage {
  MessageHeader header_ = {kMagic, 0, MessageType::STATE_SNAPSHOT};
  std::array<uint8_t, 32> board_{};
  uint8_t turn_{};
  uint8_t en_passant_file_ = kNone;
  uint8_t half_move_clock_{};
  bool white_king_moved_{};
  bool black_king_moved_{};
  bool white_a_rook_moved_{};
  bool black_a_rook_moved_{};
  bool white_h_rook_moved_{};
  bool black_h_rook_moved_{};
  uint8_t promotion_square_ = kNone;

  template <typename Archive>
  Archive::ResultType Serialize(Archive& ar,
                                [[maybe_unused]] const unsigned version) {
    typename Archive::ResultType r{ar};
    r = Archive::is_saving ? ar & header_ : r;
    for (size_t i = 0; i < board_.size(); ++i) {
      r = r.and_then(
          [this, i](Archive& ar) { return ar & FixedInteger{board_[i]}; });
    }
    r = r.and_then([this](Archive& ar) { return ar & turn_; });
    r = r.and_then(
        [this](Archive& ar) { return ar & FixedInteger{en_passant_file_}; });
    r = r.and_then([this](Archive& ar) { return ar & half_move_clock_; });
    r = r.and_then([this](Archive& ar) { return ar & white_king_moved_; });
    r = r.and_then([this](Archive& ar) { return ar & black_king_moved_; });
    r = r.and_then([this](Archive& ar) { return ar & white_a_rook_moved_; });
    r = r.and_then([this](Archive& ar) { return ar & black_a_rook_moved_; });
    r = r.and_then([this](Archive& ar) { return ar & white_h_rook_moved_; });
    r = r.and_then([this](Archive& ar) { return ar & black_h_rook_moved_; });
    r = r.and_then(
        [this](Archive& ar) { return ar & FixedInteger{promotion_square_}; });
    return r;
  }
};

struct GameEndedMessage {
  MessageHeader header_ = {kMagic, 0, MessageType::GAME_ENDED};
  uint8_t result_{};
  uint8_t reason_{};

  template <typename Archive>
  Archive::ResultType Serialize(Archive& ar,
                                [[maybe_unused]] const unsigned version) {
    typename Archive::ResultType r{ar};
    r = Archive::is_saving ? ar & header_ : r;
    r = r.and_then([this](Archive& ar) { return ar & result_; });
    r = r.and_then([this](Archive& ar) { return ar & reason_; });
    return r;
  }
};

// Encodes a complete frame, header included.
Expected<std::vector<char>, ArchiveError> EncodeMessage(
    const ClientMessage& message);
Expected<std::vector<char>, ArchiveError> EncodeMessage(
    const ServerMessage& message);

// Decodes the frame at the start of @input into @out. Returns the number of
// bytes consumed, or 0 when @input doesn't hold a complete frame yet. A frame
// with bad magic, an oversized body, an unknown type, a value out of range or
// trailing body bytes is kInvalidData.
Expected<size_t, ArchiveError> DecodeMessage(std::span<const char> input,
                                             ClientMessage* out);
Expected<size_t, ArchiveError> DecodeMessage(std::span<const char> input,
                                             ServerMessage* out);

}  // namespace chessd::protocol
