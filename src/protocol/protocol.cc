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

#include <optional>

#include "chess/board.h"
#include "utils/logging.h"

namespace chessd::protocol {
namespace {

template <typename Archive>
Archive::ResultType ParseMessageHeader(Archive& ia, MessageHeader& header) {
  auto r = ia & header;
  if (!r) return r;
  if (header.magic_ != kMagic) {
    LOGFILE << "Invalid message magic while parsing header: " << std::hex
            << header.magic_;
    return Unexpected{ArchiveError::kInvalidData};
  }
  if (header.size_ > kMaxMessageSize) {
    LOGFILE << "Message size too large: " << header.size_;
    return Unexpected{ArchiveError::kInvalidData};
  }
  return r;
}

template <typename Archive, typename T>
Archive::ResultType ParseMessageType(Archive& ia, const MessageHeader& header,
                                     T& out) {
  out.header_ = header;
  return ia & out;
}

// Parses the body of the message described by @header and hands it to
// @callback, which returns non-zero to reject it.
template <typename Archive, typename Callback>
Archive::ResultType ParseMessage(Archive& ia, const MessageHeader& header,
                                 Callback&& callback) {
  auto parse = [&](auto msg) -> typename Archive::ResultType {
    auto r = ParseMessageType(ia, header, msg);
    if (!r) return r;
    if (callback(msg)) return Unexpected{ArchiveError::kInvalidData};
    return r;
  };
  switch (header.type_) {
    case MessageType::MOVE:
      return parse(MoveMessage{});
    case MessageType::PROMOTE:
      return parse(PromoteMessage{});
    case MessageType::REQUEST_DRAW:
      return parse(RequestDrawMessage{});
    case MessageType::RECONNECT:
      return parse(ReconnectMessage{});
    case MessageType::RESIGN:
      return parse(ResignMessage{});
    case MessageType::MATCH_FOUND:
      return parse(MatchFoundMessage{});
    case MessageType::MOVE_APPLIED:
      return parse(MoveAppliedMessage{});
    case MessageType::PROMOTION_APPLIED:
      return parse(PromotionAppliedMessage{});
    case MessageType::STATE_SNAPSHOT:
      return parse(StateSnapshotMessage{});
    case MessageType::DRAW_OFFERED:
      return parse(DrawOfferedMessage{});
    case MessageType::GAME_ENDED:
      return parse(GameEndedMessage{});
  }
  LOGFILE << "Unknown message type received: "
          << static_cast<uint32_t>(header.type_);
  return Unexpected{ArchiveError::kInvalidData};
}

template <typename T>
Expected<std::vector<char>, ArchiveError> Encode(T& message) {
  BinaryOArchive output(kProtocolVersion);
  auto r = output.StartSerialize(message);
  if (!r) return Unexpected(r.error());
  return output.TakeVector();
}

std::optional<Color> ColorFromWire(uint8_t value) {
  switch (value) {
    case 0:
      return Color::kWhite;
    case 1:
      return Color::kBlack;
  }
  return std::nullopt;
}

std::optional<Square> SquareFromWire(uint8_t value) {
  if (value >= 64) return std::nullopt;
  return Square::FromIdx(value);
}

std::optional<PieceType> PieceFromWire(uint8_t value) {
  if (value >= 6) return std::nullopt;
  return PieceType::FromIdx(value);
}

std::optional<GameResult> ResultFromWire(uint8_t value) {
  switch (value) {
    case 0:
      return GameResult::kWhiteWins;
    case 1:
      return GameResult::kBlackWins;
    case 2:
      return GameResult::kDraw;
  }
  return std::nullopt;
}

std::optional<EndReason> ReasonFromWire(uint8_t value) {
  switch (value) {
    case 0:
      return EndReason::kCheckmate;
    case 1:
      return EndReason::kStalemate;
    case 2:
      return EndReason::kResignation;
    case 3:
      return EndReason::kAgreement;
    case 4:
      return EndReason::kInsufficientMaterial;
    case 5:
      return EndReason::kFiftyMoveRule;
    case 6:
      return EndReason::kThreefoldRepetition;
  }
  return std::nullopt;
}

struct ClientMessageEncoder {
  Expected<std::vector<char>, ArchiveError> operator()(const MoveCommand& m) {
    MoveMessage msg;
    msg.from_ = m.move.from().as_idx();
    msg.to_ = m.move.to().as_idx();
    return Encode(msg);
  }
  Expected<std::vector<char>, ArchiveError> operator()(
      const PromoteCommand& m) {
    PromoteMessage msg;
    msg.piece_ = m.piece.idx;
    return Encode(msg);
  }
  Expected<std::vector<char>, ArchiveError> operator()(
      const RequestDrawCommand&) {
    RequestDrawMessage msg;
    return Encode(msg);
  }
  Expected<std::vector<char>, ArchiveError> operator()(
      const ReconnectCommand&) {
    ReconnectMessage msg;
    return Encode(msg);
  }
  Expected<std::vector<char>, ArchiveError> operator()(const ResignCommand&) {
    ResignMessage msg;
    return Encode(msg);
  }
};

struct ServerMessageEncoder {
  Expected<std::vector<char>, ArchiveError> operator()(const MatchFound& m) {
    MatchFoundMessage msg;
    msg.color_ = static_cast<uint8_t>(m.color);
    return Encode(msg);
  }
  Expected<std::vector<char>, ArchiveError> operator()(const MoveApplied& m) {
    MoveAppliedMessage msg;
    msg.from_ = m.move.from().as_idx();
    msg.to_ = m.move.to().as_idx();
    return Encode(msg);
  }
  Expected<std::vector<char>, ArchiveError> operator()(
      const PromotionApplied& m) {
    PromotionAppliedMessage msg;
    msg.piece_ = m.piece.idx;
    return Encode(msg);
  }
  Expected<std::vector<char>, ArchiveError> operator()(
      const StateSnapshot& m) {
    const GameState& state = m.state;
    StateSnapshotMessage msg;
    msg.board_ = state.board().Compact();
    msg.turn_ = static_cast<uint8_t>(state.turn());
    if (state.en_passant_file()) {
      msg.en_passant_file_ = state.en_passant_file()->idx;
    }
    msg.half_move_clock_ = state.half_move_clock();
    msg.white_king_moved_ = state.moved().white_king;
    msg.black_king_moved_ = state.moved().black_king;
    msg.white_a_rook_moved_ = state.moved().white_a_rook;
    msg.black_a_rook_moved_ = state.moved().black_a_rook;
    msg.white_h_rook_moved_ = state.moved().white_h_rook;
    msg.black_h_rook_moved_ = state.moved().black_h_rook;
    if (state.promotion_square()) {
      msg.promotion_square_ = state.promotion_square()->as_idx();
    }
    return Encode(msg);
  }
  Expected<std::vector<char>, ArchiveError> operator()(const DrawOffered&) {
    DrawOfferedMessage msg;
    return Encode(msg);
  }
  Expected<std::vector<char>, ArchiveError> operator()(const GameEnded& m) {
    GameEndedMessage msg;
    msg.result_ = static_cast<uint8_t>(m.outcome.result);
    msg.reason_ = static_cast<uint8_t>(m.outcome.reason);
    return Encode(msg);
  }
};

struct ClientMessageDecoder {
  ClientMessage* out;

  int operator()(const MoveMessage& msg) {
    const auto from = SquareFromWire(msg.from_);
    const auto to = SquareFromWire(msg.to_);
    if (!from || !to) return -1;
    *out = MoveCommand{Move(*from, *to)};
    return 0;
  }
  int operator()(const PromoteMessage& msg) {
    const auto piece = PieceFromWire(msg.piece_);
    if (!piece) return -1;
    *out = PromoteCommand{*piece};
    return 0;
  }
  int operator()(const RequestDrawMessage&) {
    *out = RequestDrawCommand{};
    return 0;
  }
  int operator()(const ReconnectMessage&) {
    *out = ReconnectCommand{};
    return 0;
  }
  int operator()(const ResignMessage&) {
    *out = ResignCommand{};
    return 0;
  }
  template <typename T>
  int operator()(const T& msg) {
    LOGFILE << "Server message type "
            << static_cast<uint32_t>(msg.header_.type_)
            << " received from a client.";
    return -1;
  }
};

struct ServerMessageDecoder {
  ServerMessage* out;

  int operator()(const MatchFoundMessage& msg) {
    const auto color = ColorFromWire(msg.color_);
    if (!color) return -1;
    *out = MatchFound{*color};
    return 0;
  }
  int operator()(const MoveAppliedMessage& msg) {
    const auto from = SquareFromWire(msg.from_);
    const auto to = SquareFromWire(msg.to_);
    if (!from || !to) return -1;
    *out = MoveApplied{Move(*from, *to)};
    return 0;
  }
  int operator()(const PromotionAppliedMessage& msg) {
    const auto piece = PieceFromWire(msg.piece_);
    if (!piece) return -1;
    *out = PromotionApplied{*piece};
    return 0;
  }
  int operator()(const StateSnapshotMessage& msg) {
    const auto board = Board::FromCompact(msg.board_);
    const auto turn = ColorFromWire(msg.turn_);
    if (!board || !turn) return -1;
    std::optional<File> en_passant;
    if (msg.en_passant_file_ != kNone) {
      if (msg.en_passant_file_ >= 8) return -1;
      en_passant = File::FromIdx(msg.en_passant_file_);
    }
    std::optional<Square> promotion;
    if (msg.promotion_square_ != kNone) {
      promotion = SquareFromWire(msg.promotion_square_);
      if (!promotion) return -1;
    }
    const MovedFlags moved{.white_king = msg.white_king_moved_,
                           .black_king = msg.black_king_moved_,
                           .white_a_rook = msg.white_a_rook_moved_,
                           .black_a_rook = msg.black_a_rook_moved_,
                           .white_h_rook = msg.white_h_rook_moved_,
                           .black_h_rook = msg.black_h_rook_moved_};
    *out = StateSnapshot{GameState(*board, *turn, en_passant,
                                   msg.half_move_clock_, moved, promotion)};
    return 0;
  }
  int operator()(const DrawOfferedMessage&) {
    *out = DrawOffered{};
    return 0;
  }
  int operator()(const GameEndedMessage& msg) {
    const auto result = ResultFromWire(msg.result_);
    const auto reason = ReasonFromWire(msg.reason_);
    if (!result || !reason) return -1;
    *out = GameEnded{GameOutcome{*result, *reason}};
    return 0;
  }
  template <typename T>
  int operator()(const T& msg) {
    LOGFILE << "Client message type "
            << static_cast<uint32_t>(msg.header_.type_)
            << " received from the server.";
    return -1;
  }
};

template <typename Decoder>
Expected<size_t, ArchiveError> Decode(std::span<const char> input,
                                      Decoder decoder) {
  BinaryIArchive ia(input, kProtocolVersion);
  MessageHeader header;
  auto r = ParseMessageHeader(ia, header);
  if (!r) {
    // A truncated header is completed by later reads.
    if (r.error() == ArchiveError::kBufferOverflow) return 0;
    return Unexpected(r.error());
  }
  const size_t header_size = input.size() - ia.Size();
  if (ia.Size() < header.size_) return 0;

  BinaryIArchive body(input.subspan(header_size, header.size_),
                      kProtocolVersion);
  r = ParseMessage(body, header, decoder);
  if (!r) {
    // The body is complete, so running out of bytes means a short body.
    if (r.error() == ArchiveError::kBufferOverflow) {
      return Unexpected(ArchiveError::kInvalidData);
    }
    return Unexpected(r.error());
  }
  if (body.Size() != 0) {
    LOGFILE << "Message body has " << body.Size() << " trailing bytes.";
    return Unexpected(ArchiveError::kInvalidData);
  }
  return header_size + header.size_;
}

}  // namespace

Expected<std::vector<char>, ArchiveError> EncodeMessage(
    const ClientMessage& message) {
  return std::visit(ClientMessageEncoder{}, message);
}

Expected<std::vector<char>, ArchiveError> EncodeMessage(
    const ServerMessage& message) {
  return std::visit(ServerMessageEncoder{}, message);
}

Expected<size_t, ArchiveError> DecodeMessage(std::span<const char> input,
                                             ClientMessage* out) {
  return Decode(input, ClientMessageDecoder{out});
}

Expected<size_t, ArchiveError> DecodeMessage(std::span<const char> input,
                                             ServerMessage* out) {
  return Decode(input, ServerMessageDecoder{out});
}

}  // namespace chessd::protocol
