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

#include <algorithm>
#include <string>
#include <utility>

#include "utils/exception.h"
#include "utils/logging.h"
#include "utils/random.h"

namespace chessd {

GameServer::GameServer()
    : GameServer(
          [](int min, int max) { return Random::Get().GetInt(min, max); }) {}

GameServer::GameServer(RandomIntFunc random) : random_(std::move(random)) {}

void GameServer::OnConnect(std::shared_ptr<Client> client) {
  const ConnectionId id = client->id();
  if (!clients_.try_emplace(id, std::move(client)).second) {
    CERR << "Connection " << id << " is already registered.";
    return;
  }
  waiting_.push_back(id);
  LOGFILE << "Connection " << id << " queued, " << waiting_.size()
          << " waiting.";
}

void GameServer::OnMessage(ConnectionId id, const ClientMessage& message) {
  Game* game = GetGame(id);
  if (!game) {
    if (std::holds_alternative<ReconnectCommand>(message)) {
      LOGFILE << "Connection " << id
              << " asked to reconnect without a game, dropping it.";
      DropConnection(id);
      return;
    }
    LOGFILE << "Ignoring " << message << " from connection " << id
            << " which is not in a game.";
    return;
  }
  const GameId game_id = game->id;
  const Color color = game->ColorOf(id);
  try {
    std::visit([&](const auto& command) { Handle(game, color, command); },
               message);
  } catch (Exception& ex) {
    CERR << "Game " << game_id << " aborted: " << ex.what();
    TearDown(game_id);
  }
}

void GameServer::OnDisconnect(ConnectionId id) {
  Game* game = GetGame(id);
  if (!game) {
    if (clients_.erase(id)) {
      std::erase(waiting_, id);
      LOGFILE << "Connection " << id << " left the queue.";
    }
    return;
  }
  const Color winner = Opponent(game->ColorOf(id));
  LOGFILE << "Connection " << id << " disconnected from game " << game->id
          << ", " << ColorToString(winner) << " wins.";
  clients_.erase(id);
  Send(game->player(winner),
       GameEnded{WinFor(winner, EndReason::kResignation)});
  TearDown(game->id);
}

void GameServer::Tick() {
  while (waiting_.size() >= 2) {
    auto take = [this]() {
      const int idx = random_(0, static_cast<int>(waiting_.size()) - 1);
      const ConnectionId id = waiting_[idx];
      waiting_.erase(waiting_.begin() + idx);
      return id;
    };
    ConnectionId white = take();
    ConnectionId black = take();
    if (random_(0, 1)) std::swap(white, black);
    StartGame(white, black);
  }
}

GameId GameServer::StartGame(ConnectionId white, ConnectionId black,
                             const GameState& initial) {
  if (white == black) {
    throw Exception("Connection " + std::to_string(white) +
                    " can't play against itself");
  }
  for (const ConnectionId id : {white, black}) {
    if (!clients_.contains(id)) {
      throw Exception("Unknown connection " + std::to_string(id));
    }
    if (connection_to_game_.contains(id)) {
      throw Exception("Connection " + std::to_string(id) +
                      " is already playing");
    }
  }
  std::erase_if(waiting_, [&](ConnectionId id) {
    return id == white || id == black;
  });

  const GameId id = next_game_id_++;
  games_.emplace(id, Game{id, initial, {}, {white, black}, std::nullopt});
  connection_to_game_[white] = id;
  connection_to_game_[black] = id;
  LOGFILE << "Game " << id << " started, white " << white << ", black "
          << black << ".";
  Send(white, MatchFound{Color::kWhite});
  Send(black, MatchFound{Color::kBlack});
  return id;
}

std::optional<GameId> GameServer::FindGame(ConnectionId id) const {
  const auto iter = connection_to_game_.find(id);
  if (iter == connection_to_game_.end()) return std::nullopt;
  return iter->second;
}

const GameState* GameServer::GetGameState(GameId id) const {
  const auto iter = games_.find(id);
  if (iter == games_.end()) return nullptr;
  return &iter->second.state;
}

void GameServer::Handle(Game* game, Color color, const MoveCommand& command) {
  const Move move = command.move;
  if (game->state.turn() != color) {
    LOGFILE << "Game " << game->id << ": " << ColorToString(color)
            << " tried " << move.ToString() << " out of turn.";
    SendSnapshot(*game, color);
    return;
  }
  const auto result = game->state.ApplyMove(move);
  if (!result) {
    LOGFILE << "Game " << game->id << ": " << ColorToString(color)
            << " tried " << move.ToString() << ", " << result.error() << ".";
    SendSnapshot(*game, color);
    return;
  }
  LOGFILE << "Game " << game->id << ": " << ColorToString(color) << " played "
          << move.ToString() << (result.value() ? ", redraw." : ".");
  game->draw_offer.reset();
  Send(game->player(Opponent(color)), MoveApplied{move});
  // The move completes once the pawn is promoted.
  if (game->state.pending_promotion()) return;
  CompleteMove(game);
}

void GameServer::Handle(Game* game, Color color,
                        const PromoteCommand& command) {
  // Only the side which just moved the pawn may choose.
  if (!game->state.pending_promotion() || game->state.turn() == color) {
    LOGFILE << "Game " << game->id << ": unexpected promotion from "
            << ColorToString(color) << ".";
    SendSnapshot(*game, color);
    return;
  }
  const auto result = game->state.Promote(command.piece);
  if (!result) {
    LOGFILE << "Game " << game->id << ": " << ColorToString(color)
            << " can't promote to " << command.piece.ToString() << ".";
    SendSnapshot(*game, color);
    return;
  }
  LOGFILE << "Game " << game->id << ": " << ColorToString(color)
          << " promoted on " << result.value().ToString() << " to "
          << command.piece.ToString() << ".";
  Send(game->player(Opponent(color)), PromotionApplied{command.piece});
  CompleteMove(game);
}

void GameServer::Handle(Game* game, Color color, const RequestDrawCommand&) {
  if (game->draw_offer == Opponent(color)) {
    EndGame(game, GameOutcome{GameResult::kDraw, EndReason::kAgreement});
    return;
  }
  if (game->draw_offer == color) return;
  LOGFILE << "Game " << game->id << ": " << ColorToString(color)
          << " offers a draw.";
  game->draw_offer = color;
  Send(game->player(Opponent(color)), DrawOffered{});
}

void GameServer::Handle(Game* game, Color color, const ReconnectCommand&) {
  LOGFILE << "Game " << game->id << ": " << ColorToString(color)
          << " reconnected.";
  SendSnapshot(*game, color);
}

void GameServer::Handle(Game* game, Color color, const ResignCommand&) {
  LOGFILE << "Game " << game->id << ": " << ColorToString(color)
          << " resigns.";
  EndGame(game, WinFor(Opponent(color), EndReason::kResignation));
}

GameServer::Game* GameServer::GetGame(ConnectionId id) {
  const auto iter = connection_to_game_.find(id);
  if (iter == connection_to_game_.end()) return nullptr;
  const auto game = games_.find(iter->second);
  if (game == games_.end()) return nullptr;
  return &game->second;
}

void GameServer::Send(ConnectionId id, const ServerMessage& message) {
  const auto iter = clients_.find(id);
  if (iter == clients_.end()) {
    LOGFILE << "Not sending " << message << " to closed connection " << id
            << ".";
    return;
  }
  iter->second->Send(message);
}

void GameServer::SendSnapshot(const Game& game, Color color) {
  Send(game.player(color), StateSnapshot{game.state});
}

void GameServer::CompleteMove(Game* game) {
  game->history.push_back(game->state.board().Compact());
  const auto outcome = CheckGameEnd(game->state, game->history);
  if (outcome) EndGame(game, *outcome);
}

void GameServer::EndGame(Game* game, const GameOutcome& outcome) {
  LOGFILE << "Game " << game->id << " ended: " << outcome << ".";
  const GameEnded message{outcome};
  Send(game->player(Color::kWhite), message);
  Send(game->player(Color::kBlack), message);
  TearDown(game->id);
}

void GameServer::TearDown(GameId id) {
  const auto iter = games_.find(id);
  if (iter == games_.end()) return;
  const auto players = iter->second.players;
  games_.erase(iter);
  std::vector<std::shared_ptr<Client>> clients;
  for (const ConnectionId player : players) {
    connection_to_game_.erase(player);
    const auto client = clients_.find(player);
    if (client == clients_.end()) continue;
    clients.push_back(std::move(client->second));
    clients_.erase(client);
  }
  // Disconnect may call back into the server, so the registry is settled
  // first.
  for (const auto& client : clients) client->Disconnect();
}

void GameServer::DropConnection(ConnectionId id) {
  const auto iter = clients_.find(id);
  if (iter == clients_.end()) return;
  const std::shared_ptr<Client> client = std::move(iter->second);
  clients_.erase(iter);
  std::erase(waiting_, id);
  client->Disconnect();
}

}  // namespace chessd
