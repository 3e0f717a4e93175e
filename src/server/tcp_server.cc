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

#include "server/tcp_server.h"

#include <cstring>
#include <memory>
#include <queue>
#include <span>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "protocol/protocol.h"
#include "utils/exception.h"
#include "utils/logging.h"

namespace chessd {

const OptionId TcpServer::kHostId{
    {.long_flag = "host", .help_text = "Address to listen on."}};
const OptionId TcpServer::kPortId{{.long_flag = "port",
                                   .help_text = "TCP port to listen on.",
                                   .short_flag = 'p'}};
const OptionId TcpServer::kTickMsId{
    {.long_flag = "tick-ms",
     .help_text = "Interval in milliseconds between pairing rounds."}};
const OptionId TcpServer::kMaxConnectionsId{
    {.long_flag = "max-connections",
     .help_text = "Maximum number of open client connections. 0 means no "
                  "limit."}};
const OptionId TcpServer::kTcpNoDelayId{
    {.long_flag = "tcp-nodelay",
     .help_text = "Disable Nagle's algorithm on client sockets."}};

namespace {

const char* kDefaultHost = "0.0.0.0";
const int kDefaultPort = 1812;
const int kDefaultTickMs = 50;

// Room for one complete frame with its header.
const size_t kInputBufferSize = protocol::kMaxMessageSize + 16;

asio::ip::tcp::endpoint GetEndpoint(asio::io_context& ctx,
                                    const std::string& host, int port) {
  asio::ip::tcp::resolver resolver(ctx);
  std::error_code ec;
  auto addrs = resolver.resolve(host, std::to_string(port), ec);
  if (ec || addrs.empty()) {
    throw Exception("Unable to resolve " + host + ": " + ec.message());
  }
  return addrs.begin()->endpoint();
}

asio::ip::tcp::acceptor MakeAcceptor(asio::io_context& ctx,
                                     const asio::ip::tcp::endpoint& endpoint) {
  asio::ip::tcp::acceptor acceptor(ctx);
  std::error_code ec;
  acceptor.open(endpoint.protocol(), ec);
  if (!ec) acceptor.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec) acceptor.bind(endpoint, ec);
  if (!ec) acceptor.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    std::ostringstream oss;
    oss << "Unable to listen on " << endpoint << ": " << ec.message();
    throw Exception(oss.str());
  }
  return acceptor;
}

}  // namespace

// One accepted socket. Frames are decoded as they arrive and handed to the
// game server; outbound messages are written one at a time in order.
class TcpConnection : public Client,
                      public std::enable_shared_from_this<TcpConnection> {
 public:
  TcpConnection(asio::ip::tcp::socket&& socket, ConnectionId id,
                TcpServer* server)
      : socket_(std::move(socket)), id_(id), server_(server) {
    input_.resize(kInputBufferSize);
  }

  ~TcpConnection() { LOGFILE << "Connection " << id_ << " released."; }

  void Start() { Read(); }

  ConnectionId id() const override { return id_; }

  void Send(const ServerMessage& message) override {
    if (closing_) return;
    auto frame = protocol::EncodeMessage(message);
    if (!frame) {
      CERR << "Error encoding " << message << " for connection " << id_
           << ": " << frame.error();
      Close();
      return;
    }
    queue_.push(std::move(frame).value());
    // Otherwise a write is already in progress.
    if (queue_.size() == 1) Write();
  }

  void Disconnect() override {
    if (closing_) return;
    closing_ = true;
    if (queue_.empty()) Close();
  }

 private:
  void Read() {
    socket_.async_read_some(
        asio::buffer(input_.data() + input_read_bytes_,
                     input_.size() - input_read_bytes_),
        [this, self = shared_from_this()](std::error_code ec, size_t length) {
          if (ec) {
            if (ec != asio::error::eof &&
                ec != asio::error::operation_aborted) {
              CERR << "Connection " << id_ << " read error: " << ec.message();
            }
            Close();
            return;
          }
          input_read_bytes_ += length;
          if (ParseInput()) Read();
        });
  }

  // Hands every complete frame to the game server. Returns whether reading
  // should continue.
  bool ParseInput() {
    size_t parsed_bytes = 0;
    while (!closing_ && parsed_bytes < input_read_bytes_) {
      ClientMessage message;
      const auto result = protocol::DecodeMessage(
          std::span<const char>(input_.data() + parsed_bytes,
                                input_read_bytes_ - parsed_bytes),
          &message);
      if (!result) {
        CERR << "Connection " << id_ << " sent a bad frame: "
             << result.error();
        Close();
        return false;
      }
      if (result.value() == 0) break;
      parsed_bytes += result.value();
      LOGFILE << "Connection " << id_ << " sent " << message << ".";
      server_->game_server()->OnMessage(id_, message);
    }
    if (closing_) return false;
    if (parsed_bytes > 0) {
      // Move unparsed data to the front.
      std::memmove(input_.data(), input_.data() + parsed_bytes,
                   input_read_bytes_ - parsed_bytes);
      input_read_bytes_ -= parsed_bytes;
    }
    return true;
  }

  void Write() {
    asio::async_write(
        socket_, asio::buffer(queue_.front()),
        [this, self = shared_from_this()](std::error_code ec,
                                          [[maybe_unused]] size_t length) {
          if (ec) {
            if (ec != asio::error::operation_aborted) {
              CERR << "Connection " << id_ << " write error: "
                   << ec.message();
            }
            Close();
            return;
          }
          queue_.pop();
          if (!queue_.empty()) {
            Write();
          } else if (closing_) {
            Close();
          }
        });
  }

  void Close() {
    if (closed_) return;
    closed_ = true;
    closing_ = true;
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != asio::error::not_connected) {
      LOGFILE << "Connection " << id_ << " shutdown: " << ec.message();
    }
    socket_.close(ec);
    if (ec) LOGFILE << "Connection " << id_ << " close: " << ec.message();
    // Reported from a fresh handler so that the game server is never
    // re-entered from its own calls.
    asio::post(socket_.get_executor(),
               [server = server_, id = id_] { server->OnClosed(id); });
  }

  asio::ip::tcp::socket socket_;
  const ConnectionId id_;
  TcpServer* const server_;

  std::vector<char> input_;
  size_t input_read_bytes_ = 0;
  std::queue<std::vector<char>> queue_;
  // No more messages are sent or handled.
  bool closing_ = false;
  bool closed_ = false;
};

void TcpServer::PopulateOptions(OptionsParser* options) {
  options->Add<StringOption>(kHostId) = kDefaultHost;
  options->Add<IntOption>(kPortId, 1, 65535) = kDefaultPort;
  options->Add<IntOption>(kTickMsId, 1, 10000) = kDefaultTickMs;
  options->Add<IntOption>(kMaxConnectionsId, 0, 100000) = 0;
  options->Add<BoolOption>(kTcpNoDelayId) = true;
}

TcpServer::TcpServer(asio::io_context& ctx, GameServer* game_server,
                     const OptionsDict& options)
    : acceptor_(MakeAcceptor(
          ctx, GetEndpoint(ctx, options.Get<std::string>(kHostId),
                           options.Get<int>(kPortId)))),
      timer_(ctx),
      game_server_(game_server),
      tick_interval_(options.Get<int>(kTickMsId)),
      max_connections_(options.Get<int>(kMaxConnectionsId)),
      tcp_nodelay_(options.Get<bool>(kTcpNoDelayId)) {
  DoAccept();
  ScheduleTick();
  CERR << "Listening on " << acceptor_.local_endpoint() << ".";
}

void TcpServer::Stop() {
  std::error_code ec;
  acceptor_.close(ec);
  if (ec) CERR << "Error closing the listening socket: " << ec.message();
  timer_.cancel();
}

void TcpServer::OnClosed(ConnectionId id) {
  --open_connections_;
  game_server_->OnDisconnect(id);
  if (!accepting_ && acceptor_.is_open()) {
    LOGFILE << "Accepting connections again.";
    DoAccept();
  }
}

void TcpServer::DoAccept() {
  accepting_ = true;
  acceptor_.async_accept([this](std::error_code ec,
                                asio::ip::tcp::socket socket) {
    accepting_ = false;
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        CERR << "Accept error: " << ec.message();
      }
      return;
    }
    const ConnectionId id = next_connection_id_++;
    std::error_code option_ec;
    if (tcp_nodelay_) {
      socket.set_option(asio::ip::tcp::no_delay(true), option_ec);
      if (option_ec) {
        LOGFILE << "Connection " << id << " no_delay: " << option_ec.message();
      }
    }
    const auto endpoint = socket.remote_endpoint(option_ec);
    LOGFILE << "Connection " << id << " accepted from " << endpoint << ".";

    auto connection =
        std::make_shared<TcpConnection>(std::move(socket), id, this);
    ++open_connections_;
    game_server_->OnConnect(connection);
    connection->Start();

    if (max_connections_ == 0 || open_connections_ < max_connections_) {
      DoAccept();
    } else {
      LOGFILE << "Connection limit of " << max_connections_
              << " reached, pausing accept.";
    }
  });
}

void TcpServer::ScheduleTick() {
  timer_.expires_after(tick_interval_);
  timer_.async_wait([this](std::error_code ec) {
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        CERR << "Tick timer error: " << ec.message();
      }
      return;
    }
    game_server_->Tick();
    ScheduleTick();
  });
}

}  // namespace chessd
