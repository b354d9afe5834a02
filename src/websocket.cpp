#include "arrowctl/websocket.h"

#include <chrono>
#include <deque>
#include <utility>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace arrowctl {
namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace ws = beast::websocket;
using tcp = asio::ip::tcp;

constexpr std::chrono::seconds kConnectTimeout{10};

std::string RemoteAddressOf(const tcp::socket& socket) {
  boost::system::error_code ec;
  const auto endpoint = socket.remote_endpoint(ec);
  return ec ? std::string("unknown") : endpoint.address().to_string();
}

std::string CloseReason(const beast::error_code& ec) {
  if (ec == ws::error::closed) {
    return "closed by peer";
  }
  return ec.message();
}

// One accepted WebSocket session. The io_context runs on a single thread,
// which serializes every handler below.
class ServerSession : public SessionTransport,
                      public std::enable_shared_from_this<ServerSession> {
 public:
  ServerSession(tcp::socket socket, ControlServer& server, Logger logger)
      : remote_address_(RemoteAddressOf(socket)),
        ws_(std::move(socket)),
        server_(server),
        logger_(std::move(logger)) {}

  void Run() {
    ws_.set_option(ws::stream_base::timeout::suggested(beast::role_type::server));
    ws_.control_callback([this](ws::frame_type kind, beast::string_view) {
      if (kind == ws::frame_type::pong && !closed_ && !connection_id_.empty()) {
        server_.OnSessionPong(connection_id_);
      }
    });
    ws_.async_accept(
        beast::bind_front_handler(&ServerSession::OnAccept, shared_from_this()));
  }

  bool Send(const std::string& text) override {
    if (closed_) {
      return false;
    }
    outbox_.push_back(std::make_shared<std::string>(text));
    if (!write_in_progress_) {
      DoWrite();
    }
    return true;
  }

  bool Ping() override {
    if (closed_) {
      return false;
    }
    if (ping_in_progress_) {
      return true;
    }
    ping_in_progress_ = true;
    ws_.async_ping(ws::ping_data(),
                   beast::bind_front_handler(&ServerSession::OnPing, shared_from_this()));
    return true;
  }

  void Terminate() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    terminated_ = true;
    outbox_.clear();
    beast::get_lowest_layer(ws_).close();
  }

  std::string RemoteAddress() const override { return remote_address_; }

 private:
  void OnAccept(beast::error_code ec) {
    if (ec) {
      logger_.Warn("WebSocket handshake from " + remote_address_ +
                   " failed: " + ec.message());
      return;
    }
    connection_id_ = server_.OnSessionOpened(shared_from_this());
    if (connection_id_.empty()) {
      Terminate();
      return;
    }
    DoRead();
  }

  void DoRead() {
    ws_.async_read(buffer_,
                   beast::bind_front_handler(&ServerSession::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec) {
      ReportClosed(CloseReason(ec));
      return;
    }
    const std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    server_.OnSessionMessage(connection_id_, text);
    if (!closed_) {
      DoRead();
    }
  }

  void DoWrite() {
    write_in_progress_ = true;
    ws_.text(true);
    ws_.async_write(asio::buffer(*outbox_.front()),
                    beast::bind_front_handler(&ServerSession::OnWrite, shared_from_this()));
  }

  void OnWrite(beast::error_code ec, std::size_t) {
    write_in_progress_ = false;
    if (ec) {
      outbox_.clear();
      ReportClosed("write failed: " + ec.message());
      return;
    }
    if (!outbox_.empty()) {
      outbox_.pop_front();
    }
    if (!outbox_.empty() && !closed_) {
      DoWrite();
    }
  }

  void OnPing(beast::error_code ec) {
    ping_in_progress_ = false;
    if (ec && !closed_) {
      logger_.Debug("Ping to " + remote_address_ + " failed: " + ec.message());
    }
  }

  // Terminated sessions were already dropped by the ControlServer.
  void ReportClosed(const std::string& reason) {
    if (reported_) {
      return;
    }
    reported_ = true;
    closed_ = true;
    if (terminated_ || connection_id_.empty()) {
      return;
    }
    logger_.Debug("Session " + connection_id_ + " closed: " + reason);
    server_.OnSessionClosed(connection_id_);
  }

  std::string remote_address_;
  ws::stream<beast::tcp_stream> ws_;
  ControlServer& server_;
  Logger logger_;
  beast::flat_buffer buffer_;
  std::deque<std::shared_ptr<std::string>> outbox_;
  std::string connection_id_;
  bool write_in_progress_ = false;
  bool ping_in_progress_ = false;
  bool closed_ = false;
  bool terminated_ = false;
  bool reported_ = false;
};

struct ClientState {
  ClientTransport::Handlers handlers;
  uint64_t generation = 0;
};

// One outbound connection attempt and, once open, its session.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
 public:
  ClientSession(asio::io_context& io, std::shared_ptr<ClientState> state,
                uint64_t generation, Logger logger)
      : resolver_(io),
        ws_(io),
        state_(std::move(state)),
        generation_(generation),
        logger_(std::move(logger)) {}

  void Start(const std::string& host, uint16_t port) {
    host_header_ = host + ":" + std::to_string(port);
    resolver_.async_resolve(
        host, std::to_string(port),
        beast::bind_front_handler(&ClientSession::OnResolve, shared_from_this()));
  }

  bool Send(const std::string& text) {
    if (!open_ || closed_) {
      return false;
    }
    outbox_.push_back(std::make_shared<std::string>(text));
    if (!write_in_progress_) {
      DoWrite();
    }
    return true;
  }

  void Shutdown() {
    if (closed_) {
      return;
    }
    closed_ = true;
    open_ = false;
    outbox_.clear();
    resolver_.cancel();
    beast::get_lowest_layer(ws_).close();
  }

 private:
  bool IsCurrent() const { return state_->generation == generation_; }

  void OnResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (closed_) {
      return;
    }
    if (ec) {
      Fail("resolve failed: " + ec.message());
      return;
    }
    beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
    beast::get_lowest_layer(ws_).async_connect(
        results,
        beast::bind_front_handler(&ClientSession::OnConnect, shared_from_this()));
  }

  void OnConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (closed_) {
      return;
    }
    if (ec) {
      Fail("connect failed: " + ec.message());
      return;
    }
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(ws::stream_base::timeout::suggested(beast::role_type::client));
    ws_.async_handshake(
        host_header_, "/",
        beast::bind_front_handler(&ClientSession::OnHandshake, shared_from_this()));
  }

  void OnHandshake(beast::error_code ec) {
    if (closed_) {
      return;
    }
    if (ec) {
      Fail("handshake failed: " + ec.message());
      return;
    }
    open_ = true;
    if (IsCurrent() && state_->handlers.on_open) {
      auto on_open = state_->handlers.on_open;
      on_open();
    }
    if (!closed_) {
      DoRead();
    }
  }

  void DoRead() {
    ws_.async_read(buffer_,
                   beast::bind_front_handler(&ClientSession::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (closed_) {
      return;
    }
    if (ec) {
      Fail(CloseReason(ec));
      return;
    }
    const std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    if (IsCurrent() && state_->handlers.on_message) {
      auto on_message = state_->handlers.on_message;
      on_message(text);
    }
    if (!closed_) {
      DoRead();
    }
  }

  void DoWrite() {
    write_in_progress_ = true;
    ws_.text(true);
    ws_.async_write(asio::buffer(*outbox_.front()),
                    beast::bind_front_handler(&ClientSession::OnWrite, shared_from_this()));
  }

  void OnWrite(beast::error_code ec, std::size_t) {
    write_in_progress_ = false;
    if (closed_) {
      return;
    }
    if (ec) {
      Fail("write failed: " + ec.message());
      return;
    }
    outbox_.pop_front();
    if (!outbox_.empty()) {
      DoWrite();
    }
  }

  void Fail(const std::string& reason) {
    closed_ = true;
    open_ = false;
    outbox_.clear();
    beast::get_lowest_layer(ws_).close();
    if (!IsCurrent()) {
      return;
    }
    logger_.Debug("Session to " + host_header_ + " ended: " + reason);
    if (state_->handlers.on_close) {
      auto on_close = state_->handlers.on_close;
      on_close(reason);
    }
  }

  tcp::resolver resolver_;
  ws::stream<beast::tcp_stream> ws_;
  std::shared_ptr<ClientState> state_;
  const uint64_t generation_;
  Logger logger_;
  std::string host_header_;
  beast::flat_buffer buffer_;
  std::deque<std::shared_ptr<std::string>> outbox_;
  bool write_in_progress_ = false;
  bool open_ = false;
  bool closed_ = false;
};

}  // namespace

struct WebSocketServer::Impl : public std::enable_shared_from_this<WebSocketServer::Impl> {
  Impl(asio::io_context& io, ControlServer& server, LogCallback log_callback)
      : acceptor_(io), server_(server), logger_("WebSocketServer", std::move(log_callback)) {}

  bool Start(const std::string& bind_address, uint16_t port) {
    if (running_) {
      return true;
    }
    start_error_.clear();
    auto fail = [&](const std::string& message) {
      start_error_ = message;
      logger_.Error(message);
      boost::system::error_code ignored;
      acceptor_.close(ignored);
      return false;
    };
    boost::system::error_code ec;
    const auto address =
        asio::ip::make_address(bind_address.empty() ? "0.0.0.0" : bind_address, ec);
    if (ec) {
      return fail("invalid bind address " + bind_address + ": " + ec.message());
    }
    const tcp::endpoint endpoint(address, port);
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      return fail("acceptor open failed: " + ec.message());
    }
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
      return fail("setsockopt(SO_REUSEADDR) failed: " + ec.message());
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
      return fail("bind(" + address.to_string() + ":" + std::to_string(port) +
                  ") failed: " + ec.message());
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
      return fail("listen failed: " + ec.message());
    }
    running_ = true;
    logger_.Info("Listening for control sessions on " + address.to_string() + ":" +
                 std::to_string(BoundPort()));
    DoAccept();
    return true;
  }

  void Stop() {
    if (!running_) {
      return;
    }
    running_ = false;
    boost::system::error_code ec;
    acceptor_.close(ec);
    for (auto& weak : sessions_) {
      if (auto session = weak.lock()) {
        session->Terminate();
      }
    }
    sessions_.clear();
    logger_.Info("Stopped listening");
  }

  void DoAccept() {
    acceptor_.async_accept(
        beast::bind_front_handler(&Impl::OnAccept, shared_from_this()));
  }

  void OnAccept(beast::error_code ec, tcp::socket socket) {
    if (!running_) {
      return;
    }
    if (ec) {
      logger_.Warn("accept failed: " + ec.message());
    } else {
      auto session = std::make_shared<ServerSession>(std::move(socket), server_, logger_);
      PruneSessions();
      sessions_.push_back(session);
      session->Run();
    }
    DoAccept();
  }

  void PruneSessions() {
    auto it = sessions_.begin();
    while (it != sessions_.end()) {
      if (it->expired()) {
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  uint16_t BoundPort() const {
    boost::system::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

  tcp::acceptor acceptor_;
  ControlServer& server_;
  Logger logger_;
  bool running_ = false;
  std::string start_error_;
  std::vector<std::weak_ptr<ServerSession>> sessions_;
};

WebSocketServer::WebSocketServer(asio::io_context& io, ControlServer& server,
                                 LogCallback log_callback)
    : impl_(std::make_shared<Impl>(io, server, std::move(log_callback))) {}

WebSocketServer::~WebSocketServer() { impl_->Stop(); }

bool WebSocketServer::Start(const std::string& bind_address, uint16_t port) {
  return impl_->Start(bind_address, port);
}

void WebSocketServer::Stop() { impl_->Stop(); }

uint16_t WebSocketServer::port() const { return impl_->BoundPort(); }

std::string WebSocketServer::GetLastError() const { return impl_->start_error_; }

struct WebSocketClientTransport::Impl {
  Impl(asio::io_context& io, LogCallback log_callback)
      : io_(io),
        state_(std::make_shared<ClientState>()),
        logger_("WebSocketClient", std::move(log_callback)) {}

  void Open(const std::string& host, uint16_t port) {
    CloseCurrent();
    const uint64_t generation = ++state_->generation;
    session_ = std::make_shared<ClientSession>(io_, state_, generation, logger_);
    session_->Start(host, port);
  }

  void Close() {
    ++state_->generation;
    CloseCurrent();
  }

  void CloseCurrent() {
    if (session_) {
      session_->Shutdown();
      session_.reset();
    }
  }

  asio::io_context& io_;
  std::shared_ptr<ClientState> state_;
  std::shared_ptr<ClientSession> session_;
  Logger logger_;
};

WebSocketClientTransport::WebSocketClientTransport(asio::io_context& io,
                                                   LogCallback log_callback)
    : impl_(std::make_shared<Impl>(io, std::move(log_callback))) {}

WebSocketClientTransport::~WebSocketClientTransport() {
  impl_->Close();
  impl_->state_->handlers = Handlers();
}

void WebSocketClientTransport::SetHandlers(Handlers handlers) {
  impl_->state_->handlers = std::move(handlers);
}

void WebSocketClientTransport::Open(const std::string& host, uint16_t port) {
  impl_->Open(host, port);
}

bool WebSocketClientTransport::Send(const std::string& text) {
  return impl_->session_ ? impl_->session_->Send(text) : false;
}

void WebSocketClientTransport::Close() { impl_->Close(); }

}  // namespace arrowctl
