#pragma once

#include "arrowctl/control_client.h"
#include "arrowctl/control_server.h"
#include "arrowctl/logging.h"

#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

namespace arrowctl {

/**
 * Boost.Beast WebSocket listener feeding a ControlServer.
 *
 * The io_context must be driven by a single thread (the EventLoop); all
 * methods, and all ControlServer entry points, run there.
 */
class WebSocketServer {
 public:
  WebSocketServer(boost::asio::io_context& io, ControlServer& server,
                  LogCallback log_callback = nullptr);
  ~WebSocketServer();

  WebSocketServer(const WebSocketServer&) = delete;
  WebSocketServer& operator=(const WebSocketServer&) = delete;

  /// Bind, listen and start accepting sessions.
  bool Start(const std::string& bind_address, uint16_t port);
  /// Stop accepting and close every session still open.
  void Stop();

  /// Bound port (useful when started with port 0).
  uint16_t port() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;

 private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

/**
 * Boost.Beast WebSocket client for the target role.
 */
class WebSocketClientTransport : public ClientTransport {
 public:
  explicit WebSocketClientTransport(boost::asio::io_context& io,
                                    LogCallback log_callback = nullptr);
  ~WebSocketClientTransport() override;

  WebSocketClientTransport(const WebSocketClientTransport&) = delete;
  WebSocketClientTransport& operator=(const WebSocketClientTransport&) = delete;

  void SetHandlers(Handlers handlers) override;
  void Open(const std::string& host, uint16_t port) override;
  bool Send(const std::string& text) override;
  void Close() override;

 private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

}  // namespace arrowctl
