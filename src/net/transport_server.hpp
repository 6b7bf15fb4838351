#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "net/transport.hpp"

namespace tether::net {

// Certificate chain and private key (PEM) for TLS connections
struct TlsOptions {
  std::string cert_file;
  std::string key_file;
};

// TCP listener speaking newline-delimited JSON. Every accepted connection gets a short id;
// the orchestrator addresses events to that id through deliver().
class TransportServer : public Transport, public std::enable_shared_from_this<TransportServer> {
 public:
  using LineHandler = std::function<void(const ConnectionId &connection, const std::string &line)>;
  using ConnectionHandler = std::function<void(const ConnectionId &connection)>;

  // Lines longer than this close the connection
  static constexpr size_t kMaxLineBytes = 16 * 1024 * 1024;
  // Unsent bytes a connection may hold before it is treated as stalled and closed
  static constexpr size_t kDefaultWriteQueueLimit = 64 * 1024 * 1024;

  TransportServer(asio::io_context &io_ctx, std::string host, uint16_t port, std::optional<TlsOptions> tls = std::nullopt);
  ~TransportServer() override;

  TransportServer(const TransportServer &) = delete;
  TransportServer &operator=(const TransportServer &) = delete;

  void set_line_handler(LineHandler handler);
  void set_open_handler(ConnectionHandler handler);
  void set_close_handler(ConnectionHandler handler);
  // Applies to connections accepted afterwards
  void set_write_queue_limit(size_t bytes);

  // Bind and start accepting; false if the endpoint or TLS setup is unusable
  bool start();

  // Stop accepting, close every connection and drop the handlers
  void stop();

  // Bound port, useful when constructed with port 0
  uint16_t port() const;

  size_t connection_count() const;

  // Transport
  void deliver(const ConnectionId &connection, const protocol::OutboundEvent &event) override;

 private:
  class Connection;
  template <typename Stream>
  class StreamConnection;

  using SslStream = asio::ssl::stream<asio::ip::tcp::socket>;

  void do_accept();
  void add_connection(std::shared_ptr<Connection> connection);

  // Called by connections, on the io_context
  void on_line(const ConnectionId &connection, const std::string &line);
  void on_closed(const ConnectionId &connection);

  asio::io_context &io_ctx_;
  std::string host_;
  uint16_t port_;
  std::optional<TlsOptions> tls_;
  std::unique_ptr<asio::ssl::context> ssl_ctx_;
  asio::ip::tcp::acceptor acceptor_;

  mutable std::mutex mutex_;
  std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections_;
  LineHandler line_handler_;
  ConnectionHandler open_handler_;
  ConnectionHandler close_handler_;
  size_t write_queue_limit_ = kDefaultWriteQueueLimit;
  bool stopped_ = false;
};

}  // namespace tether::net
