#include "net/transport_server.hpp"

#include <spdlog/spdlog.h>

#include <deque>
#include <iterator>
#include <type_traits>

#include "core/uuid.hpp"

namespace tether::net {

class TransportServer::Connection {
 public:
  explicit Connection(ConnectionId id) : id_(std::move(id)) {}
  virtual ~Connection() = default;

  const ConnectionId &id() const {
    return id_;
  }

  virtual void start() = 0;

  // Thread safe; queued behind earlier lines
  virtual void send(std::string line) = 0;

  virtual void close() = 0;

 protected:
  ConnectionId id_;
};

// Plain TCP or TLS. All members are touched on the stream's strand only.
template <typename Stream>
class TransportServer::StreamConnection : public TransportServer::Connection,
                                          public std::enable_shared_from_this<StreamConnection<Stream>> {
 public:
  StreamConnection(ConnectionId id, Stream stream, std::weak_ptr<TransportServer> server, size_t queue_limit)
      : Connection(std::move(id)),
        stream_(std::move(stream)),
        read_buf_(kMaxLineBytes),
        queue_limit_(queue_limit),
        server_(std::move(server)) {}

  void start() override {
    auto self = this->shared_from_this();
    asio::post(stream_.get_executor(), [self]() {
      if constexpr (std::is_same_v<Stream, SslStream>) {
        self->stream_.async_handshake(asio::ssl::stream_base::server, [self](const asio::error_code &ec) {
          if (ec) {
            spdlog::warn("[Conn {}] TLS handshake failed: {}", self->id_, ec.message());
            self->shutdown();
            return;
          }
          self->read_line();
        });
      } else {
        self->read_line();
      }
    });
  }

  void send(std::string line) override {
    auto self = this->shared_from_this();
    asio::post(stream_.get_executor(), [self, line = std::move(line)]() mutable {
      if (self->closed_) {
        return;
      }
      if (self->queued_bytes_ + line.size() > self->queue_limit_) {
        spdlog::warn("[Conn {}] Client is not reading ({} bytes queued), closing", self->id_, self->queued_bytes_);
        self->shutdown();
        return;
      }
      bool idle = self->write_queue_.empty();
      self->queued_bytes_ += line.size();
      self->write_queue_.push_back(std::move(line));
      if (idle) {
        self->write_next();
      }
    });
  }

  void close() override {
    auto self = this->shared_from_this();
    asio::post(stream_.get_executor(), [self]() { self->shutdown(); });
  }

 private:
  void read_line() {
    auto self = this->shared_from_this();
    asio::async_read_until(stream_, read_buf_, '\n', [self](const asio::error_code &ec, size_t bytes_transferred) {
      if (ec) {
        if (ec == asio::error::not_found) {
          spdlog::warn("[Conn {}] Line exceeds {} bytes, closing", self->id_, kMaxLineBytes);
        } else if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
          spdlog::warn("[Conn {}] Read error: {}", self->id_, ec.message());
        }
        self->shutdown();
        return;
      }

      auto data = self->read_buf_.data();
      std::string line(asio::buffers_begin(data), asio::buffers_begin(data) + bytes_transferred);
      self->read_buf_.consume(bytes_transferred);

      while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
      }

      if (!line.empty()) {
        if (auto server = self->server_.lock()) {
          server->on_line(self->id_, line);
        }
      }

      if (!self->closed_) {
        self->read_line();
      }
    });
  }

  void write_next() {
    auto self = this->shared_from_this();
    asio::async_write(stream_, asio::buffer(write_queue_.front()), [self](const asio::error_code &ec, size_t) {
      if (ec) {
        if (ec != asio::error::operation_aborted) {
          spdlog::warn("[Conn {}] Write error: {}", self->id_, ec.message());
        }
        self->shutdown();
        self->write_queue_.clear();
        self->queued_bytes_ = 0;
        return;
      }
      self->queued_bytes_ -= self->write_queue_.front().size();
      self->write_queue_.pop_front();
      if (self->closed_) {
        self->write_queue_.clear();
        self->queued_bytes_ = 0;
        return;
      }
      if (!self->write_queue_.empty()) {
        self->write_next();
      }
    });
  }

  void shutdown() {
    if (closed_) {
      return;
    }
    closed_ = true;
    // The front line belongs to the write in flight until its handler runs
    if (!write_queue_.empty()) {
      write_queue_.erase(std::next(write_queue_.begin()), write_queue_.end());
      queued_bytes_ = write_queue_.front().size();
    }

    asio::error_code ignored;
    stream_.lowest_layer().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    stream_.lowest_layer().close(ignored);

    if (auto server = server_.lock()) {
      server->on_closed(id_);
    }
  }

  Stream stream_;
  asio::streambuf read_buf_;
  std::deque<std::string> write_queue_;
  size_t queued_bytes_ = 0;
  size_t queue_limit_;
  bool closed_ = false;
  std::weak_ptr<TransportServer> server_;
};

TransportServer::TransportServer(asio::io_context &io_ctx, std::string host, uint16_t port, std::optional<TlsOptions> tls)
    : io_ctx_(io_ctx), host_(std::move(host)), port_(port), tls_(std::move(tls)), acceptor_(io_ctx) {}

TransportServer::~TransportServer() {
  stop();
}

void TransportServer::set_line_handler(LineHandler handler) {
  std::lock_guard lock(mutex_);
  line_handler_ = std::move(handler);
}

void TransportServer::set_open_handler(ConnectionHandler handler) {
  std::lock_guard lock(mutex_);
  open_handler_ = std::move(handler);
}

void TransportServer::set_close_handler(ConnectionHandler handler) {
  std::lock_guard lock(mutex_);
  close_handler_ = std::move(handler);
}

void TransportServer::set_write_queue_limit(size_t bytes) {
  std::lock_guard lock(mutex_);
  write_queue_limit_ = bytes;
}

bool TransportServer::start() {
  asio::error_code ec;

  if (tls_) {
    ssl_ctx_ = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_server);
    ssl_ctx_->set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2 | asio::ssl::context::no_sslv3 |
                          asio::ssl::context::no_tlsv1 | asio::ssl::context::no_tlsv1_1);
    ssl_ctx_->use_certificate_chain_file(tls_->cert_file, ec);
    if (ec) {
      spdlog::error("Failed to load TLS certificate {}: {}", tls_->cert_file, ec.message());
      return false;
    }
    ssl_ctx_->use_private_key_file(tls_->key_file, asio::ssl::context::pem, ec);
    if (ec) {
      spdlog::error("Failed to load TLS private key {}: {}", tls_->key_file, ec.message());
      return false;
    }
  }

  auto address = asio::ip::make_address(host_, ec);
  if (ec) {
    spdlog::error("Invalid listen address {}: {}", host_, ec.message());
    return false;
  }

  asio::ip::tcp::endpoint endpoint(address, port_);
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    spdlog::error("Failed to listen on {}:{}: {}", host_, port_, ec.message());
    asio::error_code ignored;
    acceptor_.close(ignored);
    return false;
  }

  {
    std::lock_guard lock(mutex_);
    stopped_ = false;
  }

  spdlog::info("Listening on {}:{}{}", host_, port(), tls_ ? " (TLS)" : "");
  do_accept();
  return true;
}

void TransportServer::stop() {
  std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
  {
    std::lock_guard lock(mutex_);
    if (stopped_ && connections_.empty() && !acceptor_.is_open()) {
      return;
    }
    stopped_ = true;
    connections.swap(connections_);
    line_handler_ = nullptr;
    open_handler_ = nullptr;
    close_handler_ = nullptr;
  }

  asio::error_code ignored;
  acceptor_.close(ignored);

  for (auto &[id, connection] : connections) {
    connection->close();
  }
  if (!connections.empty()) {
    spdlog::info("Closed {} client connections", connections.size());
  }
}

uint16_t TransportServer::port() const {
  asio::error_code ec;
  auto endpoint = acceptor_.local_endpoint(ec);
  return ec ? port_ : endpoint.port();
}

size_t TransportServer::connection_count() const {
  std::lock_guard lock(mutex_);
  return connections_.size();
}

void TransportServer::deliver(const ConnectionId &connection, const protocol::OutboundEvent &event) {
  std::shared_ptr<Connection> target;
  {
    std::lock_guard lock(mutex_);
    auto it = connections_.find(connection);
    if (it != connections_.end()) {
      target = it->second;
    }
  }

  if (!target) {
    spdlog::debug("[Conn {}] Not connected, dropping {}", connection, event.type);
    return;
  }

  // Invalid UTF-8 from tool output must not break the stream
  target->send(event.to_json().dump(-1, ' ', false, json::error_handler_t::replace) + "\n");
}

void TransportServer::do_accept() {
  std::weak_ptr<TransportServer> weak = weak_from_this();
  acceptor_.async_accept(asio::make_strand(io_ctx_), [weak](const asio::error_code &ec, asio::ip::tcp::socket socket) {
    auto self = weak.lock();
    if (!self) {
      return;
    }

    if (ec) {
      if (ec == asio::error::operation_aborted) {
        return;
      }
      spdlog::warn("Accept failed: {}", ec.message());
    } else {
      auto id = UUID::short_id();
      asio::error_code remote_ec;
      auto remote = socket.remote_endpoint(remote_ec);
      spdlog::info("[Conn {}] Accepted from {}:{}", id, remote.address().to_string(), remote.port());

      size_t queue_limit;
      {
        std::lock_guard lock(self->mutex_);
        queue_limit = self->write_queue_limit_;
      }
      if (self->ssl_ctx_) {
        self->add_connection(
            std::make_shared<StreamConnection<SslStream>>(id, SslStream(std::move(socket), *self->ssl_ctx_), weak, queue_limit));
      } else {
        self->add_connection(std::make_shared<StreamConnection<asio::ip::tcp::socket>>(id, std::move(socket), weak, queue_limit));
      }
    }

    if (self->acceptor_.is_open()) {
      self->do_accept();
    }
  });
}

void TransportServer::add_connection(std::shared_ptr<Connection> connection) {
  ConnectionHandler on_open;
  {
    std::lock_guard lock(mutex_);
    if (stopped_) {
      connection->close();
      return;
    }
    connections_[connection->id()] = connection;
    on_open = open_handler_;
  }

  if (on_open) {
    on_open(connection->id());
  }
  connection->start();
}

void TransportServer::on_line(const ConnectionId &connection, const std::string &line) {
  LineHandler handler;
  {
    std::lock_guard lock(mutex_);
    handler = line_handler_;
  }

  if (!handler) {
    return;
  }

  try {
    handler(connection, line);
  } catch (const std::exception &e) {
    spdlog::error("[Conn {}] Failed to handle line: {}", connection, e.what());
  }
}

void TransportServer::on_closed(const ConnectionId &connection) {
  ConnectionHandler handler;
  {
    std::lock_guard lock(mutex_);
    if (connections_.erase(connection) == 0) {
      return;
    }
    handler = close_handler_;
  }

  spdlog::info("[Conn {}] Closed", connection);
  if (handler) {
    handler(connection);
  }
}

}  // namespace tether::net
