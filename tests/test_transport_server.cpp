#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "net/transport_server.hpp"

using namespace tether;
using namespace tether::net;
using asio::ip::tcp;

class TransportServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server_ = std::make_shared<TransportServer>(io_ctx_, "127.0.0.1", 0);
    server_->set_line_handler([this](const ConnectionId &connection, const std::string &line) {
      std::lock_guard lock(mutex_);
      lines_.emplace_back(connection, line);
      cv_.notify_all();
      if (line == "explode") {
        throw std::runtime_error("handler failure");
      }
    });
    server_->set_open_handler([this](const ConnectionId &connection) {
      std::lock_guard lock(mutex_);
      opened_.push_back(connection);
      cv_.notify_all();
    });
    server_->set_close_handler([this](const ConnectionId &connection) {
      std::lock_guard lock(mutex_);
      closed_.push_back(connection);
      cv_.notify_all();
    });
  }

  void TearDown() override {
    work_.reset();
    io_ctx_.stop();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
    server_->stop();
  }

  void run() {
    ASSERT_TRUE(server_->start());
    ASSERT_NE(server_->port(), 0);
    work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_ctx_.get_executor());
    io_thread_ = std::thread([this]() { io_ctx_.run(); });
  }

  template <typename Pred>
  bool wait_until(Pred pred) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, std::chrono::seconds(5), pred);
  }

  std::unique_ptr<tcp::socket> connect() {
    auto socket = std::make_unique<tcp::socket>(client_ctx_);
    socket->connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->port()));
    return socket;
  }

  static void write(tcp::socket &socket, const std::string &data) {
    asio::write(socket, asio::buffer(data));
  }

  static std::string read_line(tcp::socket &socket, asio::streambuf &buf) {
    auto n = asio::read_until(socket, buf, '\n');
    std::string line(asio::buffers_begin(buf.data()), asio::buffers_begin(buf.data()) + n - 1);
    buf.consume(n);
    return line;
  }

  asio::io_context io_ctx_;
  asio::io_context client_ctx_;
  std::shared_ptr<TransportServer> server_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::pair<ConnectionId, std::string>> lines_;
  std::vector<ConnectionId> opened_;
  std::vector<ConnectionId> closed_;
};

TEST_F(TransportServerTest, RoundTripOverLoopback) {
  run();
  auto client = connect();

  write(*client, "{\"type\":\"get_status\",\"sessionId\":\"s1\"}\r\n");
  ASSERT_TRUE(wait_until([this]() { return !lines_.empty(); }));

  ConnectionId connection;
  {
    std::lock_guard lock(mutex_);
    connection = lines_[0].first;
    EXPECT_EQ(lines_[0].second, "{\"type\":\"get_status\",\"sessionId\":\"s1\"}");
    ASSERT_EQ(opened_.size(), 1u);
    EXPECT_EQ(opened_[0], connection);
  }
  EXPECT_EQ(server_->connection_count(), 1u);

  server_->deliver(connection, protocol::OutboundEvent{"status", "s1", {{"state", "idle"}}});
  server_->deliver(connection, protocol::events::thinking("s1", true));

  asio::streambuf buf;
  auto first = json::parse(read_line(*client, buf));
  EXPECT_EQ(first["type"], "status");
  EXPECT_EQ(first["sessionId"], "s1");
  EXPECT_EQ(first["state"], "idle");

  auto second = json::parse(read_line(*client, buf));
  EXPECT_EQ(second["type"], "thinking");
  EXPECT_EQ(second["thinking"], true);

  client->close();
  ASSERT_TRUE(wait_until([this]() { return !closed_.empty(); }));
  {
    std::lock_guard lock(mutex_);
    EXPECT_EQ(closed_[0], connection);
  }
  EXPECT_EQ(server_->connection_count(), 0u);
}

TEST_F(TransportServerTest, ConnectionsAreAddressedSeparately) {
  run();
  auto a = connect();
  auto b = connect();
  write(*a, "from-a\n");
  write(*b, "from-b\n");
  ASSERT_TRUE(wait_until([this]() { return lines_.size() == 2; }));

  ConnectionId conn_b;
  {
    std::lock_guard lock(mutex_);
    EXPECT_NE(lines_[0].first, lines_[1].first);
    conn_b = lines_[0].second == "from-b" ? lines_[0].first : lines_[1].first;
  }

  server_->deliver(conn_b, protocol::events::error("", "only b"));
  asio::streambuf buf;
  EXPECT_EQ(json::parse(read_line(*b, buf))["message"], "only b");
  EXPECT_EQ(a->available(), 0u);
}

TEST_F(TransportServerTest, HandlerExceptionKeepsConnection) {
  run();
  auto client = connect();
  write(*client, "explode\nstill here\n\n");
  ASSERT_TRUE(wait_until([this]() { return lines_.size() == 2; }));

  std::lock_guard lock(mutex_);
  EXPECT_EQ(lines_[1].second, "still here");
  EXPECT_TRUE(closed_.empty());
}

TEST_F(TransportServerTest, DeliverToUnknownConnectionIsDropped) {
  run();
  EXPECT_NO_THROW(server_->deliver("nobody", protocol::events::thinking("s1", false)));
}

TEST_F(TransportServerTest, StopClosesClients) {
  run();
  auto client = connect();
  write(*client, "hello\n");
  ASSERT_TRUE(wait_until([this]() { return !lines_.empty(); }));

  asio::post(io_ctx_, [this]() { server_->stop(); });

  // 服务端关闭后客户端读到 EOF
  asio::streambuf buf;
  asio::error_code ec;
  asio::read_until(*client, buf, '\n', ec);
  EXPECT_EQ(ec, asio::error_code(asio::error::eof));
}

TEST_F(TransportServerTest, StalledClientIsClosed) {
  server_->set_write_queue_limit(1024 * 1024);
  run();
  auto client = connect();
  write(*client, "hello\n");
  ASSERT_TRUE(wait_until([this]() { return !lines_.empty(); }));
  ConnectionId connection;
  {
    std::lock_guard lock(mutex_);
    connection = lines_[0].first;
  }

  // The client never reads, so lines pile up until the limit trips
  std::string chunk(256 * 1024, 'x');
  for (int i = 0; i < 128; ++i) {
    server_->deliver(connection, protocol::OutboundEvent{"message", "s1", {{"content", chunk}}});
  }
  ASSERT_TRUE(wait_until([&]() { return std::find(closed_.begin(), closed_.end(), connection) != closed_.end(); }));
  EXPECT_EQ(server_->connection_count(), 0u);
}

TEST_F(TransportServerTest, StopWithWritesInFlight) {
  run();
  auto client = connect();
  write(*client, "hello\n");
  ASSERT_TRUE(wait_until([this]() { return !lines_.empty(); }));
  ConnectionId connection;
  {
    std::lock_guard lock(mutex_);
    connection = lines_[0].first;
  }

  std::string chunk(512 * 1024, 'y');
  for (int i = 0; i < 16; ++i) {
    server_->deliver(connection, protocol::OutboundEvent{"message", "s1", {{"content", chunk}}});
  }
  asio::post(io_ctx_, [this]() { server_->stop(); });

  // Whatever made it out is followed by a clean end of stream
  std::vector<char> buf(64 * 1024);
  asio::error_code ec;
  while (!ec) {
    client->read_some(asio::buffer(buf), ec);
  }
  EXPECT_TRUE(ec == asio::error::eof || ec == asio::error::connection_reset) << ec.message();
}

TEST(TransportServerStartTest, InvalidAddress) {
  asio::io_context io_ctx;
  auto server = std::make_shared<TransportServer>(io_ctx, "not-an-address", 0);
  EXPECT_FALSE(server->start());
}

TEST(TransportServerStartTest, MissingTlsFiles) {
  asio::io_context io_ctx;
  auto server = std::make_shared<TransportServer>(io_ctx, "127.0.0.1", 0, TlsOptions{"/nonexistent/cert.pem", "/nonexistent/key.pem"});
  EXPECT_FALSE(server->start());
}
