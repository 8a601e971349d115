//
//  wss_connector.hpp
//  speech-io
//

#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <spdlog/spdlog.h>
#include "speech-io/net/connection.hpp"

namespace sio {

namespace net {

struct WSSEndpoint {
  std::string host;
  std::string port = "443";
  std::string target;
  // extra HTTP headers for the upgrade request
  std::vector<std::pair<std::string, std::string>> headers;
  // frames sent as soon as the WebSocket is open, before anything else
  std::vector<std::string> greeting;
  std::chrono::seconds connect_timeout{30};
};

// One TLS WebSocket connection to an endpoint, text frames only.
//
// start() resolves, connects, runs the TLS and WebSocket handshakes, queues
// the greeting ahead of anything sent so far, then reports readiness once.
// A connection that fails or closes before opening reports nullptr instead.
// Everything but is_alive() runs on the connection's own strand.
class WSSConnection : public Connection,
                      public std::enable_shared_from_this<WSSConnection> {
 public:
  using io_context = boost::asio::io_context;
  using ssl_context = boost::asio::ssl::context;

  WSSConnection(io_context& io, ssl_context& ssl, WSSEndpoint ep,
                Connector::message_callback&& on_message,
                Connector::ready_callback&& on_ready);

  virtual ~WSSConnection();

  void start();

  virtual void send(std::string_view msg) override;

  virtual void close() override;

  virtual bool is_alive() const override;

 private:
  using tcp_stream = boost::beast::tcp_stream;
  using wss_stream = boost::beast::websocket::stream<boost::asio::ssl::stream<tcp_stream>>;
  using resolver = boost::asio::ip::tcp::resolver;

  enum class State {
    Idle = 0,
    Opening,
    Open,
    Closing,
    Closed,
  };

  void on_post_start();

  void on_post_send(std::string msg);

  void on_post_close();

  void on_resolve(boost::beast::error_code ec, resolver::results_type results);

  void on_connect(boost::beast::error_code ec, resolver::results_type::endpoint_type);

  void on_tls_handshake(boost::beast::error_code ec);

  void on_ws_handshake(boost::beast::error_code ec);

  void on_read(boost::beast::error_code ec, std::size_t);

  void on_write(boost::beast::error_code ec, std::size_t);

  void on_closed(boost::beast::error_code ec);

  void read_next();

  void write_next();

  // true when the completion must not continue the chain
  bool failed(boost::beast::error_code ec, const char* stage);

  void notify_ready(std::shared_ptr<Connection> conn);

  resolver resolver_;
  wss_stream ws_;
  WSSEndpoint ep_;
  Connector::message_callback on_message_;
  Connector::ready_callback on_ready_;
  std::shared_ptr<spdlog::logger> logger_;
  boost::beast::websocket::response_type resp_;
  boost::beast::flat_buffer buf_;
  std::deque<std::string> outbound_;
  State state_ = State::Idle;
  std::atomic<bool> alive_{false};
  bool writing_ = false;
};

class WSSConnector : public Connector {
 public:
  // process wide TLS 1.2+ client context with system CA paths
  static WSSConnection::ssl_context& default_ssl_context();

  WSSConnector(WSSConnection::io_context& io, WSSEndpoint ep);

  WSSConnector(WSSConnection::io_context& io, WSSConnection::ssl_context& ssl, WSSEndpoint ep);

  virtual ~WSSConnector() = default;

  virtual void async_connect(message_callback on_message, ready_callback on_ready) override;

  inline const WSSEndpoint& endpoint() const { return ep_; }

 private:
  WSSConnection::io_context& io_;
  WSSConnection::ssl_context& ssl_;
  WSSEndpoint ep_;
};

} // net

} // sio
