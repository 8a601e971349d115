//
//  wss_connector.cpp
//  speech-io
//

#include <stdexcept>
#include "speech-io/net/wss_connector.hpp"
#include "speech-io/utils/log.hpp"

using namespace sio::net;

namespace {

class SSLCtx {
 public:
  static WSSConnection::ssl_context& get() {
    static SSLCtx ctx;
    return ctx.ssl_;
  }

  ~SSLCtx() = default;

 private:
  SSLCtx() : ssl_(WSSConnection::ssl_context::tls_client) {
    ssl_.set_options(boost::asio::ssl::context::no_sslv2 |
                     boost::asio::ssl::context::no_sslv3 |
                     boost::asio::ssl::context::no_tlsv1 |
                     boost::asio::ssl::context::no_tlsv1_1);
    ssl_.set_verify_mode(boost::asio::ssl::verify_peer);
    ssl_.set_default_verify_paths();
  }

  WSSConnection::ssl_context ssl_;
};

} // namespace

WSSConnection::WSSConnection(io_context& io, ssl_context& ssl, WSSEndpoint ep,
                             Connector::message_callback&& on_message,
                             Connector::ready_callback&& on_ready)
    : resolver_(boost::asio::make_strand(io)),
      ws_(resolver_.get_executor(), ssl),
      ep_(std::move(ep)),
      on_message_(std::move(on_message)),
      on_ready_(std::move(on_ready)),
      logger_(utils::get_logger("wss"))
{
  if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), ep_.host.c_str())) {
    throw std::runtime_error("SSL: error setting SNI for " + ep_.host);
  }

  ws_.next_layer().set_verify_callback(boost::asio::ssl::host_name_verification(ep_.host));
}

WSSConnection::~WSSConnection() { }

void WSSConnection::start() {
  boost::asio::post(ws_.get_executor(),
                    boost::beast::bind_front_handler(&WSSConnection::on_post_start,
                                                     shared_from_this()));
}

void WSSConnection::send(std::string_view msg) {
  boost::asio::post(ws_.get_executor(),
                    boost::beast::bind_front_handler(&WSSConnection::on_post_send,
                                                     shared_from_this(),
                                                     std::string(msg)));
}

void WSSConnection::close() {
  alive_ = false;
  boost::asio::post(ws_.get_executor(),
                    boost::beast::bind_front_handler(&WSSConnection::on_post_close,
                                                     shared_from_this()));
}

bool WSSConnection::is_alive() const {
  return alive_;
}

void WSSConnection::on_post_start() {
  if (state_ != State::Idle) {
    return;
  }
  state_ = State::Opening;

  resolver_.async_resolve(ep_.host, ep_.port,
                          boost::beast::bind_front_handler(&WSSConnection::on_resolve,
                                                           shared_from_this()));
}

void WSSConnection::on_post_send(std::string msg) {
  if (state_ == State::Closing || state_ == State::Closed) {
    logger_->debug("Dropping frame for closed wss://{}", ep_.host);
    return;
  }

  outbound_.push_back(std::move(msg));
  if (state_ == State::Open) {
    write_next();
  }
}

void WSSConnection::on_post_close() {
  if (state_ == State::Closing || state_ == State::Closed) {
    return;
  }

  bool open = (state_ == State::Open);
  state_ = State::Closing;
  alive_ = false;
  resolver_.cancel();

  if (open) {
    ws_.async_close(boost::beast::websocket::close_code::normal,
                    boost::beast::bind_front_handler(&WSSConnection::on_closed,
                                                     shared_from_this()));
  } else {
    // still handshaking: no close frame to exchange
    boost::beast::error_code ignored;
    boost::beast::get_lowest_layer(ws_).socket().close(ignored);
    on_closed(ignored);
  }
}

void WSSConnection::on_resolve(boost::beast::error_code ec, resolver::results_type results) {
  if (failed(ec, "resolve")) {
    return;
  }

  auto& lowest_layer = boost::beast::get_lowest_layer(ws_);
  lowest_layer.expires_after(ep_.connect_timeout);
  lowest_layer.async_connect(results,
                             boost::beast::bind_front_handler(&WSSConnection::on_connect,
                                                              shared_from_this()));
}

void WSSConnection::on_connect(boost::beast::error_code ec,
                               resolver::results_type::endpoint_type) {
  if (failed(ec, "connect")) {
    return;
  }

  boost::beast::get_lowest_layer(ws_).expires_after(ep_.connect_timeout);
  ws_.next_layer().async_handshake(boost::asio::ssl::stream_base::client,
                                   boost::beast::bind_front_handler(&WSSConnection::on_tls_handshake,
                                                                    shared_from_this()));
}

void WSSConnection::on_tls_handshake(boost::beast::error_code ec) {
  if (failed(ec, "TLS handshake")) {
    return;
  }

  // the websocket stream runs its own timeouts from here on
  boost::beast::get_lowest_layer(ws_).expires_never();

  namespace websocket = boost::beast::websocket;
  ws_.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::client));
  ws_.set_option(websocket::stream_base::decorator(
      [headers = ep_.headers](websocket::request_type& req) {
        for (const auto& [name, value] : headers) {
          req.set(name, value);
        }
      }));
  ws_.text(true);

  ws_.async_handshake(resp_, ep_.host + ":" + ep_.port, ep_.target,
                      boost::beast::bind_front_handler(&WSSConnection::on_ws_handshake,
                                                       shared_from_this()));
}

void WSSConnection::on_ws_handshake(boost::beast::error_code ec) {
  if (failed(ec, "WebSocket handshake")) {
    return;
  }

  state_ = State::Open;
  logger_->info("Connected to wss://{}{} (status {})",
                ep_.host, ep_.target, static_cast<unsigned>(resp_.result_int()));

  outbound_.insert(outbound_.begin(), ep_.greeting.begin(), ep_.greeting.end());

  alive_ = true;
  notify_ready(shared_from_this());

  read_next();
  write_next();
}

void WSSConnection::on_read(boost::beast::error_code ec, std::size_t) {
  if (failed(ec, "read")) {
    return;
  }

  if (on_message_) {
    on_message_(boost::beast::buffers_to_string(buf_.data()));
  }
  buf_.consume(buf_.size());

  read_next();
}

void WSSConnection::on_write(boost::beast::error_code ec, std::size_t) {
  writing_ = false;
  if (failed(ec, "write")) {
    return;
  }

  outbound_.pop_front();
  write_next();
}

void WSSConnection::on_closed(boost::beast::error_code) {
  if (state_ == State::Closed) {
    return;
  }

  state_ = State::Closed;
  alive_ = false;
  outbound_.clear();

  logger_->info("Disconnected from wss://{}", ep_.host);
  notify_ready(nullptr);
}

void WSSConnection::read_next() {
  ws_.async_read(buf_,
                 boost::beast::bind_front_handler(&WSSConnection::on_read,
                                                  shared_from_this()));
}

void WSSConnection::write_next() {
  if (writing_ || outbound_.empty()) {
    return;
  }

  writing_ = true;
  ws_.async_write(boost::asio::buffer(outbound_.front()),
                  boost::beast::bind_front_handler(&WSSConnection::on_write,
                                                   shared_from_this()));
}

bool WSSConnection::failed(boost::beast::error_code ec, const char* stage) {
  if (state_ == State::Closing || state_ == State::Closed) {
    return true;
  }

  if (!ec) {
    return false;
  }

  if (ec == boost::beast::websocket::error::closed) {
    logger_->info("wss://{} closed by peer", ep_.host);
  } else if (ec != boost::asio::error::operation_aborted) {
    logger_->error("wss://{} {} failed: {}", ep_.host, stage, ec.message());
  }

  alive_ = false;
  state_ = State::Closing;
  resolver_.cancel();
  boost::beast::error_code ignored;
  boost::beast::get_lowest_layer(ws_).socket().close(ignored);
  on_closed(ec);
  return true;
}

void WSSConnection::notify_ready(std::shared_ptr<Connection> conn) {
  if (auto cb = std::exchange(on_ready_, nullptr)) {
    cb(std::move(conn));
  }
}

WSSConnection::ssl_context& WSSConnector::default_ssl_context() {
  return SSLCtx::get();
}

WSSConnector::WSSConnector(WSSConnection::io_context& io, WSSEndpoint ep)
    : WSSConnector(io, default_ssl_context(), std::move(ep))
{
}

WSSConnector::WSSConnector(WSSConnection::io_context& io, WSSConnection::ssl_context& ssl,
                           WSSEndpoint ep)
    : io_(io),
      ssl_(ssl),
      ep_(std::move(ep))
{
}

void WSSConnector::async_connect(message_callback on_message, ready_callback on_ready) {
  auto conn = std::make_shared<WSSConnection>(io_, ssl_, ep_,
                                              std::move(on_message), std::move(on_ready));
  conn->start();
}
