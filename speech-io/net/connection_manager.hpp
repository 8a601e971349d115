//
//  connection_manager.hpp
//  speech-io
//

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <spdlog/spdlog.h>
#include "speech-io/core/channel.hpp"
#include "speech-io/net/connection.hpp"

namespace sio {

namespace net {

// Owns the single connection to the service and keeps it alive.
//
// Every member function must be called on the executor passed to the
// constructor; callbacks coming back from the connector are re-posted there.
// The handle is only ever replaced as a whole, so a caller sees either the
// old or the new connection.
class ConnectionManager : public std::enable_shared_from_this<ConnectionManager> {
 public:
  using executor_type = boost::asio::any_io_executor;
  using duration = std::chrono::steady_clock::duration;
  using connect_handler = std::function<void(std::shared_ptr<Connection>)>;
  using receive_handler = core::Channel<std::string>::handler_type;

  ConnectionManager(executor_type ex, std::shared_ptr<Connector> connector,
                    duration supervise_interval, std::string name = "connection");

  virtual ~ConnectionManager();

  // Opens the first connection and starts the supervisor loop.
  void start();

  // No-op when alive (handler gets the current handle). When a connect is
  // already in flight the handler waits for that one.
  void connect(connect_handler on_done = nullptr);

  bool is_alive() const;

  inline std::shared_ptr<Connection> handle() const { return handle_; }

  // Stops supervising, closes the handle and the inbox. Idempotent.
  void close();

  // Next inbound frame, from whichever connection delivered it.
  void async_receive(receive_handler handler);

  inline bool is_closed() const { return closed_; }

  inline bool is_connecting() const { return connecting_; }

  // number of handles installed so far
  inline uint64_t connections() const { return connections_; }

  inline const executor_type& get_executor() const { return ex_; }

 private:
  void arm_supervisor();

  void on_supervise(boost::system::error_code ec);

  void on_connected(std::shared_ptr<Connection> conn);

  void on_inbound(std::string&& msg);

  executor_type ex_;
  std::shared_ptr<Connector> connector_;
  duration interval_;
  boost::asio::steady_timer timer_;
  core::Channel<std::string> inbox_;
  std::shared_ptr<Connection> handle_;
  std::vector<connect_handler> waiters_;
  std::shared_ptr<spdlog::logger> logger_;
  uint64_t connections_ = 0;
  bool connecting_ = false;
  bool started_ = false;
  bool closed_ = false;
};

} // net

} // sio
