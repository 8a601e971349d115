//
//  connection_manager.cpp
//  speech-io
//

#include <stdexcept>
#include <utility>
#include <boost/beast/core/bind_handler.hpp>
#include "speech-io/net/connection_manager.hpp"
#include "speech-io/utils/log.hpp"

using namespace sio::net;

ConnectionManager::ConnectionManager(executor_type ex, std::shared_ptr<Connector> connector,
                                     duration supervise_interval, std::string name)
    : ex_(std::move(ex)),
      connector_(std::move(connector)),
      interval_(supervise_interval),
      timer_(ex_),
      inbox_(ex_),
      logger_(utils::get_logger(name))
{
  if (!connector_) {
    throw std::invalid_argument("ConnectionManager: null connector");
  }
}

ConnectionManager::~ConnectionManager() {
  if (handle_) {
    handle_->close();
  }
}

void ConnectionManager::start() {
  if (started_ || closed_) {
    return;
  }
  started_ = true;

  connect();
  arm_supervisor();
}

void ConnectionManager::connect(connect_handler on_done) {
  if (closed_) {
    if (on_done) {
      on_done(nullptr);
    }
    return;
  }

  if (is_alive()) {
    if (on_done) {
      on_done(handle_);
    }
    return;
  }

  if (on_done) {
    waiters_.push_back(std::move(on_done));
  }

  if (connecting_) {
    return;
  }
  connecting_ = true;

  logger_->info("Establishing connection...");

  std::weak_ptr<ConnectionManager> weak = shared_from_this();
  auto ex = ex_;

  auto on_message = [weak, ex](std::string&& msg) {
    boost::asio::post(ex, [weak, m = std::move(msg)]() mutable {
      if (auto self = weak.lock()) {
        self->on_inbound(std::move(m));
      }
    });
  };

  auto on_ready = [weak, ex](std::shared_ptr<Connection> conn) {
    boost::asio::post(ex, [weak, conn = std::move(conn)]() mutable {
      if (auto self = weak.lock()) {
        self->on_connected(std::move(conn));
      } else if (conn) {
        conn->close();
      }
    });
  };

  try {
    connector_->async_connect(std::move(on_message), std::move(on_ready));
  } catch (const std::exception& e) {
    logger_->error("Failed to connect: {}", e.what());
    on_connected(nullptr);
  }
}

bool ConnectionManager::is_alive() const {
  return handle_ && handle_->is_alive();
}

void ConnectionManager::close() {
  if (closed_) {
    return;
  }
  closed_ = true;

  timer_.cancel();
  inbox_.close();

  // dropping the old handle before close() keeps the swap single-step
  if (auto conn = std::exchange(handle_, nullptr)) {
    conn->close();
  }

  for (auto& waiter : std::exchange(waiters_, {})) {
    waiter(nullptr);
  }

  logger_->info("Connection closed");
}

void ConnectionManager::async_receive(receive_handler handler) {
  inbox_.async_pop(std::move(handler));
}

void ConnectionManager::arm_supervisor() {
  timer_.expires_after(interval_);
  timer_.async_wait(boost::beast::bind_front_handler(&ConnectionManager::on_supervise,
                                                     shared_from_this()));
}

void ConnectionManager::on_supervise(boost::system::error_code ec) {
  if (ec || closed_) {
    return;
  }

  if (!is_alive() && !connecting_) {
    logger_->info("Re-establishing connection...");
    connect();
  }

  arm_supervisor();
}

void ConnectionManager::on_connected(std::shared_ptr<Connection> conn) {
  connecting_ = false;

  if (closed_) {
    if (conn) {
      conn->close();
    }
    return;
  }

  if (conn) {
    ++connections_;
    auto old = std::exchange(handle_, conn);
    if (old) {
      old->close();
    }
    logger_->info("Connected (#{})", connections_);
  } else {
    logger_->warn("Connection attempt failed, retrying in {} ms",
                  std::chrono::duration_cast<std::chrono::milliseconds>(interval_).count());
  }

  auto current = is_alive() ? handle_ : nullptr;
  for (auto& waiter : std::exchange(waiters_, {})) {
    waiter(current);
  }
}

void ConnectionManager::on_inbound(std::string&& msg) {
  inbox_.push(std::move(msg));
}
