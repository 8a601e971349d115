//
//  channel.hpp
//  speech-io
//

#pragma once

#include <deque>
#include <functional>
#include <utility>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

namespace sio {

namespace core {

// Single-consumer buffered channel bound to an executor. Not thread safe:
// push/async_pop/close must run on the executor that owns the channel.
// Handlers are always invoked through post(), never from inside the call.
template <typename T>
class Channel {
 public:
  using executor_type = boost::asio::any_io_executor;
  using handler_type = std::function<void(boost::system::error_code, T)>;

  explicit Channel(executor_type ex) : ex_(std::move(ex)) { }

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  ~Channel() = default;

  void push(T val) {
    if (closed_) {
      return;
    }

    if (handler_) {
      complete(std::exchange(handler_, nullptr), {}, std::move(val));
    } else {
      queue_.push_back(std::move(val));
    }
  }

  void async_pop(handler_type handler) {
    if (!queue_.empty()) {
      auto val = std::move(queue_.front());
      queue_.pop_front();
      complete(std::move(handler), {}, std::move(val));
    } else if (closed_) {
      complete(std::move(handler), boost::asio::error::operation_aborted, T{});
    } else if (handler_) {
      complete(std::move(handler), boost::asio::error::in_progress, T{});
    } else {
      handler_ = std::move(handler);
    }
  }

  // Aborts a pending pop and refuses further pushes. Buffered values are
  // dropped unless `keep_buffered` is set, in which case pops drain them
  // before reporting operation_aborted.
  void close(bool keep_buffered = false) {
    if (closed_) {
      return;
    }

    closed_ = true;
    if (!keep_buffered) {
      queue_.clear();
    }

    if (handler_) {
      complete(std::exchange(handler_, nullptr), boost::asio::error::operation_aborted, T{});
    }
  }

  inline bool is_closed() const { return closed_; }

  inline bool has_waiter() const { return static_cast<bool>(handler_); }

  inline std::size_t size() const { return queue_.size(); }

 private:
  void complete(handler_type handler, boost::system::error_code ec, T val) {
    boost::asio::post(ex_,
                      [h = std::move(handler), ec, v = std::move(val)]() mutable {
                        h(ec, std::move(v));
                      });
  }

  executor_type ex_;
  std::deque<T> queue_;
  handler_type handler_;
  bool closed_ = false;
};

} // core

} // sio
