//
//  stream_adapter.hpp
//  speech-io
//

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <spdlog/spdlog.h>
#include "speech-io/core/channel.hpp"
#include "speech-io/core/correlation_queue.hpp"
#include "speech-io/core/result.hpp"
#include "speech-io/net/connection_manager.hpp"

namespace sio {

namespace speech {

// Common plumbing of the streaming adapters.
//
// Submissions append one metadata record to the correlation queue and queue
// their frames for the sender, which waits for a live connection. Inbound
// frames are pulled one at a time and handed to on_event(); subclasses turn
// them into results with emit(). All state lives on one strand; the public
// functions post to it and may be called from any thread.
class StreamAdapter : public std::enable_shared_from_this<StreamAdapter> {
 public:
  using executor_type = boost::asio::any_io_executor;
  using duration = std::chrono::steady_clock::duration;
  using result_handler = core::Channel<core::SpeechResult>::handler_type;
  using stop_handler = std::function<void()>;

  struct Options {
    // supervisor period
    duration supervise_interval = std::chrono::seconds(50);
    // how often a blocked sender re-checks the connection
    duration send_poll_interval = std::chrono::milliseconds(100);
    // pause after an inbound frame could not be handled
    duration retry_delay = std::chrono::seconds(1);
  };

  enum class UnitState {
    AwaitingFirstChunk = 0,
    Streaming,
    Completed,
  };

  StreamAdapter(executor_type ex, std::shared_ptr<net::Connector> connector,
                const Options& opts, const std::string& name);

  virtual ~StreamAdapter();

  // Opens the connection, starts the supervisor and the result loop.
  // No-op when already started or stopped.
  void start();

  // Cancels a pending send, waits for the sender to acknowledge, then
  // closes the connection. `on_stopped` runs once teardown is complete.
  // Idempotent.
  void stop(stop_handler on_stopped = nullptr);

  // Next result in arrival order. Once the adapter is stopped, results
  // already emitted are still handed out, then operation_aborted.
  void async_next(result_handler handler);

  // Accessors below read strand state; call them on the strand (or while
  // nothing else runs the io_context).
  inline bool is_running() const { return state_ == State::Running; }

  inline bool is_stopped() const { return state_ == State::Stopped; }

  inline std::size_t pending_units() const { return queue_.size(); }

  inline std::size_t pending_frames() const { return outbound_.size(); }

  inline UnitState unit_state() const { return unit_state_; }

  inline uint64_t desyncs() const { return desyncs_; }

  inline uint64_t event_errors() const { return event_errors_; }

  inline const net::ConnectionManager& connection() const { return *conn_; }

  inline const executor_type& get_executor() const { return strand_; }

 protected:
  template <typename T>
  std::shared_ptr<T> shared_from_base() {
    return std::static_pointer_cast<T>(shared_from_this());
  }

  // one inbound frame; throwing skips the frame and pauses the loop
  virtual void on_event(std::string&& msg) = 0;

  // called on the strand when stop() begins, before the sender is cancelled
  virtual void on_stop() { }

  // --- strand only ---

  void enqueue_unit(core::Metadata meta);

  void dispatch(std::vector<std::string> frames);

  // Makes the next queued record, if any, the active unit. A unit that is
  // still streaming is left behind when its successor is queued. Returns
  // true when a new unit was taken; false means the active metadata is
  // reused.
  bool advance_unit();

  // Activates a unit that never went through the queue (served locally).
  void activate(core::Metadata meta);

  inline bool has_active() const { return has_active_; }

  inline core::Metadata& active() { return active_; }

  inline bool idle() const {
    return queue_.empty() && outbound_.empty() &&
           (!has_active_ || unit_state_ == UnitState::Completed);
  }

  void emit(core::ResultType type, std::string data, bool end_of_unit);

  std::shared_ptr<spdlog::logger> logger_;

 private:
  enum class State {
    Init = 0,
    Running,
    Stopping,
    Stopped,
  };

  void on_post_start();

  void on_post_stop(stop_handler on_stopped);

  void finish_stop();

  void flush_outbound();

  void arm_send_wait();

  void on_send_wait(boost::system::error_code ec);

  void receive_next();

  void on_receive(boost::system::error_code ec, std::string msg);

  void on_retry(boost::system::error_code ec);

  executor_type strand_;
  std::shared_ptr<net::ConnectionManager> conn_;
  core::CorrelationQueue queue_;
  core::Channel<core::SpeechResult> results_;
  std::deque<std::string> outbound_;
  boost::asio::steady_timer send_timer_;
  boost::asio::steady_timer retry_timer_;
  Options opts_;
  std::vector<stop_handler> stop_waiters_;
  core::Metadata active_;
  UnitState unit_state_ = UnitState::Completed;
  State state_ = State::Init;
  bool has_active_ = false;
  bool send_waiting_ = false;
  uint64_t desyncs_ = 0;
  uint64_t event_errors_ = 0;
};

} // speech

} // sio
