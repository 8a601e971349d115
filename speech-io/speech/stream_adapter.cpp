//
//  stream_adapter.cpp
//  speech-io
//

#include <exception>
#include <utility>
#include <boost/beast/core/bind_handler.hpp>
#include "speech-io/speech/stream_adapter.hpp"
#include "speech-io/utils/log.hpp"

using namespace sio::speech;

StreamAdapter::StreamAdapter(executor_type ex, std::shared_ptr<net::Connector> connector,
                             const Options& opts, const std::string& name)
    : logger_(utils::get_logger(name)),
      strand_(boost::asio::make_strand(ex)),
      conn_(std::make_shared<net::ConnectionManager>(strand_, std::move(connector),
                                                     opts.supervise_interval, name)),
      results_(strand_),
      send_timer_(strand_),
      retry_timer_(strand_),
      opts_(opts)
{
}

StreamAdapter::~StreamAdapter() { }

void StreamAdapter::start() {
  boost::asio::post(strand_,
                    boost::beast::bind_front_handler(&StreamAdapter::on_post_start,
                                                     shared_from_this()));
}

void StreamAdapter::stop(stop_handler on_stopped) {
  boost::asio::post(strand_,
                    boost::beast::bind_front_handler(&StreamAdapter::on_post_stop,
                                                     shared_from_this(),
                                                     std::move(on_stopped)));
}

void StreamAdapter::async_next(result_handler handler) {
  boost::asio::post(strand_,
                    [self = shared_from_this(), h = std::move(handler)]() mutable {
                      self->results_.async_pop(std::move(h));
                    });
}

void StreamAdapter::on_post_start() {
  if (state_ != State::Init) {
    return;
  }
  state_ = State::Running;

  logger_->info("Starting");

  conn_->start();
  receive_next();
  flush_outbound();
}

void StreamAdapter::on_post_stop(stop_handler on_stopped) {
  if (on_stopped) {
    stop_waiters_.push_back(std::move(on_stopped));
  }

  switch (state_) {
    case State::Stopping:
      // the pending sender acknowledgment will finish the job
      return;

    case State::Running:
      state_ = State::Stopping;
      logger_->info("Cleaning up tasks");
      on_stop();
      retry_timer_.cancel();
      if (send_waiting_) {
        send_timer_.cancel();
        return;
      }
      finish_stop();
      break;

    case State::Init:
    case State::Stopped:
      finish_stop();
      break;
  }
}

void StreamAdapter::finish_stop() {
  state_ = State::Stopped;

  outbound_.clear();
  conn_->close();
  queue_.clear();
  // results emitted before teardown stay deliverable
  results_.close(true);

  for (auto& waiter : std::exchange(stop_waiters_, {})) {
    waiter();
  }
}

void StreamAdapter::enqueue_unit(core::Metadata meta) {
  queue_.enqueue(std::move(meta));
}

void StreamAdapter::dispatch(std::vector<std::string> frames) {
  if (state_ == State::Stopping || state_ == State::Stopped) {
    logger_->warn("Dropping {} frame(s), adapter is stopped", frames.size());
    return;
  }

  for (auto& frame : frames) {
    outbound_.push_back(std::move(frame));
  }

  flush_outbound();
}

bool StreamAdapter::advance_unit() {
  if (auto next = queue_.dequeue()) {
    if (has_active_ && unit_state_ != UnitState::Completed) {
      logger_->debug("Unit '{}' ended without a final marker", active_.request_id);
    }
    activate(std::move(*next));
    return true;
  }

  // later events of a unit that is still streaming
  if (has_active_ && unit_state_ != UnitState::Completed) {
    return false;
  }

  ++desyncs_;
  logger_->warn("Received an event with no pending request, reusing metadata of '{}'",
                active_.request_id);
  return false;
}

void StreamAdapter::activate(core::Metadata meta) {
  active_ = std::move(meta);
  has_active_ = true;
  unit_state_ = UnitState::AwaitingFirstChunk;
}

void StreamAdapter::emit(core::ResultType type, std::string data, bool end_of_unit) {
  core::SpeechResult result;
  result.type = type;
  result.data = std::move(data);
  result.meta = active_;
  result.meta.is_first_chunk = (unit_state_ == UnitState::AwaitingFirstChunk);
  result.meta.end_of_stream = end_of_unit;

  unit_state_ = end_of_unit ? UnitState::Completed : UnitState::Streaming;

  results_.push(std::move(result));
}

void StreamAdapter::flush_outbound() {
  if (state_ != State::Running || send_waiting_ || outbound_.empty()) {
    return;
  }

  auto conn = conn_->handle();
  if (!conn || !conn->is_alive()) {
    arm_send_wait();
    return;
  }

  while (!outbound_.empty()) {
    try {
      conn->send(outbound_.front());
    } catch (const std::exception& e) {
      // frame stays queued and goes out on the next live connection
      logger_->error("Error sending frame: {}", e.what());
      arm_send_wait();
      return;
    }
    outbound_.pop_front();
  }
}

void StreamAdapter::arm_send_wait() {
  send_waiting_ = true;
  logger_->debug("Waiting for connection to be established...");

  send_timer_.expires_after(opts_.send_poll_interval);
  send_timer_.async_wait(boost::beast::bind_front_handler(&StreamAdapter::on_send_wait,
                                                          shared_from_this()));
}

void StreamAdapter::on_send_wait(boost::system::error_code ec) {
  send_waiting_ = false;

  if (state_ == State::Stopping) {
    logger_->info("Sender was cancelled");
    finish_stop();
    return;
  }

  if (ec || state_ != State::Running) {
    return;
  }

  flush_outbound();
}

void StreamAdapter::receive_next() {
  conn_->async_receive(boost::beast::bind_front_handler(&StreamAdapter::on_receive,
                                                        shared_from_this()));
}

void StreamAdapter::on_receive(boost::system::error_code ec, std::string msg) {
  if (ec || state_ != State::Running) {
    // inbox closed: shutting down
    return;
  }

  try {
    on_event(std::move(msg));
  } catch (const std::exception& e) {
    ++event_errors_;
    logger_->error("Error handling inbound event: {}", e.what());
    retry_timer_.expires_after(opts_.retry_delay);
    retry_timer_.async_wait(boost::beast::bind_front_handler(&StreamAdapter::on_retry,
                                                             shared_from_this()));
    return;
  }

  receive_next();
}

void StreamAdapter::on_retry(boost::system::error_code ec) {
  if (ec || state_ != State::Running) {
    return;
  }

  receive_next();
}
