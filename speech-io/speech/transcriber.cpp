//
//  transcriber.cpp
//  speech-io
//

#include <utility>
#include <vector>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include "speech-io/speech/transcriber.hpp"

using namespace sio::speech;

std::shared_ptr<Transcriber>
Transcriber::create(boost::asio::io_context& io, RecognizerFactory factory,
                    const TranscriberConfig& cfg, const Options& opts) {
  auto connector = std::make_shared<RecognizerConnector>(
      std::move(factory), AudioStreamFormat::for_provider(cfg.telephony_provider), cfg.language);
  return std::make_shared<Transcriber>(io.get_executor(), std::move(connector), cfg, opts);
}

Transcriber::Transcriber(executor_type ex, std::shared_ptr<net::Connector> connector,
                         const TranscriberConfig& cfg, const Options& opts)
    : StreamAdapter(std::move(ex), std::move(connector), opts, "transcriber"),
      cfg_(cfg),
      fmt_(AudioStreamFormat::for_provider(cfg.telephony_provider))
{
}

Transcriber::~Transcriber() { }

std::string Transcriber::generate_request_id() {
  static thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

void Transcriber::submit(std::string audio, core::Metadata meta) {
  submitted_bytes_ += audio.size();

  boost::asio::post(get_executor(),
                    [self = shared_from_base<Transcriber>(),
                     a = std::move(audio), m = std::move(meta)]() mutable {
                      self->on_post_submit(std::move(a), std::move(m));
                    });
}

std::optional<sio::core::Metadata> Transcriber::meta_info() const {
  return meta_info_;
}

void Transcriber::on_post_submit(std::string audio, core::Metadata meta) {
  if (is_stopped()) {
    logger_->warn("Ignoring audio, transcriber is stopped");
    return;
  }

  if (!audio_submitted_) {
    audio_submitted_ = true;
    submission_time_ = std::chrono::steady_clock::now();

    core::Metadata unit = meta;
    unit.request_id = generate_request_id();
    unit.format = fmt_.encoding;
    unit.sequence_id = ++next_sequence_;
    unit.eos = false;
    meta_info_ = unit;

    logger_->info("New conversation '{}' from {}", unit.request_id, cfg_.telephony_provider);
    enqueue_unit(std::move(unit));
    session_open_ = true;
  }

  if (meta.eos) {
    logger_->info("End of stream detected");
    stop();
    return;
  }

  if (meta.end_of_upstream) {
    audio_submitted_ = false;
  }

  if (!audio.empty()) {
    std::vector<std::string> frames;
    frames.push_back(std::move(audio));
    dispatch(std::move(frames));
  }
}

void Transcriber::on_event(std::string&& msg) {
  auto ev = RecognitionEvent::parse(msg);

  switch (ev.type) {
    case RecognitionEvent::Recognizing:
      logger_->debug("Intermediate results: {}", ev.text);
      emit_transcript(core::ResultType::InterimTranscript, ev.text);
      break;

    case RecognitionEvent::Recognized:
      logger_->info("Final transcript: {}", ev.text);
      emit_transcript(core::ResultType::Transcript, ev.text);
      break;

    case RecognitionEvent::Canceled:
      logger_->info("Canceled event received: {}", ev.reason);
      break;

    case RecognitionEvent::SessionStarted:
      logger_->info("Session start event received: {}", ev.session_id);
      break;

    case RecognitionEvent::SessionStopped:
      logger_->info("Session stop event received: {}", ev.session_id);
      emit_session_closed();
      break;
  }
}

void Transcriber::on_stop() {
  if (session_open_) {
    logger_->info("Closing recognition session");
    emit_session_closed();
  }
}

void Transcriber::emit_session_closed() {
  advance_unit();

  auto elapsed = std::chrono::steady_clock::now() - submission_time_;
  logger_->debug("Session lasted {} ms since first audio",
                 std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

  session_open_ = false;
  emit(core::ResultType::ConnectionClosed, core::to_string(core::ResultType::ConnectionClosed), true);
}

void Transcriber::emit_transcript(core::ResultType type, const std::string& text) {
  advance_unit();

  nlohmann::json data;
  data["type"] = core::to_string(type);
  data["content"] = text;
  emit(type, data.dump(), false);
}
