//
//  transcriber.hpp
//  speech-io
//

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "speech-io/speech/recognizer.hpp"
#include "speech-io/speech/stream_adapter.hpp"

namespace sio {

namespace speech {

struct TranscriberConfig {
  // twilio, exotel, plivo, web_based_call
  std::string telephony_provider;
  std::string language = "en-IN";
};

// Streaming speech-to-text on top of a push-stream recognizer.
//
// The first frame of a conversation opens a logical unit (and gets a fresh
// request id); interim and final transcripts are tagged with it. A frame
// with `end_of_upstream` closes the conversation on the submission side, a
// frame with `eos` shuts the transcriber down.
class Transcriber : public StreamAdapter {
 public:
  static std::shared_ptr<Transcriber>
  create(boost::asio::io_context& io, RecognizerFactory factory,
         const TranscriberConfig& cfg, const Options& opts = {});

  Transcriber(executor_type ex, std::shared_ptr<net::Connector> connector,
              const TranscriberConfig& cfg, const Options& opts = {});

  virtual ~Transcriber();

  // fire-and-forget; safe from any thread
  void submit(std::string audio, core::Metadata meta);

  inline uint64_t submitted_bytes() const { return submitted_bytes_; }

  inline const AudioStreamFormat& audio_format() const { return fmt_; }

  // strand state: metadata of the conversation in progress
  std::optional<core::Metadata> meta_info() const;

  static std::string generate_request_id();

 protected:
  virtual void on_event(std::string&& msg) override;

  // reports the session as closed; the recognizer's own event comes too late
  virtual void on_stop() override;

 private:
  void on_post_submit(std::string audio, core::Metadata meta);

  void emit_transcript(core::ResultType type, const std::string& text);

  void emit_session_closed();

  TranscriberConfig cfg_;
  AudioStreamFormat fmt_;
  std::atomic<uint64_t> submitted_bytes_{0};
  std::optional<core::Metadata> meta_info_;
  std::chrono::steady_clock::time_point submission_time_;
  uint64_t next_sequence_ = 0;
  bool audio_submitted_ = false;
  bool session_open_ = false;
};

} // speech

} // sio
