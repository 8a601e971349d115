//
//  synthesizer.hpp
//  speech-io
//

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include "speech-io/core/cache.hpp"
#include "speech-io/net/wss_connector.hpp"
#include "speech-io/speech/audio_normalizer.hpp"
#include "speech-io/speech/elevenlabs_protocol.hpp"
#include "speech-io/speech/stream_adapter.hpp"
#include "speech-io/speech/text_chunker.hpp"

namespace sio {

namespace speech {

struct SynthesizerConfig {
  std::string api_key;
  std::string voice_id;
  std::string model = ElevenLabsMessage::default_model;
  // output rate for wav results; mulaw is always 8 kHz
  int sampling_rate = 16000;
  bool use_mulaw = false;
  ElevenLabsMessage::VoiceSettings voice_settings;
  std::size_t max_chunk_chars = TextChunker::default_max_chars;
  bool caching = true;
};

// Streaming text-to-speech over one long-lived WebSocket.
//
// Every submit() is one logical unit: its text goes out in chunks followed by
// a flush frame, and the audio coming back is tagged with the unit's
// metadata. A frame marked final is followed by an end-of-stream result
// carrying a single null byte marker (wrapped in the output container).
class Synthesizer : public StreamAdapter {
 public:
  static constexpr char end_marker = '\0';

  // wires the ElevenLabs endpoint, FFmpeg/passthrough normalizer and an
  // in-memory cache
  static std::shared_ptr<Synthesizer>
  create(boost::asio::io_context& io, const SynthesizerConfig& cfg, const Options& opts = {});

  static net::WSSEndpoint make_endpoint(const SynthesizerConfig& cfg);

  static std::shared_ptr<AudioNormalizer> make_normalizer(const SynthesizerConfig& cfg);

  Synthesizer(executor_type ex,
              std::shared_ptr<net::Connector> connector,
              std::shared_ptr<AudioNormalizer> normalizer,
              std::shared_ptr<core::ResponseCache> cache,
              const SynthesizerConfig& cfg,
              const Options& opts = {});

  virtual ~Synthesizer();

  // fire-and-forget; safe from any thread
  void submit(std::string text, core::Metadata meta);

  inline uint64_t synthesized_characters() const { return synthesized_characters_; }

  inline const std::string& engine() const { return cfg_.model; }

  inline const std::string& format() const { return normalizer_->format(); }

  // strand state: an end_of_upstream unit was submitted and has not finished
  inline bool upstream_finished() const { return upstream_finished_; }

  inline uint64_t cache_hits() const { return cache_hits_; }

 protected:
  virtual void on_event(std::string&& msg) override;

 private:
  void on_post_submit(std::string text, core::Metadata meta);

  bool serve_from_cache(const core::Metadata& meta);

  void emit_chunk(std::string_view audio);

  void emit_end_marker();

  std::string cache_key(const std::string& text) const;

  SynthesizerConfig cfg_;
  TextChunker chunker_;
  std::shared_ptr<AudioNormalizer> normalizer_;
  std::shared_ptr<core::ResponseCache> cache_;
  std::atomic<uint64_t> synthesized_characters_{0};
  std::string unit_audio_;
  uint64_t next_sequence_ = 0;
  uint64_t cache_hits_ = 0;
  bool upstream_finished_ = false;
};

} // speech

} // sio
