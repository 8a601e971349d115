//
//  synthesizer.cpp
//  speech-io
//

#include <stdexcept>
#include <utility>
#include "speech-io/speech/synthesizer.hpp"

using namespace sio::speech;

std::shared_ptr<Synthesizer>
Synthesizer::create(boost::asio::io_context& io, const SynthesizerConfig& cfg, const Options& opts) {
  auto connector = std::make_shared<net::WSSConnector>(io, make_endpoint(cfg));
  std::shared_ptr<core::ResponseCache> cache;
  if (cfg.caching) {
    cache = std::make_shared<core::InMemoryCache>();
  }
  return std::make_shared<Synthesizer>(io.get_executor(), std::move(connector),
                                       make_normalizer(cfg), std::move(cache), cfg, opts);
}

sio::net::WSSEndpoint Synthesizer::make_endpoint(const SynthesizerConfig& cfg) {
  net::WSSEndpoint ep;
  ep.host = ElevenLabsMessage::host;
  ep.port = ElevenLabsMessage::port;
  ep.target = ElevenLabsMessage::make_target(cfg.voice_id, cfg.model,
                                             ElevenLabsMessage::output_format(cfg.use_mulaw));
  ep.greeting.push_back(ElevenLabsMessage::make_bos(cfg.api_key, cfg.voice_settings));
  return ep;
}

std::shared_ptr<AudioNormalizer> Synthesizer::make_normalizer(const SynthesizerConfig& cfg) {
  if (cfg.use_mulaw) {
    return std::make_shared<PassthroughNormalizer>("mulaw");
  }
  return std::make_shared<FFmpegNormalizer>(cfg.sampling_rate);
}

Synthesizer::Synthesizer(executor_type ex,
                         std::shared_ptr<net::Connector> connector,
                         std::shared_ptr<AudioNormalizer> normalizer,
                         std::shared_ptr<core::ResponseCache> cache,
                         const SynthesizerConfig& cfg,
                         const Options& opts)
    : StreamAdapter(std::move(ex), std::move(connector), opts, "synthesizer"),
      cfg_(cfg),
      chunker_(cfg.max_chunk_chars),
      normalizer_(std::move(normalizer)),
      cache_(cfg.caching ? std::move(cache) : nullptr)
{
  if (!normalizer_) {
    throw std::invalid_argument("Synthesizer: null normalizer");
  }
}

Synthesizer::~Synthesizer() { }

void Synthesizer::submit(std::string text, core::Metadata meta) {
  // accounting reflects what was asked for, not what got delivered
  synthesized_characters_ += text.length();

  boost::asio::post(get_executor(),
                    [self = shared_from_base<Synthesizer>(),
                     t = std::move(text), m = std::move(meta)]() mutable {
                      self->on_post_submit(std::move(t), std::move(m));
                    });
}

void Synthesizer::on_post_submit(std::string text, core::Metadata meta) {
  if (is_stopped()) {
    logger_->warn("Ignoring submission '{}', synthesizer is stopped", meta.request_id);
    return;
  }

  meta.text = text;
  meta.format = normalizer_->format();
  meta.sequence_id = ++next_sequence_;
  meta.is_first_chunk = false;
  meta.end_of_stream = false;

  if (meta.end_of_upstream) {
    logger_->info("end_of_llm_stream for '{}'", meta.request_id);
    upstream_finished_ = true;
  }

  if (serve_from_cache(meta)) {
    return;
  }

  std::vector<std::string> frames;
  for (const auto& chunk : chunker_.split(text)) {
    logger_->debug("Sending text chunk: {}", chunk);
    frames.push_back(ElevenLabsMessage::make_text(chunk));
  }
  // always flush, otherwise short inputs never come back
  frames.push_back(ElevenLabsMessage::make_flush());

  // metadata first: no reply can be seen before its record exists
  enqueue_unit(std::move(meta));
  dispatch(std::move(frames));
}

bool Synthesizer::serve_from_cache(const core::Metadata& meta) {
  if (!cache_ || meta.text.empty() || !idle()) {
    return false;
  }

  auto audio = cache_->get(cache_key(meta.text));
  if (!audio) {
    return false;
  }

  ++cache_hits_;
  logger_->info("Serving '{}' from cache", meta.request_id);

  activate(meta);
  unit_audio_.clear();
  emit_chunk(*audio);
  emit_end_marker();
  return true;
}

void Synthesizer::on_event(std::string&& msg) {
  auto resp = ElevenLabsMessage::parse(msg);
  logger_->debug("Response isFinal: {}", resp.is_final);

  if (!resp.audio) {
    logger_->debug("No audio data in the response");
    return;
  }

  // the audio frame and the marker following it belong to the same unit
  if (advance_unit()) {
    unit_audio_.clear();
  }

  emit_chunk(*resp.audio);

  if (resp.is_final) {
    emit_end_marker();
  }
}

void Synthesizer::emit_chunk(std::string_view audio) {
  if (cache_) {
    unit_audio_.append(audio);
  }

  active().format = normalizer_->format();
  emit(core::ResultType::Audio, normalizer_->normalize(audio), false);
}

void Synthesizer::emit_end_marker() {
  logger_->info("Received end of stream for '{}'", active().request_id);

  active().format = normalizer_->format();
  emit(core::ResultType::Audio, normalizer_->normalize_marker(std::string(1, end_marker)), true);

  if (cache_ && !active().text.empty() && !unit_audio_.empty()) {
    cache_->set(cache_key(active().text), std::move(unit_audio_));
  }
  unit_audio_.clear();

  if (active().end_of_upstream) {
    upstream_finished_ = false;
  }
}

std::string Synthesizer::cache_key(const std::string& text) const {
  return core::make_cache_key(text, cfg_.voice_id, cfg_.model, normalizer_->format());
}
