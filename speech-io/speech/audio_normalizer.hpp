//
//  audio_normalizer.hpp
//  speech-io
//

#pragma once

#include <memory>
#include <string>
#include <string_view>

extern "C" {
#include <libavcodec/codec_id.h>
}

namespace sio {

namespace speech {

// Converts audio produced by the service into what the caller asked for.
// Implementations keep no state between calls.
class AudioNormalizer {
 public:
  virtual ~AudioNormalizer() = default;

  // value for Metadata::format on every result this normalizer produced
  virtual const std::string& format() const = 0;

  virtual std::string normalize(std::string_view chunk) const = 0;

  // The end-of-unit marker carries no audio, but callers still expect it in
  // the same container as the chunks before it.
  virtual std::string normalize_marker(std::string_view marker) const = 0;
};

class PassthroughNormalizer : public AudioNormalizer {
 public:
  explicit PassthroughNormalizer(std::string format) : format_(std::move(format)) { }

  virtual ~PassthroughNormalizer() = default;

  virtual const std::string& format() const override { return format_; }

  virtual std::string normalize(std::string_view chunk) const override {
    return std::string(chunk);
  }

  virtual std::string normalize_marker(std::string_view marker) const override {
    return std::string(marker);
  }

 private:
  std::string format_;
};

// Decodes a compressed elementary stream (MP3 by default), resamples it to
// signed 16-bit mono at `sample_rate` and wraps the result in a WAV
// container.
class FFmpegNormalizer : public AudioNormalizer {
 public:
  explicit FFmpegNormalizer(int sample_rate, enum AVCodecID source_codec = AV_CODEC_ID_MP3);

  virtual ~FFmpegNormalizer() = default;

  virtual const std::string& format() const override { return format_; }

  // throws std::runtime_error when the chunk cannot be decoded
  virtual std::string normalize(std::string_view chunk) const override;

  virtual std::string normalize_marker(std::string_view marker) const override;

  inline int sample_rate() const { return sample_rate_; }

 private:
  std::string decode(std::string_view chunk) const;

  std::string wrap_wav(const std::string& pcm) const;

  int sample_rate_;
  enum AVCodecID source_codec_;
  std::string format_ = "wav";
};

} // speech

} // sio
