//
//  swresample.hpp
//  speech-io
//

#pragma once

extern "C" {
#include <libavutil/audio_fifo.h>
#include <libswresample/swresample.h>
}

namespace sio {

namespace ffmpeg {

// Sample rate/format/layout converter writing into an AVAudioFifo. Owns one
// scratch buffer that grows to the largest conversion seen.
class Resampler {
 public:
  Resampler(const Resampler&) = delete;
  Resampler& operator=(const Resampler&) = delete;

  explicit Resampler(int in_sample_rate, const AVChannelLayout& in_ch_layout, enum AVSampleFormat in_sample_fmt,
                     int out_sample_rate, const AVChannelLayout& out_ch_layout, enum AVSampleFormat out_sample_fmt);

  ~Resampler();

  // converted samples are appended to `af`; returns samples written or AVERROR
  int resample(const uint8_t* const* in_samples_buf, int in_samples, AVAudioFifo* af);

  // drains what swr still buffers
  inline int flush(AVAudioFifo* af) { return resample(nullptr, 0, af); }

  inline int in_sample_rate() const { return in_sample_rate_; }

  inline int out_sample_rate() const { return out_sample_rate_; }

 private:
  void clean();

  int in_sample_rate_;
  int out_sample_rate_;
  enum AVSampleFormat in_sample_fmt_;
  enum AVSampleFormat out_sample_fmt_;
  AVChannelLayout in_ch_layout_{};
  AVChannelLayout out_ch_layout_{};
  struct SwrContext* swr_ = nullptr;
  uint8_t** samples_buf_ = nullptr;
  int samples_ = 0;
};

} // ffmpeg

} // sio
