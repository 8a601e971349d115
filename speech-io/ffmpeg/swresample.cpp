//
//  swresample.cpp
//  speech-io
//

#include <stdexcept>
#include <string>

#include "speech-io/ffmpeg/swresample.hpp"

extern "C" {
#include <libavutil/error.h>
#include <libavutil/mem.h>
#include <libavutil/samplefmt.h>
}

using namespace sio::ffmpeg;

Resampler::Resampler(int in_sample_rate, const AVChannelLayout& in_ch_layout, enum AVSampleFormat in_sample_fmt,
                     int out_sample_rate, const AVChannelLayout& out_ch_layout, enum AVSampleFormat out_sample_fmt)
    : in_sample_rate_(in_sample_rate),
      out_sample_rate_(out_sample_rate),
      in_sample_fmt_(in_sample_fmt),
      out_sample_fmt_(out_sample_fmt)
{
  int rc;
  char err_msg[AV_ERROR_MAX_STRING_SIZE];
  std::string err_str;

  rc = av_channel_layout_copy(&in_ch_layout_, &in_ch_layout);
  if (rc < 0) {
    goto err_exit;
  }

  rc = av_channel_layout_copy(&out_ch_layout_, &out_ch_layout);
  if (rc < 0) {
    goto err_exit;
  }

  rc = swr_alloc_set_opts2(&swr_,
                           &out_ch_layout_, out_sample_fmt_, out_sample_rate_,
                           &in_ch_layout_, in_sample_fmt_, in_sample_rate_,
                           0, nullptr);
  if (rc < 0) {
    goto err_exit;
  }

  rc = swr_init(swr_);
  if (rc < 0) {
    goto err_exit;
  }

  return;

err_exit:
  clean();
  av_strerror(rc, err_msg, sizeof(err_msg));
  err_str.append("Resampler: ").append(err_msg);
  throw std::runtime_error(err_str);
}

Resampler::~Resampler() {
  clean();
}

int Resampler::resample(const uint8_t* const* in_samples_buf, int in_samples, AVAudioFifo* af) {
  int out_samples;
  int rc;

  out_samples = swr_get_out_samples(swr_, in_samples);
  if (out_samples < 0) {
    return out_samples;
  }
  if (out_samples == 0) {
    return 0;
  }

  // grow the scratch buffer, never shrink it
  if (samples_ < out_samples) {
    if (samples_buf_) {
      av_freep(&samples_buf_[0]);
    }
    av_freep(&samples_buf_);
    samples_ = 0;

    rc = av_samples_alloc_array_and_samples(&samples_buf_, nullptr,
                                            out_ch_layout_.nb_channels,
                                            out_samples, out_sample_fmt_,
                                            0);
    if (rc < 0) {
      return rc;
    }
    samples_ = out_samples;
  }

  out_samples = swr_convert(swr_,
                            samples_buf_, samples_,
                            in_samples_buf, in_samples);
  if (out_samples < 0) {
    return out_samples;
  }

  if (out_samples > 0) {
    rc = av_audio_fifo_write(af,
                             reinterpret_cast<void* const*>(samples_buf_),
                             out_samples);
    if (rc < 0) {
      return rc;
    }
  }

  return out_samples;
}

void Resampler::clean() {
  samples_ = 0;
  if (samples_buf_) {
    av_freep(&samples_buf_[0]);
  }
  av_freep(&samples_buf_);
  swr_free(&swr_);
  av_channel_layout_uninit(&out_ch_layout_);
  av_channel_layout_uninit(&in_ch_layout_);
}
