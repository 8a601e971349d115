//
//  ffmpeg_helper.hpp
//  speech-io
//

#pragma once

#include <memory>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
}

namespace sio {

namespace ffmpeg {

inline void frame_deleter(AVFrame* frame) { av_frame_free(&frame); }

inline void pkt_deleter(AVPacket* pkt) { av_packet_free(&pkt); }

using frame_ptr = std::unique_ptr<AVFrame, decltype(&frame_deleter)>;
using packet_ptr = std::unique_ptr<AVPacket, decltype(&pkt_deleter)>;
using fifo_ptr = std::unique_ptr<AVAudioFifo, decltype(&av_audio_fifo_free)>;

struct ChannelLayoutHelper {
  ChannelLayoutHelper(int ac = 1) {
    av_channel_layout_default(&layout_, ac);
  }

  ~ChannelLayoutHelper() {
    av_channel_layout_uninit(&layout_);
  }

  inline const AVChannelLayout& get() const { return layout_; }

  AVChannelLayout layout_{};
};

inline std::string error_string(int errnum) {
  char err_msg[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(errnum, err_msg, sizeof(err_msg));
  return err_msg;
}

} // ffmpeg

} // sio
