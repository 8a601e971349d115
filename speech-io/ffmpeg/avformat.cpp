//
//  avformat.cpp
//  speech-io
//

#include "speech-io/ffmpeg/avformat.hpp"

using namespace sio::ffmpeg;

MemoryMuxer::~MemoryMuxer() {
  close();
}

int MemoryMuxer::open(const char* fmt_name) {
  int rc = 0;

  if (ctx_) {
    return AVERROR(EINVAL);
  }

  rc = avformat_alloc_output_context2(&ctx_, nullptr, fmt_name, nullptr);
  if (rc < 0) {
    return rc;
  }

  rc = avio_open_dyn_buf(&ctx_->pb);
  if (rc < 0) {
    avformat_free_context(ctx_);
    ctx_ = nullptr;
    return rc;
  }

  return 0;
}

AVStream* MemoryMuxer::new_stream() {
  return avformat_new_stream(ctx_, nullptr);
}

int MemoryMuxer::write_header(AVDictionary** opts) {
  int rc = avformat_write_header(ctx_, opts);
  if (rc >= 0) {
    need_trailer_ = true;
  }
  return rc;
}

int MemoryMuxer::write_frame(AVPacket* pkt) {
  return av_write_frame(ctx_, pkt);
}

int MemoryMuxer::finish(std::string& out) {
  int rc = 0;

  if (!ctx_ || !ctx_->pb) {
    return AVERROR(EINVAL);
  }

  if (need_trailer_) {
    rc = av_write_trailer(ctx_);
    need_trailer_ = false;
    if (rc < 0) {
      return rc;
    }
  }

  uint8_t* buf = nullptr;
  int size = avio_close_dyn_buf(ctx_->pb, &buf);
  ctx_->pb = nullptr;

  if (buf && size > 0) {
    out.assign(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(size));
  } else {
    out.clear();
  }
  av_free(buf);

  return 0;
}

void MemoryMuxer::close() {
  if (ctx_) {
    if (ctx_->pb) {
      if (need_trailer_) {
        av_write_trailer(ctx_);
        need_trailer_ = false;
      }
      uint8_t* buf = nullptr;
      avio_close_dyn_buf(ctx_->pb, &buf);
      av_free(buf);
      ctx_->pb = nullptr;
    }
    avformat_free_context(ctx_);
    ctx_ = nullptr;
  }
}
