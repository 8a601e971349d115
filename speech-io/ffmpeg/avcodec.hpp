//
//  avcodec.hpp
//  speech-io
//

#pragma once

#include <cstdint>

extern "C" {
#include <libavcodec/avcodec.h>
}

namespace sio {

namespace ffmpeg {

class Decoder {
 public:
  Decoder(const Decoder&) = delete;
  Decoder& operator=(const Decoder&) = delete;

  explicit Decoder(enum AVCodecID codec_id);

  virtual ~Decoder();

  int open(AVDictionary** opts = nullptr);

  int send_packet(const AVPacket* pkt);

  int receive_frame(AVFrame* frame);

  inline AVCodecContext* ctx() { return ctx_; }

 protected:
  void close();

 private:
  const AVCodec* codec_ = nullptr;
  AVCodecContext* ctx_ = nullptr;
};

// Splits an elementary byte stream (e.g. raw MP3) into packets.
class Parser {
 public:
  Parser(const Parser&) = delete;
  Parser& operator=(const Parser&) = delete;

  explicit Parser(enum AVCodecID codec_id);

  virtual ~Parser();

  // returns bytes consumed from `data`, or a negative AVERROR
  int parse(AVCodecContext* ctx, AVPacket* pkt, const uint8_t* data, int size);

 private:
  AVCodecParserContext* ctx_ = nullptr;
};

} // ffmpeg

} // sio
