//
//  avformat.hpp
//  speech-io
//

#pragma once

#include <string>

extern "C" {
#include <libavformat/avformat.h>
}

namespace sio {

namespace ffmpeg {

// Muxes into a growable memory buffer instead of a file or URL.
class MemoryMuxer {
 public:
  MemoryMuxer(const MemoryMuxer&) = delete;
  MemoryMuxer& operator=(const MemoryMuxer&) = delete;

  MemoryMuxer() = default;

  virtual ~MemoryMuxer();

  int open(const char* fmt_name);

  AVStream* new_stream();

  int write_header(AVDictionary** opts = nullptr);

  int write_frame(AVPacket* pkt);

  // writes the trailer and hands over everything muxed so far
  int finish(std::string& out);

 protected:
  void close();

 private:
  AVFormatContext* ctx_ = nullptr;
  bool need_trailer_ = false;
};

} // ffmpeg

} // sio
