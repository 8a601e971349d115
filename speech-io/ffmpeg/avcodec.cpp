//
//  avcodec.cpp
//  speech-io
//

#include <stdexcept>
#include "speech-io/ffmpeg/avcodec.hpp"

using namespace sio::ffmpeg;

Decoder::Decoder(enum AVCodecID codec_id)
{
  if (!(codec_ = avcodec_find_decoder(codec_id))) {
    throw std::runtime_error("Decoder: codec not found");
  }

  if (!(ctx_ = avcodec_alloc_context3(codec_))) {
    throw std::runtime_error("Decoder: error allocating codec context");
  }
}

Decoder::~Decoder() {
  close();
}

int Decoder::open(AVDictionary** opts) {
  return avcodec_open2(ctx_, codec_, opts);
}

int Decoder::send_packet(const AVPacket* pkt) {
  return avcodec_send_packet(ctx_, pkt);
}

int Decoder::receive_frame(AVFrame* frame) {
  return avcodec_receive_frame(ctx_, frame);
}

void Decoder::close() {
  avcodec_free_context(&ctx_);
  codec_ = nullptr;
}

Parser::Parser(enum AVCodecID codec_id)
{
  if (!(ctx_ = av_parser_init(codec_id))) {
    throw std::runtime_error("Parser: parser not found");
  }
}

Parser::~Parser() {
  av_parser_close(ctx_);
}

int Parser::parse(AVCodecContext* ctx, AVPacket* pkt, const uint8_t* data, int size) {
  return av_parser_parse2(ctx_, ctx, &pkt->data, &pkt->size,
                          data, size, AV_NOPTS_VALUE, AV_NOPTS_VALUE, 0);
}
