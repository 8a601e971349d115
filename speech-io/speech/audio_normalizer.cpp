//
//  audio_normalizer.cpp
//  speech-io
//

#include <cstring>
#include <stdexcept>
#include "speech-io/ffmpeg/avcodec.hpp"
#include "speech-io/ffmpeg/avformat.hpp"
#include "speech-io/ffmpeg/ffmpeg_helper.hpp"
#include "speech-io/ffmpeg/swresample.hpp"
#include "speech-io/speech/audio_normalizer.hpp"

using namespace sio::speech;
using namespace sio::ffmpeg;

namespace {

constexpr int kBytesPerSample = 2; // s16 mono

[[noreturn]] void throw_av_error(const char* what, int rc) {
  throw std::runtime_error(std::string("FFmpegNormalizer: ") + what + ": " + error_string(rc));
}

} // namespace

FFmpegNormalizer::FFmpegNormalizer(int sample_rate, enum AVCodecID source_codec)
    : sample_rate_(sample_rate),
      source_codec_(source_codec)
{
  if (sample_rate_ <= 0) {
    throw std::invalid_argument("FFmpegNormalizer: invalid sample rate");
  }
}

std::string FFmpegNormalizer::normalize(std::string_view chunk) const {
  return wrap_wav(decode(chunk));
}

std::string FFmpegNormalizer::normalize_marker(std::string_view marker) const {
  // one silent sample, so the marker is still a well formed WAV
  std::string pcm(marker);
  pcm.resize(kBytesPerSample, '\0');
  return wrap_wav(pcm);
}

std::string FFmpegNormalizer::decode(std::string_view chunk) const {
  Decoder decoder(source_codec_);
  Parser parser(source_codec_);
  ChannelLayoutHelper mono(1);
  int rc = 0;

  rc = decoder.open();
  if (rc < 0) {
    throw_av_error("error opening decoder", rc);
  }

  packet_ptr pkt(av_packet_alloc(), &pkt_deleter);
  frame_ptr frame(av_frame_alloc(), &frame_deleter);
  fifo_ptr fifo(av_audio_fifo_alloc(AV_SAMPLE_FMT_S16, 1, sample_rate_), &av_audio_fifo_free);
  if (!pkt || !frame || !fifo) {
    throw std::runtime_error("FFmpegNormalizer: Cannot allocate memory");
  }

  std::unique_ptr<Resampler> resampler;

  // pull every frame the decoder has ready through the resampler
  auto drain = [&]() {
    for (;;) {
      rc = decoder.receive_frame(frame.get());
      if (rc == AVERROR(EAGAIN) || rc == AVERROR_EOF) {
        return;
      } else if (rc < 0) {
        throw_av_error("error decoding", rc);
      }

      if (!resampler) {
        resampler = std::make_unique<Resampler>(frame->sample_rate, frame->ch_layout,
                                                static_cast<AVSampleFormat>(frame->format),
                                                sample_rate_, mono.get(), AV_SAMPLE_FMT_S16);
      }

      rc = resampler->resample(frame->extended_data, frame->nb_samples, fifo.get());
      av_frame_unref(frame.get());
      if (rc < 0) {
        throw_av_error("error resampling", rc);
      }
    }
  };

  auto submit = [&]() {
    if (pkt->size > 0) {
      rc = decoder.send_packet(pkt.get());
      if (rc < 0 && rc != AVERROR_INVALIDDATA) {
        throw_av_error("error sending packet", rc);
      }
      drain();
    }
  };

  // the parser reads past the end, hence the padding
  std::string input(chunk);
  input.append(AV_INPUT_BUFFER_PADDING_SIZE, '\0');

  auto data = reinterpret_cast<const uint8_t*>(input.data());
  auto size = static_cast<int>(chunk.size());

  while (size > 0) {
    rc = parser.parse(decoder.ctx(), pkt.get(), data, size);
    if (rc < 0) {
      throw_av_error("error parsing", rc);
    }
    data += rc;
    size -= rc;
    submit();
  }

  // flush parser, then decoder
  rc = parser.parse(decoder.ctx(), pkt.get(), nullptr, 0);
  if (rc >= 0) {
    submit();
  }

  rc = decoder.send_packet(nullptr);
  if (rc < 0 && rc != AVERROR_EOF) {
    throw_av_error("error flushing decoder", rc);
  }
  drain();

  if (resampler) {
    rc = resampler->flush(fifo.get());
    if (rc < 0) {
      throw_av_error("error flushing resampler", rc);
    }
  }

  int nb_samples = av_audio_fifo_size(fifo.get());
  std::string pcm(static_cast<std::size_t>(nb_samples) * kBytesPerSample, '\0');
  if (nb_samples > 0) {
    uint8_t* planes[1] = {reinterpret_cast<uint8_t*>(pcm.data())};
    rc = av_audio_fifo_read(fifo.get(), reinterpret_cast<void* const*>(planes), nb_samples);
    if (rc < 0) {
      throw_av_error("error reading samples", rc);
    }
    pcm.resize(static_cast<std::size_t>(rc) * kBytesPerSample);
  }

  return pcm;
}

std::string FFmpegNormalizer::wrap_wav(const std::string& pcm) const {
  MemoryMuxer muxer;
  int rc = 0;

  rc = muxer.open("wav");
  if (rc < 0) {
    throw_av_error("error opening muxer", rc);
  }

  AVStream* st = muxer.new_stream();
  if (!st) {
    throw std::runtime_error("FFmpegNormalizer: error creating stream");
  }

  AVCodecParameters* par = st->codecpar;
  par->codec_type = AVMEDIA_TYPE_AUDIO;
  par->codec_id = AV_CODEC_ID_PCM_S16LE;
  par->format = AV_SAMPLE_FMT_S16;
  par->sample_rate = sample_rate_;
  par->bits_per_coded_sample = 16;
  par->block_align = kBytesPerSample;
  par->bit_rate = static_cast<int64_t>(sample_rate_) * 16;
  av_channel_layout_default(&par->ch_layout, 1);
  st->time_base = av_make_q(1, sample_rate_);

  rc = muxer.write_header();
  if (rc < 0) {
    throw_av_error("error writing header", rc);
  }

  if (!pcm.empty()) {
    packet_ptr pkt(av_packet_alloc(), &pkt_deleter);
    if (!pkt) {
      throw std::runtime_error("FFmpegNormalizer: Cannot allocate memory");
    }

    rc = av_new_packet(pkt.get(), static_cast<int>(pcm.size()));
    if (rc < 0) {
      throw_av_error("error allocating packet", rc);
    }
    std::memcpy(pkt->data, pcm.data(), pcm.size());
    pkt->pts = pkt->dts = 0;
    pkt->duration = static_cast<int64_t>(pcm.size() / kBytesPerSample);
    pkt->stream_index = st->index;

    rc = muxer.write_frame(pkt.get());
    if (rc < 0) {
      throw_av_error("error writing frame", rc);
    }
  }

  std::string out;
  rc = muxer.finish(out);
  if (rc < 0) {
    throw_av_error("error finishing container", rc);
  }

  return out;
}
