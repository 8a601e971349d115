//
//  main.cpp
//  speech-io
//

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <boost/asio.hpp>
#include "speech-io/speech/synthesizer.hpp"
#include "speech-io/utils/log.hpp"

using std::cerr;
using std::endl;

namespace {

class Demo : public std::enable_shared_from_this<Demo> {
 public:
  Demo(boost::asio::io_context& io,
       std::shared_ptr<sio::speech::Synthesizer> tts,
       std::ofstream& out)
      : tts_(std::move(tts)),
        out_(out),
        timer_(io),
        signals_(io, SIGINT, SIGTERM),
        logger_(sio::utils::get_logger("demo")) { }

  void run(const std::string& text) {
    tts_->start();

    sio::core::Metadata meta;
    meta.request_id = "demo";
    meta.end_of_upstream = true;
    tts_->submit(text, std::move(meta));

    timer_.expires_after(std::chrono::seconds(30));
    timer_.async_wait([self = shared_from_this()](boost::system::error_code ec) {
      if (!ec) {
        self->logger_->error("Timed out waiting for audio");
        self->shutdown();
      }
    });

    signals_.async_wait([self = shared_from_this()](boost::system::error_code ec, int sig) {
      if (!ec) {
        self->logger_->info("Caught signal {}", sig);
        self->shutdown();
      }
    });

    next();
  }

  inline bool completed() const { return completed_; }

 private:
  void next() {
    tts_->async_next([self = shared_from_this()](boost::system::error_code ec,
                                                 sio::core::SpeechResult r) {
      self->on_result(ec, std::move(r));
    });
  }

  void on_result(boost::system::error_code ec, sio::core::SpeechResult r) {
    if (ec) {
      return;
    }

    if (r.meta.end_of_stream) {
      logger_->info("End of stream, {} bytes written", written_);
      completed_ = true;
      shutdown();
      return;
    }

    out_.write(r.data.data(), r.data.size());
    written_ += r.data.size();
    next();
  }

  void shutdown() {
    timer_.cancel();
    signals_.cancel();
    tts_->stop();
  }

  std::shared_ptr<sio::speech::Synthesizer> tts_;
  std::ofstream& out_;
  boost::asio::steady_timer timer_;
  boost::asio::signal_set signals_;
  std::shared_ptr<spdlog::logger> logger_;
  std::size_t written_ = 0;
  bool completed_ = false;
};

} // namespace

int main(int argc, char* argv[]) {
  if (argc != 3) {
    cerr << "Usage: ./speech-io <text> <output>\n";
    exit(EXIT_FAILURE);
  }

  const char* api_key = std::getenv("ELEVENLABS_API_KEY");
  const char* voice_id = std::getenv("ELEVENLABS_VOICE_ID");
  if (!api_key || !voice_id) {
    cerr << "ELEVENLABS_API_KEY and ELEVENLABS_VOICE_ID must be set\n";
    exit(EXIT_FAILURE);
  }

  if (const char* level = std::getenv("SPEECH_IO_LOG_LEVEL")) {
    sio::utils::set_log_level(level);
  }

  std::ofstream out(argv[2], std::ios::binary | std::ios::trunc);
  if (!out) {
    cerr << "Fail to open " << argv[2] << endl;
    exit(EXIT_FAILURE);
  }

  sio::speech::SynthesizerConfig cfg;
  cfg.api_key = api_key;
  cfg.voice_id = voice_id;
  cfg.use_mulaw = true;

  boost::asio::io_context io;
  bool ok = false;

  try {
    auto tts = sio::speech::Synthesizer::create(io, cfg);
    auto demo = std::make_shared<Demo>(io, tts, out);
    demo->run(argv[1]);
    io.run();
    ok = demo->completed();
  } catch (std::exception& e) {
    cerr << "Fatal error: " << e.what() << endl;
    exit(EXIT_FAILURE);
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
