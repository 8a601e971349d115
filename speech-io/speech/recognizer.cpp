//
//  recognizer.cpp
//  speech-io
//

#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>
#include "speech-io/speech/recognizer.hpp"
#include "speech-io/utils/log.hpp"

using namespace sio::speech;

namespace {

class RecognizerConnection : public sio::net::Connection {
 public:
  explicit RecognizerConnection(std::unique_ptr<Recognizer> recognizer)
      : recognizer_(std::move(recognizer)) { }

  virtual ~RecognizerConnection() {
    close();
  }

  virtual void send(std::string_view msg) override {
    if (!closed_) {
      recognizer_->write(msg);
    }
  }

  virtual void close() override {
    if (!closed_.exchange(true)) {
      try {
        recognizer_->stop();
      } catch (const std::exception& e) {
        sio::utils::get_logger("recognizer")->error("Error stopping recognition: {}", e.what());
      }
    }
  }

  virtual bool is_alive() const override {
    return !closed_ && recognizer_->is_active();
  }

 private:
  std::unique_ptr<Recognizer> recognizer_;
  std::atomic<bool> closed_{false};
};

} // namespace

AudioStreamFormat AudioStreamFormat::for_provider(std::string_view provider) {
  AudioStreamFormat fmt;

  if (provider == "twilio") {
    fmt.encoding = "mulaw";
    fmt.bits_per_sample = 8;
  } else if (provider == "web_based_call") {
    fmt.sampling_rate = 16000;
  }

  return fmt;
}

const char* RecognitionEvent::type_name(Type type) {
  switch (type) {
    case Recognizing:
      return "recognizing";
    case Recognized:
      return "recognized";
    case Canceled:
      return "canceled";
    case SessionStarted:
      return "session_started";
    case SessionStopped:
      return "session_stopped";
  }
  return "unknown";
}

RecognitionEvent RecognitionEvent::parse(std::string_view frame) {
  static const Type types[] = {Recognizing, Recognized, Canceled, SessionStarted, SessionStopped};

  auto j = nlohmann::json::parse(frame);
  auto name = j.at("event").get<std::string>();

  RecognitionEvent ev;
  bool found = false;
  for (auto type : types) {
    if (name == type_name(type)) {
      ev.type = type;
      found = true;
      break;
    }
  }
  if (!found) {
    throw std::runtime_error("Unexpected recognizer event: " + name);
  }

  ev.text = j.value("text", "");
  ev.session_id = j.value("session_id", "");
  ev.reason = j.value("reason", "");

  return ev;
}

std::string RecognitionEvent::dump() const {
  nlohmann::json j;
  j["event"] = type_name(type);
  j["text"] = text;
  j["session_id"] = session_id;
  if (!reason.empty()) {
    j["reason"] = reason;
  }
  return j.dump();
}

RecognizerConnector::RecognizerConnector(RecognizerFactory factory, AudioStreamFormat fmt,
                                         std::string language)
    : factory_(std::move(factory)),
      fmt_(std::move(fmt)),
      language_(std::move(language)),
      logger_(sio::utils::get_logger("recognizer"))
{
  if (!factory_) {
    throw std::invalid_argument("RecognizerConnector: null factory");
  }
}

void RecognizerConnector::async_connect(message_callback on_message, ready_callback on_ready) {
  std::shared_ptr<RecognizerConnection> conn;

  try {
    auto recognizer = factory_(fmt_, language_);
    if (!recognizer) {
      throw std::runtime_error("factory returned no recognizer");
    }

    // events may arrive from SDK threads; on_message is safe for that
    recognizer->start([cb = std::move(on_message)](const RecognitionEvent& ev) {
      cb(ev.dump());
    });

    conn = std::make_shared<RecognizerConnection>(std::move(recognizer));
    logger_->info("Speech recognition started ({} {} Hz, {})",
                  fmt_.encoding, fmt_.sampling_rate, language_);
  } catch (const std::exception& e) {
    logger_->error("Error starting speech recognition: {}", e.what());
    conn.reset();
  }

  on_ready(std::move(conn));
}
