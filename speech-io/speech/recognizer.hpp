//
//  recognizer.hpp
//  speech-io
//

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>
#include "speech-io/net/connection.hpp"

namespace sio {

namespace speech {

// Shape of the audio pushed into a recognizer.
struct AudioStreamFormat {
  std::string encoding = "linear16";
  int sampling_rate = 8000;
  int bits_per_sample = 16;
  int channels = 1;

  // twilio sends 8 kHz mulaw, exotel/plivo 8 kHz linear16, browsers 16 kHz
  static AudioStreamFormat for_provider(std::string_view provider);
};

struct RecognitionEvent {
  enum Type {
    Recognizing = 0,
    Recognized,
    Canceled,
    SessionStarted,
    SessionStopped,
  };

  static const char* type_name(Type type);

  // throws on malformed input
  static RecognitionEvent parse(std::string_view frame);

  std::string dump() const;

  Type type = Recognizing;
  std::string text;
  std::string session_id;
  std::string reason;
};

// Push-stream speech recognizer, typically a vendor SDK. Its callbacks may
// fire on threads the caller does not control.
class Recognizer {
 public:
  using event_callback = std::function<void(const RecognitionEvent&)>;

  virtual ~Recognizer() = default;

  // Starts continuous recognition; blocks until the session is up.
  // Throws on failure.
  virtual void start(event_callback cb) = 0;

  virtual void write(std::string_view audio) = 0;

  // closes the push stream and stops recognition
  virtual void stop() = 0;

  virtual bool is_active() const = 0;
};

using RecognizerFactory =
    std::function<std::unique_ptr<Recognizer>(const AudioStreamFormat& fmt, const std::string& language)>;

// Presents a recognizer session as a net::Connection: audio frames are
// written to the push stream and recognizer callbacks come back as JSON
// frames (see RecognitionEvent::dump), from whatever thread raised them.
class RecognizerConnector : public net::Connector {
 public:
  RecognizerConnector(RecognizerFactory factory, AudioStreamFormat fmt, std::string language);

  virtual ~RecognizerConnector() = default;

  virtual void async_connect(message_callback on_message, ready_callback on_ready) override;

 private:
  RecognizerFactory factory_;
  AudioStreamFormat fmt_;
  std::string language_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // speech

} // sio
