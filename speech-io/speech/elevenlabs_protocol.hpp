//
//  elevenlabs_protocol.hpp
//  speech-io
//

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sio {

namespace speech {

// Frames of the ElevenLabs `stream-input` WebSocket API.
struct ElevenLabsMessage {
  static constexpr const char* host = "api.elevenlabs.io";
  static constexpr const char* port = "443";
  static constexpr const char* default_model = "eleven_turbo_v2_5";
  static constexpr int inactivity_timeout = 60;

  struct VoiceSettings {
    double stability = 0.5;
    double similarity_boost = 0.8;
  };

  // mulaw is only offered at 8 kHz, everything else comes back as MP3
  static std::string output_format(bool use_mulaw);

  static std::string make_target(std::string_view voice_id, std::string_view model,
                                 std::string_view output_format);

  // beginning-of-stream frame, first thing on every new connection
  static std::string make_bos(std::string_view api_key, const VoiceSettings& settings);

  static std::string make_text(std::string_view text);

  // asks the service to synthesize whatever it still buffers
  static std::string make_flush();

  // throws std::runtime_error / nlohmann::json::exception on bad frames
  static ElevenLabsMessage parse(std::string_view frame);

  std::optional<std::string> audio;
  bool is_final = false;
};

} // speech

} // sio
