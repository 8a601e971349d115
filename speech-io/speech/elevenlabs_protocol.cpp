//
//  elevenlabs_protocol.cpp
//  speech-io
//

#include <stdexcept>
#include <boost/beast/core/detail/base64.hpp>
#include <nlohmann/json.hpp>
#include "speech-io/speech/elevenlabs_protocol.hpp"

using namespace sio::speech;

namespace {

std::string base64_decode(std::string_view in) {
  namespace base64 = boost::beast::detail::base64;

  // decode() stops at the padding, anything else left over is garbage
  auto body = in.substr(0, in.find_last_not_of('=') + 1);

  std::string out;
  out.resize(base64::decoded_size(in.size()));
  auto [written, read] = base64::decode(out.data(), body.data(), body.size());
  if (read != body.size()) {
    throw std::runtime_error("Malformed message: bad base64 audio");
  }
  out.resize(written);
  return out;
}

} // namespace

std::string ElevenLabsMessage::output_format(bool use_mulaw) {
  return use_mulaw ? "ulaw_8000" : "mp3_44100_128";
}

std::string ElevenLabsMessage::make_target(std::string_view voice_id, std::string_view model,
                                           std::string_view output_format) {
  std::string target;
  target.append("/v1/text-to-speech/").append(voice_id)
        .append("/stream-input?model_id=").append(model)
        .append("&output_format=").append(output_format)
        .append("&inactivity_timeout=").append(std::to_string(inactivity_timeout));
  return target;
}

std::string ElevenLabsMessage::make_bos(std::string_view api_key, const VoiceSettings& settings) {
  nlohmann::json root;
  root["text"] = " ";
  root["voice_settings"]["stability"] = settings.stability;
  root["voice_settings"]["similarity_boost"] = settings.similarity_boost;
  root["xi_api_key"] = api_key;
  return root.dump();
}

std::string ElevenLabsMessage::make_text(std::string_view text) {
  nlohmann::json root;
  root["text"] = text;
  return root.dump();
}

std::string ElevenLabsMessage::make_flush() {
  nlohmann::json root;
  root["text"] = "";
  root["flush"] = true;
  return root.dump();
}

ElevenLabsMessage ElevenLabsMessage::parse(std::string_view frame) {
  ElevenLabsMessage msg;

  auto j = nlohmann::json::parse(frame);
  if (!j.is_object()) {
    throw std::runtime_error("Malformed message: not a JSON object");
  }

  auto it = j.find("audio");
  if (it != j.end() && it->is_string()) {
    const auto& encoded = it->get_ref<const std::string&>();
    if (!encoded.empty()) {
      msg.audio = base64_decode(encoded);
    }
  }

  it = j.find("isFinal");
  if (it != j.end() && it->is_boolean()) {
    msg.is_final = it->get<bool>();
  }

  return msg;
}
