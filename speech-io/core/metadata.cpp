//
//  metadata.cpp
//  speech-io
//

#include "speech-io/core/metadata.hpp"

using namespace sio::core;

namespace {

// keys owned by Metadata, everything else ends up in `extra`
constexpr const char* kRequestId = "request_id";
constexpr const char* kFormat = "format";
constexpr const char* kText = "text";
constexpr const char* kSequenceId = "sequence_id";
constexpr const char* kIsFirstChunk = "is_first_chunk";
constexpr const char* kEndOfUpstream = "end_of_llm_stream";
constexpr const char* kEndOfStream = "end_of_synthesizer_stream";
constexpr const char* kEos = "eos";

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& val) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    val = it->get<T>();
  }
}

} // namespace

Metadata Metadata::from_json(const nlohmann::json& j) {
  Metadata meta;

  if (!j.is_object()) {
    return meta;
  }

  read_field(j, kRequestId, meta.request_id);
  read_field(j, kFormat, meta.format);
  read_field(j, kText, meta.text);
  read_field(j, kSequenceId, meta.sequence_id);
  read_field(j, kIsFirstChunk, meta.is_first_chunk);
  read_field(j, kEndOfUpstream, meta.end_of_upstream);
  read_field(j, kEndOfStream, meta.end_of_stream);
  read_field(j, kEos, meta.eos);

  for (auto it = j.begin(); it != j.end(); ++it) {
    const auto& key = it.key();
    if (key != kRequestId && key != kFormat && key != kText &&
        key != kSequenceId && key != kIsFirstChunk && key != kEndOfUpstream &&
        key != kEndOfStream && key != kEos) {
      meta.extra[key] = it.value();
    }
  }

  return meta;
}

nlohmann::json Metadata::to_json() const {
  nlohmann::json j = extra.is_object() ? extra : nlohmann::json::object();

  j[kRequestId] = request_id;
  j[kFormat] = format;
  if (!text.empty()) {
    j[kText] = text;
  }
  j[kSequenceId] = sequence_id;
  j[kIsFirstChunk] = is_first_chunk;
  j[kEndOfUpstream] = end_of_upstream;
  j[kEndOfStream] = end_of_stream;
  if (eos) {
    j[kEos] = true;
  }

  return j;
}
