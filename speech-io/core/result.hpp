//
//  result.hpp
//  speech-io
//

#pragma once

#include <string>
#include "speech-io/core/metadata.hpp"

namespace sio {

namespace core {

enum class ResultType {
  Audio = 0,
  InterimTranscript,
  Transcript,
  ConnectionClosed,
};

const char* to_string(ResultType type);

// One item of the adapter's output sequence. `meta` is a snapshot of the
// unit's metadata at emission time.
struct SpeechResult {
  ResultType type = ResultType::Audio;
  std::string data;
  Metadata meta;
};

} // core

} // sio
