//
//  result.cpp
//  speech-io
//

#include "speech-io/core/result.hpp"

const char* sio::core::to_string(ResultType type) {
  switch (type) {
    case ResultType::Audio:
      return "audio";
    case ResultType::InterimTranscript:
      return "interim_transcript_received";
    case ResultType::Transcript:
      return "transcript";
    case ResultType::ConnectionClosed:
      return "transcriber_connection_closed";
  }
  return "unknown";
}
