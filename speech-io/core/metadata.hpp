//
//  metadata.hpp
//  speech-io
//

#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace sio {

namespace core {

// Caller-owned description of one logical unit. Travels with the unit into
// the adapter and comes back attached to every result produced for it.
struct Metadata {
  std::string request_id;
  std::string format;
  std::string text;
  uint64_t sequence_id = 0;
  bool is_first_chunk = false;
  bool end_of_upstream = false;
  bool end_of_stream = false;
  bool eos = false;
  nlohmann::json extra = nlohmann::json::object();

  // Known keys fill the typed fields, the rest goes to `extra`. A non-object
  // gives defaults; a known key of the wrong type (a numeric request_id, say)
  // throws nlohmann::json::type_error.
  static Metadata from_json(const nlohmann::json& j);

  nlohmann::json to_json() const;
};

} // core

} // sio
