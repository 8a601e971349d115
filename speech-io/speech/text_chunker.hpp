//
//  text_chunker.hpp
//  speech-io
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sio {

namespace speech {

// Cuts text into pieces a streaming TTS service can start speaking early.
//
// Cuts happen only between words: after a word that ends a clause
// (. , ? ! ; :) or before a word that would push the piece past
// `max_chars`. Every piece ends with exactly one space.
class TextChunker {
 public:
  static constexpr std::size_t default_max_chars = 250;

  explicit TextChunker(std::size_t max_chars = default_max_chars) : max_chars_(max_chars) { }

  std::vector<std::string> split(std::string_view text) const;

  static bool ends_clause(std::string_view word);

 private:
  std::size_t max_chars_;
};

} // speech

} // sio
