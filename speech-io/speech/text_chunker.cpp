//
//  text_chunker.cpp
//  speech-io
//

#include <cctype>
#include "speech-io/speech/text_chunker.hpp"

using namespace sio::speech;

namespace {

inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool TextChunker::ends_clause(std::string_view word) {
  if (word.empty()) {
    return false;
  }

  switch (word.back()) {
    case '.':
    case ',':
    case '?':
    case '!':
    case ';':
    case ':':
      return true;
    default:
      return false;
  }
}

std::vector<std::string> TextChunker::split(std::string_view text) const {
  std::vector<std::string> chunks;
  std::string curr;

  auto flush = [&]() {
    if (!curr.empty()) {
      curr += ' ';
      chunks.push_back(std::move(curr));
      curr.clear();
    }
  };

  std::size_t pos = 0;
  while (pos < text.length()) {
    while (pos < text.length() && is_space(text[pos])) {
      ++pos;
    }
    std::size_t start = pos;
    while (pos < text.length() && !is_space(text[pos])) {
      ++pos;
    }
    if (start == pos) {
      break;
    }

    auto word = text.substr(start, pos - start);

    // +1 for the separating space
    if (!curr.empty() && curr.length() + 1 + word.length() > max_chars_) {
      flush();
    }
    if (!curr.empty()) {
      curr += ' ';
    }
    curr.append(word);

    if (ends_clause(word)) {
      flush();
    }
  }

  flush();

  return chunks;
}
