//
//  cache.cpp
//  speech-io
//

#include <utility>
#include <nlohmann/json.hpp>
#include "speech-io/core/cache.hpp"

using namespace sio::core;

std::optional<std::string> InMemoryCache::get(const std::string& key) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = map_.find(key);
  if (it == map_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryCache::set(const std::string& key, std::string value) {
  std::lock_guard<std::mutex> lk(mtx_);
  map_[key] = std::move(value);
}

std::size_t InMemoryCache::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return map_.size();
}

std::string sio::core::make_cache_key(std::string_view text, std::string_view voice,
                                      std::string_view model, std::string_view format) {
  // nlohmann::json keeps object keys sorted, so dump() is canonical
  nlohmann::json j;
  j["text"] = text;
  j["voice"] = voice;
  j["model"] = model;
  j["format"] = format;
  return j.dump();
}
