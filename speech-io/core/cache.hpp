//
//  cache.hpp
//  speech-io
//

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sio {

namespace core {

class ResponseCache {
 public:
  virtual ~ResponseCache() = default;

  virtual std::optional<std::string> get(const std::string& key) = 0;

  virtual void set(const std::string& key, std::string value) = 0;
};

// Unbounded, process local. Eviction is the owner's business.
class InMemoryCache : public ResponseCache {
 public:
  InMemoryCache() = default;

  virtual ~InMemoryCache() = default;

  virtual std::optional<std::string> get(const std::string& key) override;

  virtual void set(const std::string& key, std::string value) override;

  std::size_t size() const;

 private:
  mutable std::mutex mtx_;
  std::unordered_map<std::string, std::string> map_;
};

// Canonical key for synthesized audio: same text spoken with the same voice,
// model and output format always maps to the same key.
std::string make_cache_key(std::string_view text, std::string_view voice,
                           std::string_view model, std::string_view format);

} // core

} // sio
