//
//  log.cpp
//  speech-io
//

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "speech-io/utils/log.hpp"

namespace {

std::mutex g_log_mtx;
spdlog::level::level_enum g_log_level = spdlog::level::info;

} // namespace

std::shared_ptr<spdlog::logger> sio::utils::get_logger(const std::string& name) {
  std::lock_guard<std::mutex> lk(g_log_mtx);

  auto logger = spdlog::get(name);
  if (!logger) {
    logger = spdlog::stderr_color_mt(name);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%-5l%$ {%n} %v");
    logger->set_level(g_log_level);
  }
  return logger;
}

void sio::utils::set_log_level(spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lk(g_log_mtx);
  g_log_level = level;
  spdlog::set_level(level);
}

void sio::utils::set_log_level(std::string_view level) {
  set_log_level(spdlog::level::from_str(std::string(level)));
}
