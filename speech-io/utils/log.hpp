//
//  log.hpp
//  speech-io
//

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace sio {

namespace utils {

// Named logger shared by every component with the same name. Created on
// first use with a colored stderr sink.
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

// Applies to every logger created so far and to the ones created later.
void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "critical", "off"
void set_log_level(std::string_view level);

} // utils

} // sio
