#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include <string>

/*
 * LOG_INFO("{} plays {}", name, action);
 *
 * Messages are fmt format strings. LOG_TRACE and LOG_DEBUG are stripped at compile time unless the
 * build is configured with -DTTT_ENABLE_DEBUG_LOGGING=ON, which raises SPDLOG_ACTIVE_LEVEL.
 */
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;  // empty: stdout only
    bool append_mode = false;
    bool omit_timestamps = false;

    auto make_options_description();
  };

  // Replaces spdlog's default logger with one writing to stdout and, optionally, log_filename.
  static void init(const Params&);
};

}  // namespace util

#include "inline/util/LoggingUtil.inl"
