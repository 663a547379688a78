#include "util/LoggingUtil.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace util {

void Logging::init(const Params& params) {
  auto logger = std::make_shared<spdlog::logger>("ttt");
  logger->sinks().push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!params.log_filename.empty()) {
    bool truncate = !params.append_mode;
    logger->sinks().push_back(
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename, truncate));
  }

  logger->set_pattern(params.omit_timestamps ? "%v" : "%Y-%m-%d %H:%M:%S.%f %v");

  // Compile-time SPDLOG_ACTIVE_LEVEL does the filtering.
  logger->set_level(spdlog::level::trace);
  logger->flush_on(spdlog::level::info);
  spdlog::set_default_logger(logger);
}

}  // namespace util
