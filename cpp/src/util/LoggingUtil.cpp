#include "util/LoggingUtil.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace util {

void Logging::init(const Params& params) {
  std::vector<spdlog::sink_ptr> sinks = {std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!params.log_filename.empty()) {
    bool truncate = !params.append_mode;
    sinks.push_back(
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename, truncate));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(params.omit_timestamps ? "%v" : "[%H:%M:%S.%e] %v");
  logger->set_level(spdlog::level::trace);
  logger->flush_on(spdlog::level::debug);
  spdlog::set_default_logger(logger);
}

}  // namespace util
