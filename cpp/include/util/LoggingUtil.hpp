#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>

/*
 * LOG_TRACE() ... LOG_ERROR() forward to spdlog's default logger, with {} placeholders:
 *
 * LOG_INFO("Match over after {} rounds", rounds);
 *
 * Levels below SPDLOG_ACTIVE_LEVEL compile to nothing, but their arguments are still
 * type-checked. Configure with -DENABLE_DEBUG_LOGGING=ON to keep LOG_DEBUG().
 */
#define LOG_AT_LEVEL(SPDLOG_MACRO, ...) \
  do {                                  \
    USE_UNEVALUATED(__VA_ARGS__);       \
    SPDLOG_MACRO(__VA_ARGS__);          \
  } while (0)

#define LOG_TRACE(...) LOG_AT_LEVEL(SPDLOG_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) LOG_AT_LEVEL(SPDLOG_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) LOG_AT_LEVEL(SPDLOG_INFO, __VA_ARGS__)
#define LOG_WARN(...) LOG_AT_LEVEL(SPDLOG_WARN, __VA_ARGS__)
#define LOG_ERROR(...) LOG_AT_LEVEL(SPDLOG_ERROR, __VA_ARGS__)

namespace util {

struct Logging {
  static constexpr const char* kLoggerName = "markov_rps";

  struct Params {
    auto make_options_description();

    std::string log_filename;  // empty: console only
    bool append_mode = false;
    bool omit_timestamps = false;
  };

  /*
   * Replaces spdlog's default logger with kLoggerName, writing to stdout and, if log_filename is
   * set, to that file too. Every level is let through at runtime: SPDLOG_ACTIVE_LEVEL does the
   * filtering at compile time.
   */
  static void init(const Params&);
};

}  // namespace util

#include "inline/util/LoggingUtil.inl"
