#pragma once

#include "util/CppUtil.hpp"
#include "util/Exception.hpp"

#include <format>
#include <source_location>

/*
 * RELEASE_ASSERT(cond[, fmt, args...]) throws util::ReleaseAssertionError if cond is false.
 * CLEAN_ASSERT(cond[, fmt, args...]) throws util::CleanAssertionError, for conditions that a
 * command-line value can break.
 * DEBUG_ASSERT(cond[, fmt, args...]) throws util::DebugAssertionError, in DEBUG_BUILD only. The
 * expression is still compiled in release builds.
 *
 * The message arguments are only formatted on failure.
 */

#define RELEASE_ASSERT(COND, ...)                                               \
  util::detail::check_assertion<util::ReleaseAssertionError>(                   \
    "RELEASE_ASSERT", #COND, std::source_location::current(), bool(COND)        \
    __VA_OPT__(, ) __VA_ARGS__)

#define CLEAN_ASSERT(COND, ...)                                                 \
  util::detail::check_assertion<util::CleanAssertionError>(                     \
    "CLEAN_ASSERT", #COND, std::source_location::current(), bool(COND)          \
    __VA_OPT__(, ) __VA_ARGS__)

#define DEBUG_ASSERT(COND, ...)                                                 \
  do {                                                                          \
    if constexpr (IS_DEFINED(DEBUG_BUILD)) {                                    \
      util::detail::check_assertion<util::DebugAssertionError>(                 \
        "DEBUG_ASSERT", #COND, std::source_location::current(), bool(COND)      \
        __VA_OPT__(, ) __VA_ARGS__);                                            \
    }                                                                           \
  } while (0)

namespace util {
namespace detail {

template <typename ErrorT>
void check_assertion(const char* macro, const char* cond_str, const std::source_location& loc,
                     bool cond) {
  if (!cond) {
    throw ErrorT("{}({}) failed at {}:{}", macro, cond_str, loc.file_name(), loc.line());
  }
}

template <typename ErrorT, typename... Ts>
void check_assertion(const char* macro, const char* cond_str, const std::source_location& loc,
                     bool cond, std::format_string<Ts...> fmt, Ts&&... ts) {
  if (!cond) {
    throw ErrorT("{}({}) failed at {}:{}: {}", macro, cond_str, loc.file_name(), loc.line(),
                 std::format(fmt, std::forward<Ts>(ts)...));
  }
}

}  // namespace detail
}  // namespace util
