#pragma once

#include <exception>
#include <format>
#include <string>
#include <utility>

namespace util {

// A std::exception whose message is built with std::format(). Throw it for bugs.
class Exception : public std::exception {
 public:
  Exception() = default;

  template <typename... Ts>
  explicit Exception(std::format_string<Ts...> fmt, Ts&&... ts)
      : what_(std::format(fmt, std::forward<Ts>(ts)...)) {}

  const char* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

/*
 * Thrown for mistakes the user can make: a bad command-line value, an unknown --player type, a
 * closed stdin. main() prints what() and exits with status 1.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

// Thrown by the *_ASSERT() macros of util/Asserts.hpp.
class DebugAssertionError : public Exception {
 public:
  using Exception::Exception;
};

class ReleaseAssertionError : public Exception {
 public:
  using Exception::Exception;
};

class CleanAssertionError : public CleanException {
 public:
  using CleanException::CleanException;
};

}  // namespace util
