#pragma once

#include <cstdint>

namespace util {

/*
 * Whether output goes to a terminal (colored outcome messages) or to plain text (a pipe, a log
 * file, a test's ostringstream). Starts from isatty(STDOUT_FILENO); set() overrides it for the
 * rest of the process.
 */
class Rendering {
 public:
  enum Mode : int8_t { kText, kTerminal };

  static Mode mode() { return current(); }
  static void set(Mode mode) { current() = mode; }

 private:
  static Mode& current();
};

}  // namespace util

#include "inline/util/Rendering.inl"
