#include "util/Rendering.hpp"

#include <unistd.h>

namespace util {

inline Rendering::Mode& Rendering::current() {
  static Mode mode = isatty(STDOUT_FILENO) ? kTerminal : kText;
  return mode;
}

}  // namespace util
