#include "util/ScreenUtil.hpp"

#include <sys/ioctl.h>

#include <unistd.h>

namespace util {

inline int get_screen_width() {
  static int width = 0;
  if (width == 0) {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
      width = w.ws_col;
    } else {
      width = kDefaultScreenWidth;
    }
  }
  return width;
}

}  // namespace util
