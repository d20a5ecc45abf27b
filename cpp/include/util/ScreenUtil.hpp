#pragma once

namespace util {

// Width of the attached terminal, or kDefaultScreenWidth if stdout is not a terminal.
int get_screen_width();

constexpr int kDefaultScreenWidth = 80;

}  // namespace util

#include "inline/util/ScreenUtil.inl"
