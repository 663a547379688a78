#pragma once

namespace util {

// Falls back to 80 columns when stdout is not a terminal.
int get_screen_width();

void clearscreen();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
