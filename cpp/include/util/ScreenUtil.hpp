#pragma once

namespace util {

/*
 * Returns the width of the terminal attached to stdout. Falls back to 80 columns when stdout is
 * not a terminal.
 */
int get_screen_width();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
