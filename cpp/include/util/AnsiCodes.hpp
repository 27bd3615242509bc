#pragma once

#include "util/Rendering.hpp"

#include <string>

/*
 * ANSI codes.
 *
 * Each of these functions accepts an optional argument that is returned instead when
 * util::Rendering::mode() is util::Rendering::kText (i.e., when the output is not a terminal).
 */
namespace ansi {

inline const char* kRed(const char* s = "") {
  return util::Rendering::mode() == util::Rendering::kTerminal ? "\033[31m" : s;
}

inline const char* kGreen(const char* s = "") {
  return util::Rendering::mode() == util::Rendering::kTerminal ? "\033[32m" : s;
}

inline const char* kYellow(const char* s = "") {
  return util::Rendering::mode() == util::Rendering::kTerminal ? "\033[33m" : s;
}

inline const char* kBlue(const char* s = "") {
  return util::Rendering::mode() == util::Rendering::kTerminal ? "\033[34m" : s;
}

inline const char* kReverse(const char* s = "") {
  return util::Rendering::mode() == util::Rendering::kTerminal ? "\033[7m" : s;
}

inline const char* kReset(const char* s = "") {
  return util::Rendering::mode() == util::Rendering::kTerminal ? "\033[00m" : s;
}

/*
 * Maps a color name ("red", "green", "yellow", "blue", "black") to its escape code. "black" maps to
 * the terminal's default color. Throws util::CleanException for unknown names.
 */
const char* color(const std::string& name);

}  // namespace ansi

#include "inline/util/AnsiCodes.inl"
