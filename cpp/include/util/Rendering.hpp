#pragma once

#include <cstdint>
#include <vector>

namespace util {

/*
 * Stack-based rendering mode context for text vs. terminal output.
 *
 * Rendering::mode() returns the current rendering mode, which by default is determined by
 * isatty(STDOUT_FILENO): kTerminal if true, kText otherwise. Board printing branches on this to
 * decide whether to emit ANSI color codes.
 *
 * The mode can be temporarily overridden using the RAII Guard:
 *
 *   {
 *     util::Rendering::Guard g(util::Rendering::kText);  // force text mode in this scope
 *     ...
 *   }
 */
class Rendering {
 public:
  enum Mode : int8_t { kText, kTerminal };

  struct Guard {
    Guard(Mode mode);
    ~Guard();
  };

  static Mode mode();

  // Sets the base rendering mode (bottom of the stack).
  static void set(Mode mode);

  static void push(Mode mode);

  // Throws util::CleanException if this would leave the stack empty.
  static void pop();

 private:
  Rendering();
  static Rendering& instance();

  std::vector<Mode> mode_stack_;
};

}  // namespace util

#include "inline/util/Rendering.inl"
