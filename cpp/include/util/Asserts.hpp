#pragma once

#include "util/CppUtil.hpp"
#include "util/Exceptions.hpp"

#include <fmt/format.h>

#include <source_location>

/*
 * A variety of assert functions:
 *
 * - DEBUG_ASSERT() - throws a util::DebugAssertionError if the condition is false; enabled only for
 *   debug builds.
 *
 * - RELEASE_ASSERT() - throws a util::ReleaseAssertionError if the condition is false; enabled for
 *   debug AND release builds.
 *
 * - CLEAN_ASSERT() - throws a util::CleanAssertionError if the condition is false; enabled for
 *   debug AND release builds. See util::CleanException documentation.
 *
 * Each variant can be passed a single bool, or a bool followed by a format string and
 * additional formatting arguments.
 *
 * Unlike the standard assert(), a disabled DEBUG_ASSERT() still compiles its arguments, so a bug
 * in the arguments is caught in every build, and a local variable used only in an assertion does
 * not trigger unused-variable warnings. The arguments are only evaluated if the assertion is
 * enabled.
 */

#define DEBUG_ASSERT(COND, ...)                                                                    \
  do {                                                                                             \
    if (util::kDebugBuild) {                                                                       \
      util::detail::assert_impl<util::DebugAssertionError>(#COND, std::source_location::current(), \
                                                           COND, ##__VA_ARGS__);                   \
    }                                                                                              \
  } while (0)

#define RELEASE_ASSERT(COND, ...)                                                                  \
  do {                                                                                             \
    util::detail::assert_impl<util::ReleaseAssertionError>(#COND, std::source_location::current(), \
                                                           COND, ##__VA_ARGS__);                   \
  } while (0)

#define CLEAN_ASSERT(COND, ...)                                                                  \
  do {                                                                                           \
    util::detail::assert_impl<util::CleanAssertionError>(#COND, std::source_location::current(), \
                                                         COND, ##__VA_ARGS__);                   \
  } while (0)

namespace util {
namespace detail {

template <typename ExceptionT, typename... Ts>
inline void assert_impl([[maybe_unused]] const char* cond_str, const std::source_location& loc,
                        bool cond, fmt::format_string<Ts...> fmt, Ts&&... ts) {
  if (!cond) {
    throw ExceptionT("{} failed: {} [{}:{}]", ExceptionT::descr(),
                     fmt::format(fmt, std::forward<Ts>(ts)...), loc.file_name(), loc.line());
  }
}

template <typename ExceptionT>
inline void assert_impl(const char* cond_str, const std::source_location& loc, bool cond) {
  if (!cond) {
    throw ExceptionT("{} failed: {} [{}:{}]", ExceptionT::descr(), cond_str, loc.file_name(),
                     loc.line());
  }
}

}  // namespace detail
}  // namespace util
