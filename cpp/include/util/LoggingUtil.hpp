#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/spdlog.h>

#include <string>

// The main logging macros are LOG_INFO(), LOG_DEBUG(), LOG_WARN(), and LOG_ERROR().
//
// These use fmt::format() to format the message. For example:
//
// LOG_INFO("Hello {}!", "world");
// LOG_DEBUG("x={} pi={}", 3, 3.14159);
//
// By default, LOG_DEBUG() and LOG_TRACE() statements are compiled out. In order to enable them,
// configure with -DMINIMAX_ARCADE_DEBUG_LOGGING=ON, and run with --debug-logging.

// USE_UNEVALUATED() keeps variables referenced only by a compiled-out statement from triggering
// unused-variable warnings.
#define LOG_IMPL(SPDLOG_MACRO, ...) \
  do {                              \
    USE_UNEVALUATED(__VA_ARGS__);   \
    SPDLOG_MACRO(__VA_ARGS__);      \
  } while (0)

#define LOG_TRACE(...) LOG_IMPL(SPDLOG_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) LOG_IMPL(SPDLOG_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) LOG_IMPL(SPDLOG_INFO, __VA_ARGS__)
#define LOG_WARN(...) LOG_IMPL(SPDLOG_WARN, __VA_ARGS__)
#define LOG_ERROR(...) LOG_IMPL(SPDLOG_ERROR, __VA_ARGS__)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    bool append_mode = false;
    bool omit_timestamps = false;
    bool debug = false;  // runtime threshold; LOG_DEBUG() must also be compiled in

    auto make_options_description();
  };

  static void init(const Params&);
};  // Logging

}  // namespace util

#include "inline/util/LoggingUtil.inl"
