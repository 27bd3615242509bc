#include "util/LoggingUtil.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace util {

void Logging::init(const Params& params) {
  std::vector<spdlog::sink_ptr> sinks;

  const char* format =
    params.omit_timestamps ? "[%^%l%$] %v" : "%Y-%m-%d %H:%M:%S.%f [%^%l%$] %v";

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_pattern(format);
  sinks.push_back(console_sink);

  if (!params.log_filename.empty()) {
    auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename, !params.append_mode);
    file_sink->set_pattern(format);
    sinks.push_back(file_sink);
  }

  auto logger = std::make_shared<spdlog::logger>("minimax_arcade", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);

  spdlog::level::level_enum level = params.debug ? spdlog::level::trace : spdlog::level::info;
  spdlog::flush_on(level);
  spdlog::set_level(level);
}

}  // namespace util
