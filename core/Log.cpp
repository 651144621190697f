#include "Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

namespace {
constexpr const char *kLoggerName = "TRACERNG";
}

static std::shared_ptr<spdlog::logger> s_Logger;

void Init(const char *logFile) {
  std::vector<spdlog::sink_ptr> sinks;

  // Console sink with color. stderr keeps generated values on stdout clean.
  auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  consoleSink->set_pattern("%^[%T] %n: %v%$");
  sinks.push_back(consoleSink);

  if (logFile != nullptr) {
    auto fileSink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
    fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
    sinks.push_back(fileSink);
  }

  spdlog::drop(kLoggerName);
  s_Logger =
      std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  spdlog::register_logger(s_Logger);

  s_Logger->set_level(spdlog::level::trace);
  s_Logger->flush_on(spdlog::level::warn);

  LOG_DEBUG("Logging initialized");
}

void Shutdown() {
  s_Logger.reset();
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> &GetLogger() {
  if (!s_Logger) {
    s_Logger = spdlog::stderr_color_mt(kLoggerName);
  }
  return s_Logger;
}

} // namespace Log
