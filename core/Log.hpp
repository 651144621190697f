#pragma once

#include <memory>
#include <string>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace Log {

// Installs the console sink, plus a file sink when `logFile` is non-null.
// Safe to call more than once; later calls replace the logger.
void Init(const char *logFile = nullptr);
void Shutdown();

// Never null: before Init() this returns a console-only fallback logger.
std::shared_ptr<spdlog::logger> &GetLogger();

} // namespace Log

#define LOG_TRACE(...) ::Log::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::Log::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) ::Log::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) ::Log::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::Log::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::Log::GetLogger()->critical(__VA_ARGS__)
