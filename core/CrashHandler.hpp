#pragma once

namespace CrashHandler {

// Installs backward-cpp signal handlers that print a stack trace on fatal
// signals. Idempotent. Returns false when no handler could be installed.
bool Init();

} // namespace CrashHandler
