#include "CrashHandler.hpp"

#include <backward.hpp>

#include "core/Log.hpp"

namespace CrashHandler {

// Leaked on purpose so it outlives static destructors during a crash.
static backward::SignalHandling *s_SignalHandler = nullptr;

bool Init() {
  if (!s_SignalHandler) {
    s_SignalHandler = new backward::SignalHandling();
    if (!s_SignalHandler->loaded()) {
      LOG_WARN("Crash handler could not install signal handlers");
    }
  }
  return s_SignalHandler->loaded();
}

} // namespace CrashHandler
