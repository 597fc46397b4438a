#include "shared/ViewHostLogger.h"

#include "shared/ViewHostFeatureFlags.h"

#include <iostream>
#include <utility>

namespace viewhost {
namespace {

LogSink& logSink() {
  static LogSink sink;
  return sink;
}

void emit(const std::string& message) {
  const auto& sink = logSink();
  if (sink) {
    sink(message);
    return;
  }
  std::cerr << message << std::endl;
}

} // namespace

void setLogSink(LogSink sink) {
  logSink() = std::move(sink);
}

void logScheduledTaskError(const std::exception& error) {
  emit(std::string("ViewHost scheduled task threw: ") + error.what());
}

void logDevWarning(const std::string& message) {
  if constexpr (!devModeEnabled) {
    (void)message;
    return;
  }
  emit("ViewHost warning: " + message);
}

} // namespace viewhost
