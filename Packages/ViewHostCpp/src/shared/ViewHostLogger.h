#pragma once

#include <exception>
#include <functional>
#include <string>

namespace viewhost {

using LogSink = std::function<void(const std::string&)>;

// Replaces the destination of runtime diagnostics. An empty sink restores the
// default, which writes one line per message to std::cerr.
void setLogSink(LogSink sink);

void logScheduledTaskError(const std::exception& error);

// No-op unless dev mode is enabled.
void logDevWarning(const std::string& message);

} // namespace viewhost
