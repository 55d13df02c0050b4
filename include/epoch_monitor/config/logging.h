#pragma once
#include <string>

namespace epoch_monitor::config {

// Sets the default spdlog logger level from one of trace, debug, info, warn,
// error, critical, off. Throws ConfigurationError for anything else.
void ConfigureLogging(const std::string &level);

// Reads EPOCH_MONITOR_LOG_LEVEL, falling back to the given level.
void ConfigureLoggingFromEnv(const std::string &fallback = "info");

} // namespace epoch_monitor::config
