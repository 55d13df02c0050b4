#include <epoch_monitor/config/env_loader.h>
#include <epoch_monitor/config/logging.h>
#include <epoch_monitor/core/errors.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor::config {

void ConfigureLogging(const std::string &level) {
  const auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off.
  if (parsed == spdlog::level::off && level != "off") {
    throw ConfigurationError(fmt::format("Invalid log level '{}'", level));
  }
  spdlog::set_level(parsed);
  SPDLOG_DEBUG("Log level set to {}", level);
}

void ConfigureLoggingFromEnv(const std::string &fallback) {
  ConfigureLogging(
      EnvLoader::instance().get(std::string{LOG_LEVEL_VAR}, fallback));
}

} // namespace epoch_monitor::config
