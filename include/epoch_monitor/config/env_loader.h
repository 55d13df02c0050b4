#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_map>

namespace epoch_monitor::config {

inline constexpr std::string_view WORKSPACE_VAR = "EPOCH_MONITOR_WORKSPACE";
inline constexpr std::string_view LOG_LEVEL_VAR = "EPOCH_MONITOR_LOG_LEVEL";
inline constexpr std::string_view LOCAL_ENV_FILE = ".env.local";

// Environment variables, with KEY=VALUE overrides read once from .env.local
// in the working directory.
class EnvLoader {
public:
  static EnvLoader &instance() {
    static EnvLoader instance;
    return instance;
  }

  // Loaded overrides win over the process environment.
  std::string get(const std::string &key,
                  const std::string &defaultValue = "") const {
    if (auto it = m_variables.find(key); it != m_variables.end()) {
      return it->second;
    }
    const char *value = std::getenv(key.c_str());
    return value ? value : defaultValue;
  }

  int getInt(const std::string &key, int defaultValue = 0) const {
    const auto value = get(key);
    if (value.empty()) {
      return defaultValue;
    }
    try {
      return std::stoi(value);
    } catch (const std::logic_error &exp) {
      SPDLOG_WARN("Environment variable '{}'='{}' is not an integer ({}), "
                  "using {}",
                  key, value, exp.what(), defaultValue);
      return defaultValue;
    }
  }

  bool getBool(const std::string &key, bool defaultValue = false) const {
    const auto value = get(key);
    if (value.empty()) {
      return defaultValue;
    }
    return value == "true" || value == "1" || value == "yes";
  }

  void set(const std::string &key, const std::string &value) {
    m_variables[key] = value;
    setenv(key.c_str(), value.c_str(), 1);
  }

  // Parses a KEY=VALUE file; blank lines and '#' comments are skipped.
  void loadFile(const std::filesystem::path &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
      return;
    }
    std::string line;
    while (std::getline(file, line)) {
      parseLine(line);
    }
    SPDLOG_INFO("Loaded environment from {}", filename.string());
  }

private:
  std::unordered_map<std::string, std::string> m_variables;

  EnvLoader() {
    if (std::filesystem::exists(LOCAL_ENV_FILE)) {
      loadFile(LOCAL_ENV_FILE);
    }
  }

  void parseLine(const std::string &line) {
    const auto trimmed = trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      return;
    }
    const auto pos = trimmed.find('=');
    if (pos == std::string::npos) {
      return;
    }

    auto key = trim(trimmed.substr(0, pos));
    auto value = trim(trimmed.substr(pos + 1));
    if (value.length() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.length() - 2);
    }
    if (!key.empty()) {
      set(key, expandVariables(value));
    }
  }

  // Replaces ${VAR} with its current value.
  std::string expandVariables(std::string value) const {
    size_t pos = 0;
    while ((pos = value.find("${", pos)) != std::string::npos) {
      const auto end = value.find('}', pos);
      if (end == std::string::npos) {
        break;
      }
      const auto replacement = get(value.substr(pos + 2, end - pos - 2));
      value.replace(pos, end - pos + 1, replacement);
      pos += replacement.length();
    }
    return value;
  }

  static std::string trim(const std::string &str) {
    const auto begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
      return "";
    }
    const auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
  }
};

#define EPOCH_MONITOR_ENV(key) epoch_monitor::config::EnvLoader::instance().get(key)
#define EPOCH_MONITOR_ENV_INT(key)                                            \
  epoch_monitor::config::EnvLoader::instance().getInt(key)
#define EPOCH_MONITOR_ENV_BOOL(key)                                           \
  epoch_monitor::config::EnvLoader::instance().getBool(key)

} // namespace epoch_monitor::config
