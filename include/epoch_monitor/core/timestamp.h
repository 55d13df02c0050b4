#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace epoch_monitor {

using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

Timestamp Now();

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" with optional fractional
// seconds and a trailing 'Z'. A space may replace the 'T'.
std::optional<Timestamp> ParseTimestamp(std::string_view text);

// Throws ConfigurationError when text is not a timestamp.
Timestamp TimestampFromString(std::string_view text);

// "YYYY-MM-DDTHH:MM:SS.ffffff"
std::string ToIsoString(Timestamp ts);

} // namespace epoch_monitor
