#include <charconv>
#include <epoch_frame/datetime.h>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/core/timestamp.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor {

namespace {
constexpr auto DATE_FORMAT = "%Y-%m-%d";
constexpr auto DATETIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
constexpr size_t DATE_LENGTH = 10;
constexpr size_t DATETIME_LENGTH = 19;

// Reads up to six fraction digits as microseconds; extra digits are dropped.
std::optional<std::chrono::microseconds> ParseFraction(std::string_view digits) {
  if (digits.empty() ||
      digits.find_first_not_of("0123456789") != std::string_view::npos) {
    return std::nullopt;
  }
  const auto used = digits.substr(0, 6);
  int64_t micros{};
  if (std::from_chars(used.data(), used.data() + used.size(), micros).ec !=
      std::errc{}) {
    return std::nullopt;
  }
  for (auto width = used.size(); width < 6; ++width) {
    micros *= 10;
  }
  return std::chrono::microseconds{micros};
}

std::optional<Timestamp> FromDateTime(const std::string &text,
                                      const char *format) {
  epoch_frame::DateTime parsed;
  try {
    parsed = epoch_frame::DateTime::from_str(text, "UTC", format);
  } catch (const std::exception &exp) {
    SPDLOG_DEBUG("'{}' does not match {}: {}", text, format, exp.what());
    return std::nullopt;
  }
  const Timestamp ts{
      std::chrono::duration_cast<std::chrono::microseconds>(parsed.m_nanoseconds)};

  // strptime rolls out-of-range fields over (Feb 30 reads as Mar 1).
  const auto seconds = std::chrono::floor<std::chrono::seconds>(ts);
  const auto canonical =
      text.size() == DATE_LENGTH ? fmt::format("{:%Y-%m-%d}", seconds)
                                 : fmt::format("{:%Y-%m-%dT%H:%M:%S}", seconds);
  if (canonical != text) {
    return std::nullopt;
  }
  return ts;
}
} // namespace

Timestamp Now() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now());
}

std::optional<Timestamp> ParseTimestamp(std::string_view text) {
  if (text.size() == DATE_LENGTH) {
    return FromDateTime(std::string{text}, DATE_FORMAT);
  }
  if (text.size() < DATETIME_LENGTH) {
    return std::nullopt;
  }

  // UTC designators only.
  if (text.ends_with('Z')) {
    text.remove_suffix(1);
  } else if (text.ends_with("+00:00")) {
    text.remove_suffix(6);
  }

  std::string base{text.substr(0, DATETIME_LENGTH)};
  if (base[DATE_LENGTH] == ' ') {
    base[DATE_LENGTH] = 'T';
  }
  auto result = FromDateTime(base, DATETIME_FORMAT);
  if (!result || text.size() == DATETIME_LENGTH) {
    return result;
  }

  if (text[DATETIME_LENGTH] != '.') {
    return std::nullopt;
  }
  const auto fraction = ParseFraction(text.substr(DATETIME_LENGTH + 1));
  if (!fraction) {
    return std::nullopt;
  }
  return *result + *fraction;
}

Timestamp TimestampFromString(std::string_view text) {
  if (auto ts = ParseTimestamp(text)) {
    return *ts;
  }
  throw ConfigurationError(fmt::format("Invalid timestamp '{}'", text));
}

std::string ToIsoString(Timestamp ts) {
  // %S carries the microsecond fraction of the time point.
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}", ts);
}

} // namespace epoch_monitor
