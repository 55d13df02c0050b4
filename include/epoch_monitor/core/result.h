#pragma once
#include <epoch_core/enum_wrapper.h>
#include <glaze/glaze.hpp>
#include <string>
#include <string_view>

CREATE_ENUM(TestStatus, Success, Fail, Warning, Error, Skipped);

namespace epoch_monitor {

inline constexpr std::string_view STATUS_FIELD = "status";
inline constexpr std::string_view DESCRIPTION_FIELD = "description";

/**
 * @brief Immutable output of a computational unit.
 *
 * The payload is a JSON-like tree. Fields are addressed with dot-separated
 * paths ("current.value"); a numeric segment indexes into an array.
 */
class Result {
public:
  Result() = default;
  explicit Result(glz::generic payload) : m_payload(std::move(payload)) {}

  [[nodiscard]] const glz::generic &Payload() const { return m_payload; }

  // Throws FieldNotFoundError naming the full path on a miss.
  [[nodiscard]] const glz::generic &Get(std::string_view path) const;

  [[nodiscard]] bool Contains(std::string_view path) const;

  [[nodiscard]] double GetNumber(std::string_view path) const;

  // Status of a test result; Null for metric results.
  [[nodiscard]] epoch_core::TestStatus GetStatus() const;

  [[nodiscard]] std::string ToJson() const;

  bool operator==(const Result &other) const { return ToJson() == other.ToJson(); }

private:
  glz::generic m_payload{};
};

// Builds a test result payload.
glz::generic MakeTestPayload(epoch_core::TestStatus status,
                             std::string description,
                             glz::generic parameters = {});

} // namespace epoch_monitor
