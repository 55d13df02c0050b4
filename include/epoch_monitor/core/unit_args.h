#pragma once
//
// Constructor arguments of a computational unit.
//
#include <cstdint>
#include <glaze/glaze.hpp>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace epoch_monitor {

class ArgValue;
using ArgSequence = std::vector<ArgValue>;
using ArgMapping = std::map<std::string, ArgValue>;

// A single argument value. Integers are stored as doubles; strings are kept
// verbatim. Decimals are normalized on construction: -0.0 is stored as 0.0 and
// NaN throws ConfigurationError, so equal values have equal canonical text.
class ArgValue {
public:
  using T = std::variant<std::monostate, bool, double, std::string, ArgSequence,
                         ArgMapping>;

  ArgValue() = default;
  ArgValue(bool value) : m_value(value) {}
  ArgValue(double value);

  template <typename Integral>
    requires(std::is_integral_v<Integral> && !std::is_same_v<Integral, bool>)
  ArgValue(Integral value) : ArgValue(static_cast<double>(value)) {}

  ArgValue(const char *value) : m_value(std::string{value}) {}
  ArgValue(std::string value) : m_value(std::move(value)) {}
  ArgValue(ArgSequence value) : m_value(std::move(value)) {}
  ArgValue(ArgMapping value) : m_value(std::move(value)) {}

  ArgValue(const std::vector<std::string> &values);

  [[nodiscard]] const T &GetVariant() const { return m_value; }

  template <class K> [[nodiscard]] bool IsType() const {
    return std::holds_alternative<K>(m_value);
  }

  [[nodiscard]] bool IsNull() const { return IsType<std::monostate>(); }

  [[nodiscard]] bool GetBoolean() const;
  [[nodiscard]] double GetDecimal() const;
  [[nodiscard]] int64_t GetInteger() const {
    return static_cast<int64_t>(GetDecimal());
  }
  [[nodiscard]] const std::string &GetString() const;
  [[nodiscard]] const ArgSequence &GetSequence() const;
  [[nodiscard]] const ArgMapping &GetMapping() const;

  // Resolves a dotted path ("column_name.name") through nested mappings.
  // Returns nullptr when any segment is missing.
  [[nodiscard]] const ArgValue *Find(std::string_view dottedPath) const;

  // Canonical JSON text. Mapping keys are sorted; equal values print equally.
  [[nodiscard]] std::string ToString() const;

  bool operator==(const ArgValue &other) const;

  void decode(const YAML::Node &node);

private:
  T m_value{};
};

using UnitArgs = std::map<std::string, ArgValue>;

std::string ToCanonicalString(const UnitArgs &args);

const ArgValue *FindArg(const UnitArgs &args, std::string_view dottedPath);

// True when every entry of the template equals the value found under the same
// (possibly dotted) key in args.
bool MatchesTemplate(const UnitArgs &args, const UnitArgs &argsTemplate);

glz::generic ToGeneric(const ArgValue &value);
glz::generic ToGeneric(const UnitArgs &args);

ArgValue ArgValueFromGeneric(const glz::generic &value);
UnitArgs UnitArgsFromGeneric(const glz::generic &value);

UnitArgs UnitArgsFromYAML(const YAML::Node &node);

} // namespace epoch_monitor

namespace YAML {
template <> struct convert<epoch_monitor::ArgValue> {
  static bool decode(const Node &node, epoch_monitor::ArgValue &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
