#pragma once
#include <epoch_core/enum_wrapper.h>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

CREATE_ENUM(TaskType, Classification, Regression);

namespace epoch_monitor {

// Column roles supplied by the caller. Unset feature lists are inferred from
// column types.
struct ColumnMapping {
  std::optional<std::string> target{"target"};
  std::vector<std::string> prediction{"prediction"};
  std::optional<std::string> datetime{};
  std::optional<std::string> id{};
  std::optional<std::vector<std::string>> numericalFeatures{};
  std::optional<std::vector<std::string>> categoricalFeatures{};
  std::vector<std::string> textFeatures{};
  epoch_core::TaskType task{epoch_core::TaskType::Null};
  std::optional<std::string> posLabel{};

  void decode(const YAML::Node &element);

  bool operator==(const ColumnMapping &) const = default;
};

} // namespace epoch_monitor

namespace YAML {
template <> struct convert<epoch_monitor::ColumnMapping> {
  static bool decode(const Node &node, epoch_monitor::ColumnMapping &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
