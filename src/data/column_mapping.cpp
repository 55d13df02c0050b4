#include <epoch_monitor/data/column_mapping.h>

namespace epoch_monitor {

void ColumnMapping::decode(const YAML::Node &element) {
  if (element["target"]) {
    target = element["target"].IsNull()
                 ? std::nullopt
                 : std::optional{element["target"].as<std::string>()};
  }
  if (const auto node = element["prediction"]) {
    if (node.IsNull()) {
      prediction.clear();
    } else if (node.IsSequence()) {
      prediction = node.as<std::vector<std::string>>();
    } else {
      prediction = {node.as<std::string>()};
    }
  }
  if (element["datetime"]) {
    datetime = element["datetime"].as<std::string>();
  }
  if (element["id"]) {
    id = element["id"].as<std::string>();
  }
  if (element["numerical_features"]) {
    numericalFeatures =
        element["numerical_features"].as<std::vector<std::string>>();
  }
  if (element["categorical_features"]) {
    categoricalFeatures =
        element["categorical_features"].as<std::vector<std::string>>();
  }
  textFeatures = element["text_features"].as<std::vector<std::string>>(
      std::vector<std::string>{});
  task = epoch_core::TaskTypeWrapper::FromString(
      element["task"].as<std::string>("Null"));
  if (element["pos_label"]) {
    posLabel = element["pos_label"].as<std::string>();
  }
}

} // namespace epoch_monitor
