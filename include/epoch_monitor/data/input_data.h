#pragma once
#include <epoch_frame/dataframe.h>
#include <epoch_monitor/data/column_mapping.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace epoch_monitor {

// Resolved column roles of the current dataset.
struct DatasetColumns {
  std::optional<std::string> target{};
  std::vector<std::string> prediction{};
  std::optional<std::string> datetime{};
  std::optional<std::string> id{};
  std::vector<std::string> numericalFeatures{};
  std::vector<std::string> categoricalFeatures{};
  std::vector<std::string> textFeatures{};
  epoch_core::TaskType task{epoch_core::TaskType::Null};

  // numerical, then categorical, then text
  [[nodiscard]] std::vector<std::string> AllFeatures() const;

  bool operator==(const DatasetColumns &) const = default;
};

struct DataDefinition {
  DatasetColumns columns{};
  bool referencePresent{false};
  size_t currentRows{0};
  std::optional<size_t> referenceRows{};
};

// Derived columns computed once per run, keyed by feature id.
using FeatureMap = std::map<std::string, epoch_frame::DataFrame>;

struct InputData {
  std::optional<epoch_frame::DataFrame> reference{};
  std::optional<epoch_frame::DataFrame> current{};
  ColumnMapping mapping{};
  DataDefinition definition{};
  FeatureMap currentFeatures{};
  FeatureMap referenceFeatures{};

  // Throws std::logic_error when current is absent.
  [[nodiscard]] const epoch_frame::DataFrame &Current() const;
};

bool IsNumericColumn(const epoch_frame::DataFrame &df,
                     const std::string &column);

// Infers feature roles for every column not explicitly mapped. Throws
// ConfigurationError when a mapped column is missing from the dataset.
DatasetColumns ProcessColumns(const epoch_frame::DataFrame &current,
                              const ColumnMapping &mapping);

DataDefinition
CreateDataDefinition(const std::optional<epoch_frame::DataFrame> &reference,
                     const epoch_frame::DataFrame &current,
                     const ColumnMapping &mapping);

} // namespace epoch_monitor
