#include <algorithm>
#include <arrow/api.h>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/data/input_data.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace epoch_monitor {

namespace {
bool HasColumn(const std::vector<std::string> &columns,
               const std::string &column) {
  return std::ranges::find(columns, column) != columns.end();
}

void AssertColumnsPresent(const std::vector<std::string> &columns,
                          const std::vector<std::string> &requested,
                          std::string_view role) {
  for (const auto &column : requested) {
    if (!HasColumn(columns, column)) {
      throw ConfigurationError(fmt::format(
          "{} column '{}' not found in current data. Available: [{}]", role,
          column, fmt::join(columns, ", ")));
    }
  }
}
} // namespace

std::vector<std::string> DatasetColumns::AllFeatures() const {
  std::vector<std::string> result;
  result.reserve(numericalFeatures.size() + categoricalFeatures.size() +
                 textFeatures.size());
  result.insert(result.end(), numericalFeatures.begin(),
                numericalFeatures.end());
  result.insert(result.end(), categoricalFeatures.begin(),
                categoricalFeatures.end());
  result.insert(result.end(), textFeatures.begin(), textFeatures.end());
  return result;
}

const epoch_frame::DataFrame &InputData::Current() const {
  if (!current) {
    throw std::logic_error("Current data accessed before verification");
  }
  return *current;
}

bool IsNumericColumn(const epoch_frame::DataFrame &df,
                     const std::string &column) {
  const auto field = df.table()->schema()->GetFieldByName(column);
  if (!field) {
    return false;
  }
  const auto typeId = field->type()->id();
  return typeId == arrow::Type::DOUBLE || typeId == arrow::Type::FLOAT ||
         typeId == arrow::Type::INT64 || typeId == arrow::Type::INT32 ||
         typeId == arrow::Type::INT16 || typeId == arrow::Type::INT8 ||
         typeId == arrow::Type::UINT64 || typeId == arrow::Type::UINT32 ||
         typeId == arrow::Type::UINT16 || typeId == arrow::Type::UINT8;
}

DatasetColumns ProcessColumns(const epoch_frame::DataFrame &current,
                              const ColumnMapping &mapping) {
  const auto columns = current.column_names();
  DatasetColumns result;
  result.task = mapping.task;

  if (mapping.target && HasColumn(columns, *mapping.target)) {
    result.target = mapping.target;
  }
  for (const auto &prediction : mapping.prediction) {
    if (HasColumn(columns, prediction)) {
      result.prediction.push_back(prediction);
    }
  }
  if (mapping.datetime) {
    AssertColumnsPresent(columns, {*mapping.datetime}, "Datetime");
    result.datetime = mapping.datetime;
  }
  if (mapping.id) {
    AssertColumnsPresent(columns, {*mapping.id}, "Id");
    result.id = mapping.id;
  }
  AssertColumnsPresent(columns, mapping.textFeatures, "Text feature");
  result.textFeatures = mapping.textFeatures;

  std::unordered_set<std::string> utility{result.prediction.begin(),
                                          result.prediction.end()};
  utility.insert(result.textFeatures.begin(), result.textFeatures.end());
  for (const auto &column : {result.target, result.datetime, result.id}) {
    if (column) {
      utility.insert(*column);
    }
  }

  if (mapping.numericalFeatures) {
    AssertColumnsPresent(columns, *mapping.numericalFeatures,
                         "Numerical feature");
    result.numericalFeatures = *mapping.numericalFeatures;
  }
  if (mapping.categoricalFeatures) {
    AssertColumnsPresent(columns, *mapping.categoricalFeatures,
                         "Categorical feature");
    result.categoricalFeatures = *mapping.categoricalFeatures;
  }

  for (const auto &column : columns) {
    if (utility.contains(column)) {
      continue;
    }
    const bool numeric = IsNumericColumn(current, column);
    if (numeric && !mapping.numericalFeatures &&
        !HasColumn(result.categoricalFeatures, column)) {
      result.numericalFeatures.push_back(column);
    } else if (!numeric && !mapping.categoricalFeatures &&
               !HasColumn(result.numericalFeatures, column)) {
      result.categoricalFeatures.push_back(column);
    }
  }

  SPDLOG_DEBUG("Processed columns: target={}, numerical=[{}], categorical=[{}]",
               result.target.value_or("<none>"),
               fmt::join(result.numericalFeatures, ", "),
               fmt::join(result.categoricalFeatures, ", "));
  return result;
}

DataDefinition
CreateDataDefinition(const std::optional<epoch_frame::DataFrame> &reference,
                     const epoch_frame::DataFrame &current,
                     const ColumnMapping &mapping) {
  DataDefinition definition;
  definition.columns = ProcessColumns(current, mapping);
  definition.referencePresent = reference.has_value();
  definition.currentRows = current.num_rows();
  if (reference) {
    definition.referenceRows = reference->num_rows();
  }
  return definition;
}

} // namespace epoch_monitor
