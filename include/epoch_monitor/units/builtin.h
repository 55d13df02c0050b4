#pragma once
//
// Reference checks shipped with the library.
//
#include <epoch_monitor/units/items.h>
#include <epoch_monitor/units/unit_registry.h>
#include <string_view>

namespace epoch_monitor::units {

class DatasetSummaryMetric : public ComputationalUnit {
public:
  static constexpr std::string_view TYPE = "DatasetSummaryMetric";

  explicit DatasetSummaryMetric(const UnitArgs &args = {});

  Result Compute(const InputData &input,
                 suite::Context &context) const override;
};

class DatasetMissingValuesMetric : public ComputationalUnit {
public:
  static constexpr std::string_view TYPE = "DatasetMissingValuesMetric";

  explicit DatasetMissingValuesMetric(const UnitArgs &args = {});

  Result Compute(const InputData &input,
                 suite::Context &context) const override;
};

// count, missing, and for numeric columns mean/min/max, per dataset.
class ColumnSummaryMetric : public ComputationalUnit {
public:
  static constexpr std::string_view TYPE = "ColumnSummaryMetric";

  explicit ColumnSummaryMetric(const UnitArgs &args);
  explicit ColumnSummaryMetric(std::string column);

  Result Compute(const InputData &input,
                 suite::Context &context) const override;

  const std::string &GetColumn() const { return m_column; }

private:
  std::string m_column;
};

class ColumnQuantileMetric : public ComputationalUnit {
public:
  static constexpr std::string_view TYPE = "ColumnQuantileMetric";

  explicit ColumnQuantileMetric(const UnitArgs &args);
  ColumnQuantileMetric(std::string column, double quantile);

  std::vector<UnitPtr> GetDependencies() const override;

  Result Compute(const InputData &input,
                 suite::Context &context) const override;

private:
  std::string m_column;
  double m_quantile;
  UnitPtr m_summary;
};

// Passes when every current value of the column lies in [left, right].
class ColumnValueRangeTest : public ComputationalUnit {
public:
  static constexpr std::string_view TYPE = "ColumnValueRangeTest";

  explicit ColumnValueRangeTest(const UnitArgs &args);
  ColumnValueRangeTest(std::string column, double left, double right);

  std::vector<UnitPtr> GetDependencies() const override;

  Result Compute(const InputData &input,
                 suite::Context &context) const override;

private:
  std::string m_column;
  double m_left;
  double m_right;
  UnitPtr m_summary;
};

// Passes when the share of missing cells in current is below lt.
class ShareOfMissingValuesTest : public ComputationalUnit {
public:
  static constexpr std::string_view TYPE = "ShareOfMissingValuesTest";

  explicit ShareOfMissingValuesTest(const UnitArgs &args);
  explicit ShareOfMissingValuesTest(double lt);

  std::vector<UnitPtr> GetDependencies() const override;

  Result Compute(const InputData &input,
                 suite::Context &context) const override;

private:
  double m_lt;
  UnitPtr m_missing;
};

// DatasetSummaryMetric, DatasetMissingValuesMetric and a column summary per
// feature.
class DataQualityPreset : public IPreset {
public:
  explicit DataQualityPreset(
      epoch_core::ColumnSelection selection = epoch_core::ColumnSelection::All)
      : m_selection(selection) {}

  std::string GetName() const override { return "DataQualityPreset"; }

  std::vector<CheckItem> Generate(const InputData &input,
                                  const DatasetColumns &columns) const override;

private:
  epoch_core::ColumnSelection m_selection;
};

// Thresholds learned from the reference dataset, which must be present.
class DataStabilityTestPreset : public IPreset {
public:
  std::string GetName() const override { return "DataStabilityTestPreset"; }

  std::vector<CheckItem> Generate(const InputData &input,
                                  const DatasetColumns &columns) const override;
};

GeneratorPtr MakeColumnSummaryGenerator(epoch_core::ColumnSelection selection);

GeneratorPtr MakeColumnQuantileGenerator(double quantile,
                                         epoch_core::ColumnSelection selection);

void RegisterBuiltinUnits(UnitRegistry &registry);

void RegisterBuiltinItems(ItemFactoryRegistry &registry);

UnitRegistry CreateDefaultUnitRegistry();

ItemFactoryRegistry CreateDefaultItemFactoryRegistry();

} // namespace epoch_monitor::units
