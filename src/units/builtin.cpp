#include <algorithm>
#include <arrow/compute/api.h>
#include <epoch_frame/series.h>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/suite/context.h>
#include <epoch_monitor/units/builtin.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor::units {

namespace {
glz::generic MakeObject() {
  glz::generic out;
  out.data = glz::generic::object_t{};
  return out;
}

glz::generic MakeNull() {
  glz::generic out;
  out.data = nullptr;
  return out;
}

size_t CountValid(const epoch_frame::DataFrame &df, const std::string &column) {
  return df[column].drop_null().size();
}

void AssertHasColumn(const epoch_frame::DataFrame &df,
                     const std::string &column, std::string_view dataset) {
  const auto columns = df.column_names();
  if (std::ranges::find(columns, column) == columns.end()) {
    throw ConfigurationError(
        fmt::format("Column '{}' not found in {} data", column, dataset));
  }
}

size_t CountMissing(const epoch_frame::DataFrame &df) {
  size_t missing = 0;
  for (const auto &column : df.column_names()) {
    missing += df.num_rows() - CountValid(df, column);
  }
  return missing;
}

glz::generic DatasetSummary(const epoch_frame::DataFrame &df) {
  auto out = MakeObject();
  size_t numeric = 0;
  const auto columns = df.column_names();
  for (const auto &column : columns) {
    numeric += IsNumericColumn(df, column) ? 1 : 0;
  }
  out["number_of_rows"] = static_cast<double>(df.num_rows());
  out["number_of_columns"] = static_cast<double>(columns.size());
  out["number_of_numeric_columns"] = static_cast<double>(numeric);
  out["number_of_categorical_columns"] =
      static_cast<double>(columns.size() - numeric);
  out["number_of_missing_values"] = static_cast<double>(CountMissing(df));
  return out;
}

glz::generic MissingValues(const epoch_frame::DataFrame &df) {
  auto out = MakeObject();
  auto perColumn = MakeObject();
  const auto columns = df.column_names();
  size_t missing = 0;
  for (const auto &column : columns) {
    const auto columnMissing = df.num_rows() - CountValid(df, column);
    perColumn[column] = static_cast<double>(columnMissing);
    missing += columnMissing;
  }
  const auto cells = df.num_rows() * columns.size();
  out["number_of_rows"] = static_cast<double>(df.num_rows());
  out["number_of_missing_values"] = static_cast<double>(missing);
  out["share_of_missing_values"] =
      cells == 0 ? 0.0 : static_cast<double>(missing) / static_cast<double>(cells);
  out["number_of_missing_values_by_column"] = std::move(perColumn);
  return out;
}

glz::generic ColumnSummary(const epoch_frame::DataFrame &df,
                           const std::string &column) {
  auto out = MakeObject();
  const auto valid = CountValid(df, column);
  out["count"] = static_cast<double>(valid);
  out["missing"] = static_cast<double>(df.num_rows() - valid);
  if (!IsNumericColumn(df, column)) {
    return out;
  }
  if (valid == 0) {
    out["mean"] = MakeNull();
    out["min"] = MakeNull();
    out["max"] = MakeNull();
    return out;
  }
  const auto series = df[column];
  out["mean"] = series.mean().as_double();
  out["min"] = series.min().as_double();
  out["max"] = series.max().as_double();
  return out;
}

glz::generic Quantile(const epoch_frame::DataFrame &df,
                      const std::string &column, double quantile) {
  auto out = MakeObject();
  if (CountValid(df, column) == 0) {
    out["value"] = MakeNull();
    return out;
  }
  out["value"] = df[column]
                     .quantile(arrow::compute::QuantileOptions{quantile})
                     .as_double();
  return out;
}

std::string RequireString(const UnitArgs &args, const std::string &key,
                          std::string_view type) {
  auto it = args.find(key);
  if (it == args.end() || !it->second.IsType<std::string>()) {
    throw ConfigurationError(
        fmt::format("{} requires string argument '{}'", type, key));
  }
  return it->second.GetString();
}

double RequireDecimal(const UnitArgs &args, const std::string &key,
                      std::string_view type) {
  auto it = args.find(key);
  if (it == args.end() || !it->second.IsType<double>()) {
    throw ConfigurationError(
        fmt::format("{} requires numeric argument '{}'", type, key));
  }
  return it->second.GetDecimal();
}

epoch_core::ColumnSelection SelectionFromArgs(const UnitArgs &args) {
  auto it = args.find("columns");
  if (it == args.end()) {
    return epoch_core::ColumnSelection::All;
  }
  auto selection = epoch_core::ColumnSelection::Null;
  try {
    selection =
        epoch_core::ColumnSelectionWrapper::FromString(it->second.GetString());
  } catch (const std::exception &e) {
    throw ConfigurationError(fmt::format("Invalid column selection '{}': {}",
                                         it->second.ToString(), e.what()));
  }
  if (selection == epoch_core::ColumnSelection::Null) {
    throw ConfigurationError(
        fmt::format("Invalid column selection '{}'", it->second.GetString()));
  }
  return selection;
}
} // namespace

DatasetSummaryMetric::DatasetSummaryMetric(const UnitArgs &args)
    : ComputationalUnit(std::string{TYPE}, args, epoch_core::UnitKind::Metric) {}

Result DatasetSummaryMetric::Compute(const InputData &input,
                                     suite::Context &) const {
  auto payload = MakeObject();
  payload["current"] = DatasetSummary(input.Current());
  if (input.reference) {
    payload["reference"] = DatasetSummary(*input.reference);
  }
  return Result{std::move(payload)};
}

DatasetMissingValuesMetric::DatasetMissingValuesMetric(const UnitArgs &args)
    : ComputationalUnit(std::string{TYPE}, args, epoch_core::UnitKind::Metric) {}

Result DatasetMissingValuesMetric::Compute(const InputData &input,
                                           suite::Context &) const {
  auto payload = MakeObject();
  payload["current"] = MissingValues(input.Current());
  if (input.reference) {
    payload["reference"] = MissingValues(*input.reference);
  }
  return Result{std::move(payload)};
}

ColumnSummaryMetric::ColumnSummaryMetric(const UnitArgs &args)
    : ComputationalUnit(std::string{TYPE}, args, epoch_core::UnitKind::Metric),
      m_column(RequireString(args, "column_name", TYPE)) {}

ColumnSummaryMetric::ColumnSummaryMetric(std::string column)
    : ColumnSummaryMetric(UnitArgs{{"column_name", ArgValue{std::move(column)}}}) {}

Result ColumnSummaryMetric::Compute(const InputData &input,
                                    suite::Context &) const {
  const auto &current = input.Current();
  AssertHasColumn(current, m_column, "current");

  auto payload = MakeObject();
  payload["column_name"] = m_column;
  payload["column_type"] =
      std::string{IsNumericColumn(current, m_column) ? "num" : "cat"};
  payload["current"] = ColumnSummary(current, m_column);
  if (input.reference) {
    AssertHasColumn(*input.reference, m_column, "reference");
    payload["reference"] = ColumnSummary(*input.reference, m_column);
  }
  return Result{std::move(payload)};
}

ColumnQuantileMetric::ColumnQuantileMetric(const UnitArgs &args)
    : ComputationalUnit(std::string{TYPE}, args, epoch_core::UnitKind::Metric),
      m_column(RequireString(args, "column_name", TYPE)),
      m_quantile(RequireDecimal(args, "quantile", TYPE)),
      m_summary(std::make_shared<ColumnSummaryMetric>(m_column)) {
  if (m_quantile <= 0.0 || m_quantile >= 1.0) {
    throw ConfigurationError(fmt::format(
        "ColumnQuantileMetric quantile must be in (0, 1), got {}", m_quantile));
  }
}

ColumnQuantileMetric::ColumnQuantileMetric(std::string column, double quantile)
    : ColumnQuantileMetric(UnitArgs{{"column_name", ArgValue{std::move(column)}},
                                    {"quantile", ArgValue{quantile}}}) {}

std::vector<UnitPtr> ColumnQuantileMetric::GetDependencies() const {
  return {m_summary};
}

Result ColumnQuantileMetric::Compute(const InputData &input,
                                     suite::Context &context) const {
  const auto &summary = GetDependencyResult(*m_summary, input, context);
  if (summary.Get("column_type").get_string() != "num") {
    throw ConfigurationError(fmt::format(
        "ColumnQuantileMetric requires a numeric column, '{}' is categorical",
        m_column));
  }

  auto payload = MakeObject();
  payload["column_name"] = m_column;
  payload["quantile"] = m_quantile;
  payload["current"] = Quantile(input.Current(), m_column, m_quantile);
  if (input.reference) {
    payload["reference"] = Quantile(*input.reference, m_column, m_quantile);
  }
  return Result{std::move(payload)};
}

ColumnValueRangeTest::ColumnValueRangeTest(const UnitArgs &args)
    : ComputationalUnit(std::string{TYPE}, args, epoch_core::UnitKind::Test),
      m_column(RequireString(args, "column_name", TYPE)),
      m_left(RequireDecimal(args, "left", TYPE)),
      m_right(RequireDecimal(args, "right", TYPE)),
      m_summary(std::make_shared<ColumnSummaryMetric>(m_column)) {
  if (m_left > m_right) {
    throw ConfigurationError(fmt::format(
        "ColumnValueRangeTest left ({}) exceeds right ({})", m_left, m_right));
  }
}

ColumnValueRangeTest::ColumnValueRangeTest(std::string column, double left,
                                           double right)
    : ColumnValueRangeTest(UnitArgs{{"column_name", ArgValue{std::move(column)}},
                                    {"left", ArgValue{left}},
                                    {"right", ArgValue{right}}}) {}

std::vector<UnitPtr> ColumnValueRangeTest::GetDependencies() const {
  return {m_summary};
}

Result ColumnValueRangeTest::Compute(const InputData &input,
                                     suite::Context &context) const {
  const auto &summary = GetDependencyResult(*m_summary, input, context);
  auto parameters = MakeObject();
  parameters["left"] = m_left;
  parameters["right"] = m_right;

  if (!summary.Contains("current.min") ||
      !std::holds_alternative<double>(summary.Get("current.min").data)) {
    return Result{MakeTestPayload(
        epoch_core::TestStatus::Error,
        fmt::format("Column '{}' has no numeric values to check", m_column),
        std::move(parameters))};
  }

  const auto minimum = summary.GetNumber("current.min");
  const auto maximum = summary.GetNumber("current.max");
  parameters["min"] = minimum;
  parameters["max"] = maximum;
  const bool inRange = minimum >= m_left && maximum <= m_right;
  return Result{MakeTestPayload(
      inRange ? epoch_core::TestStatus::Success : epoch_core::TestStatus::Fail,
      fmt::format("Values of column '{}' span [{}, {}]; expected within [{}, {}]",
                  m_column, minimum, maximum, m_left, m_right),
      std::move(parameters))};
}

ShareOfMissingValuesTest::ShareOfMissingValuesTest(const UnitArgs &args)
    : ComputationalUnit(std::string{TYPE}, args, epoch_core::UnitKind::Test),
      m_lt(RequireDecimal(args, "lt", TYPE)),
      m_missing(std::make_shared<DatasetMissingValuesMetric>()) {}

ShareOfMissingValuesTest::ShareOfMissingValuesTest(double lt)
    : ShareOfMissingValuesTest(UnitArgs{{"lt", ArgValue{lt}}}) {}

std::vector<UnitPtr> ShareOfMissingValuesTest::GetDependencies() const {
  return {m_missing};
}

Result ShareOfMissingValuesTest::Compute(const InputData &input,
                                         suite::Context &context) const {
  const auto &missing = GetDependencyResult(*m_missing, input, context);
  const auto share = missing.GetNumber("current.share_of_missing_values");

  auto parameters = MakeObject();
  parameters["lt"] = m_lt;
  parameters["value"] = share;
  return Result{MakeTestPayload(
      share < m_lt ? epoch_core::TestStatus::Success
                   : epoch_core::TestStatus::Fail,
      fmt::format("Share of missing values is {:.4f}; expected below {}", share,
                  m_lt),
      std::move(parameters))};
}

std::vector<CheckItem>
DataQualityPreset::Generate(const InputData &, const DatasetColumns &) const {
  return {std::make_shared<DatasetSummaryMetric>(),
          std::make_shared<DatasetMissingValuesMetric>(),
          MakeColumnSummaryGenerator(m_selection)};
}

std::vector<CheckItem>
DataStabilityTestPreset::Generate(const InputData &input,
                                  const DatasetColumns &columns) const {
  if (!input.reference) {
    throw ConfigurationError(
        "DataStabilityTestPreset requires a reference dataset");
  }
  const auto &reference = *input.reference;

  auto referenceMissing = MissingValues(reference);
  const auto referenceShare = std::get<double>(
      referenceMissing.get_object().at("share_of_missing_values").data);

  std::vector<CheckItem> items;
  items.emplace_back(std::make_shared<ShareOfMissingValuesTest>(
      std::min(1.0, referenceShare + 0.05)));

  for (const auto &column : columns.numericalFeatures) {
    AssertHasColumn(reference, column, "reference");
    if (CountValid(reference, column) == 0) {
      SPDLOG_WARN("Skipping range test for '{}': no reference values", column);
      continue;
    }
    const auto series = reference[column];
    items.emplace_back(std::make_shared<ColumnValueRangeTest>(
        column, series.min().as_double(), series.max().as_double()));
  }
  return items;
}

GeneratorPtr MakeColumnSummaryGenerator(epoch_core::ColumnSelection selection) {
  return MakeColumnGenerator<ColumnSummaryMetric>("ColumnSummaryGenerator",
                                                  selection);
}

GeneratorPtr MakeColumnQuantileGenerator(double quantile,
                                         epoch_core::ColumnSelection selection) {
  return MakeColumnGenerator<ColumnQuantileMetric>("ColumnQuantileGenerator",
                                                   selection, quantile);
}

void RegisterBuiltinUnits(UnitRegistry &registry) {
  registry.Register<DatasetSummaryMetric>();
  registry.Register<DatasetMissingValuesMetric>();
  registry.Register<ColumnSummaryMetric>();
  registry.Register<ColumnQuantileMetric>();
  registry.Register<ColumnValueRangeTest>();
  registry.Register<ShareOfMissingValuesTest>();
}

void RegisterBuiltinItems(ItemFactoryRegistry &registry) {
  registry.RegisterPreset("DataQualityPreset", [](const UnitArgs &args) {
    return std::make_shared<DataQualityPreset>(SelectionFromArgs(args));
  });
  registry.RegisterPreset("DataStabilityTestPreset", [](const UnitArgs &) {
    return std::make_shared<DataStabilityTestPreset>();
  });
  registry.RegisterGenerator("ColumnSummaryGenerator", [](const UnitArgs &args) {
    return MakeColumnSummaryGenerator(SelectionFromArgs(args));
  });
  registry.RegisterGenerator(
      "ColumnQuantileGenerator", [](const UnitArgs &args) {
        return MakeColumnQuantileGenerator(
            RequireDecimal(args, "quantile", "ColumnQuantileGenerator"),
            SelectionFromArgs(args));
      });
}

UnitRegistry CreateDefaultUnitRegistry() {
  UnitRegistry registry;
  RegisterBuiltinUnits(registry);
  return registry;
}

ItemFactoryRegistry CreateDefaultItemFactoryRegistry() {
  ItemFactoryRegistry registry;
  RegisterBuiltinItems(registry);
  return registry;
}

} // namespace epoch_monitor::units
