#pragma once
#include <epoch_core/enum_wrapper.h>
#include <epoch_monitor/core/metadata.h>
#include <epoch_monitor/core/unit_args.h>
#include <epoch_monitor/data/column_mapping.h>
#include <epoch_monitor/report/report_base.h>
#include <epoch_monitor/units/items.h>
#include <epoch_monitor/units/unit_registry.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

CREATE_ENUM(ItemConfigType, Unit, Preset, Generator);

namespace epoch_monitor::config {

// One entry of "items": exactly one of unit, preset or generator.
struct ItemConfig {
  epoch_core::ItemConfigType type{epoch_core::ItemConfigType::Null};
  std::string name;
  UnitArgs args{};

  void decode(const YAML::Node &element);
};

/**
 * @brief Declarative report or test suite.
 *
 * @code{.yaml}
 * kind: metric
 * metadata: {type: data_quality}
 * tags: [nightly]
 * batch_size: daily
 * dataset_id: adult
 * column_mapping: {target: income, prediction: null}
 * items:
 *   - unit: ColumnQuantileMetric
 *     args: {column_name: age, quantile: 0.5}
 *   - preset: DataQualityPreset
 *   - generator: ColumnSummaryGenerator
 *     args: {columns: Numerical}
 * @endcode
 */
struct ReportConfig {
  epoch_core::UnitKind kind{epoch_core::UnitKind::Metric};
  Metadata metadata{};
  Tags tags{};
  std::optional<std::string> batchSize{};
  std::optional<std::string> datasetId{};
  std::optional<std::string> modelId{};
  std::optional<std::string> referenceId{};
  report::ReportOptions options{};
  ColumnMapping columnMapping{};
  std::vector<ItemConfig> items{};

  void decode(const YAML::Node &element);
};

// Throws ConfigurationError for unknown names or invalid arguments.
std::vector<units::CheckItem>
BuildItems(const ReportConfig &config, const units::UnitRegistry &unitRegistry,
           const units::ItemFactoryRegistry &itemRegistry);

// A Report or TestSuite ready to run, metadata and tags applied.
report::ReportBasePtr
BuildReport(const ReportConfig &config, const units::UnitRegistry &unitRegistry,
            const units::ItemFactoryRegistry &itemRegistry,
            std::shared_ptr<const render::RendererRegistry> renderers = nullptr);

// Parse errors surface as ConfigurationError.
ReportConfig ReportConfigFromYAML(const std::string &yaml);

ReportConfig LoadReportConfig(const std::filesystem::path &path);

} // namespace epoch_monitor::config

namespace YAML {
template <> struct convert<epoch_monitor::config::ItemConfig> {
  static bool decode(const Node &node, epoch_monitor::config::ItemConfig &t) {
    t.decode(node);
    return true;
  }
};

template <> struct convert<epoch_monitor::config::ReportConfig> {
  static bool decode(const Node &node, epoch_monitor::config::ReportConfig &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
