#include <epoch_monitor/config/report_config.h>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/report/report.h>
#include <epoch_monitor/report/test_suite.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor::config {

namespace {
epoch_core::UnitKind ParseKind(const std::string &kind, int line) {
  if (kind == KindPrefix(epoch_core::UnitKind::Metric)) {
    return epoch_core::UnitKind::Metric;
  }
  if (kind == KindPrefix(epoch_core::UnitKind::Test)) {
    return epoch_core::UnitKind::Test;
  }
  throw ConfigurationError(fmt::format(
      "Invalid report kind '{}' at line {}, expected metric or test", kind,
      line));
}

std::optional<std::string> OptionalString(const YAML::Node &node) {
  return node ? std::optional{node.as<std::string>()} : std::nullopt;
}
} // namespace

void ItemConfig::decode(const YAML::Node &element) {
  const auto line = element.Mark().line + 1;
  if (!element.IsMap()) {
    throw ConfigurationError(
        fmt::format("Report item at line {} must be a mapping", line));
  }

  const std::pair<const char *, epoch_core::ItemConfigType> keys[] = {
      {"unit", epoch_core::ItemConfigType::Unit},
      {"preset", epoch_core::ItemConfigType::Preset},
      {"generator", epoch_core::ItemConfigType::Generator}};

  type = epoch_core::ItemConfigType::Null;
  for (const auto &[key, itemType] : keys) {
    if (!element[key]) {
      continue;
    }
    if (type != epoch_core::ItemConfigType::Null) {
      throw ConfigurationError(fmt::format(
          "Report item at line {} names more than one of unit, preset, "
          "generator",
          line));
    }
    type = itemType;
    name = element[key].as<std::string>();
  }
  if (type == epoch_core::ItemConfigType::Null) {
    throw ConfigurationError(fmt::format(
        "Report item at line {} needs a unit, preset or generator", line));
  }
  args = UnitArgsFromYAML(element["args"]);
}

void ReportConfig::decode(const YAML::Node &element) {
  kind = ParseKind(element["kind"].as<std::string>("metric"),
                   element.Mark().line + 1);
  metadata = MetadataFromYAML(element["metadata"]);
  tags = element["tags"].as<Tags>(Tags{});
  batchSize = OptionalString(element["batch_size"]);
  datasetId = OptionalString(element["dataset_id"]);
  modelId = OptionalString(element["model_id"]);
  referenceId = OptionalString(element["reference_id"]);
  options = UnitArgsFromYAML(element["options"]);
  if (element["column_mapping"]) {
    columnMapping = element["column_mapping"].as<ColumnMapping>();
  }
  items = element["items"].as<std::vector<ItemConfig>>(std::vector<ItemConfig>{});
}

std::vector<units::CheckItem>
BuildItems(const ReportConfig &config, const units::UnitRegistry &unitRegistry,
           const units::ItemFactoryRegistry &itemRegistry) {
  std::vector<units::CheckItem> built;
  built.reserve(config.items.size());
  for (const auto &item : config.items) {
    switch (item.type) {
    case epoch_core::ItemConfigType::Unit:
      try {
        built.emplace_back(unitRegistry.Create(item.name, item.args));
      } catch (const NotFoundError &e) {
        throw ConfigurationError(e.what());
      }
      break;
    case epoch_core::ItemConfigType::Preset:
      built.emplace_back(itemRegistry.CreatePreset(item.name, item.args));
      break;
    case epoch_core::ItemConfigType::Generator:
      built.emplace_back(itemRegistry.CreateGenerator(item.name, item.args));
      break;
    default:
      throw ConfigurationError(
          fmt::format("Report item {} has no type", item.name));
    }
  }
  return built;
}

report::ReportBasePtr
BuildReport(const ReportConfig &config, const units::UnitRegistry &unitRegistry,
            const units::ItemFactoryRegistry &itemRegistry,
            std::shared_ptr<const render::RendererRegistry> renderers) {
  auto built = BuildItems(config, unitRegistry, itemRegistry);

  report::ReportBasePtr result;
  if (config.kind == epoch_core::UnitKind::Test) {
    result = std::make_unique<report::TestSuite>(std::move(built), config.options,
                                                 std::move(renderers));
  } else {
    result = std::make_unique<report::Report>(std::move(built), config.options,
                                              std::move(renderers));
  }

  for (const auto &[key, value] : config.metadata) {
    result->SetMetadata(key, value);
  }
  for (const auto &tag : config.tags) {
    result->AddTag(tag);
  }
  if (config.batchSize) {
    result->SetBatchSize(*config.batchSize);
  }
  if (config.datasetId) {
    result->SetDatasetId(*config.datasetId);
  }
  if (config.modelId) {
    result->SetModelId(*config.modelId);
  }
  if (config.referenceId) {
    result->SetReferenceId(*config.referenceId);
  }
  SPDLOG_DEBUG("Built {} with {} configured items", KindPrefix(config.kind),
               config.items.size());
  return result;
}

ReportConfig ReportConfigFromYAML(const std::string &yaml) {
  try {
    return YAML::Load(yaml).as<ReportConfig>();
  } catch (const YAML::Exception &e) {
    throw ConfigurationError(fmt::format("Invalid report config: {}", e.what()));
  }
}

ReportConfig LoadReportConfig(const std::filesystem::path &path) {
  try {
    return YAML::LoadFile(path.string()).as<ReportConfig>();
  } catch (const YAML::Exception &e) {
    throw ConfigurationError(
        fmt::format("Invalid report config {}: {}", path.string(), e.what()));
  }
}

} // namespace epoch_monitor::config
