#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/units/items.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor::units {

std::string DescribeItem(const CheckItem &item) {
  return std::visit(
      [](const auto &ptr) -> std::string {
        using K = std::decay_t<decltype(ptr)>;
        if (!ptr) {
          return "<null>";
        }
        if constexpr (std::is_same_v<K, UnitPtr>) {
          return fmt::format("unit {}", ptr->GetIdentity().ToString());
        } else if constexpr (std::is_same_v<K, PresetPtr>) {
          return fmt::format("preset {}", ptr->GetName());
        } else {
          return fmt::format("generator {}", ptr->GetName());
        }
      },
      item);
}

std::vector<std::string> SelectColumns(const DatasetColumns &columns,
                                       epoch_core::ColumnSelection selection) {
  switch (selection) {
  case epoch_core::ColumnSelection::Numerical:
    return columns.numericalFeatures;
  case epoch_core::ColumnSelection::Categorical:
    return columns.categoricalFeatures;
  case epoch_core::ColumnSelection::All:
    return columns.AllFeatures();
  default:
    break;
  }
  throw ConfigurationError(
      fmt::format("Invalid column selection: {}",
                  epoch_core::ColumnSelectionWrapper::ToString(selection)));
}

std::vector<CheckItem>
ColumnGenerator::Generate(const DatasetColumns &columns) const {
  const auto selected = m_columns ? *m_columns : SelectColumns(columns, m_selection);
  std::vector<CheckItem> result;
  result.reserve(selected.size());
  for (const auto &column : selected) {
    result.emplace_back(m_factory(column));
  }
  SPDLOG_DEBUG("Generator {} emitted {} units", m_name, result.size());
  return result;
}

void ItemFactoryRegistry::RegisterPreset(const std::string &name,
                                         PresetFactory factory) {
  if (!m_presets.emplace(name, std::move(factory)).second) {
    throw std::runtime_error(
        fmt::format("Preset {} is already registered", name));
  }
}

void ItemFactoryRegistry::RegisterGenerator(const std::string &name,
                                            GeneratorFactory factory) {
  if (!m_generators.emplace(name, std::move(factory)).second) {
    throw std::runtime_error(
        fmt::format("Generator {} is already registered", name));
  }
}

PresetPtr ItemFactoryRegistry::CreatePreset(const std::string &name,
                                            const UnitArgs &args) const {
  auto it = m_presets.find(name);
  if (it == m_presets.end()) {
    throw ConfigurationError(fmt::format("Unknown preset: {}", name));
  }
  return it->second(args);
}

GeneratorPtr ItemFactoryRegistry::CreateGenerator(const std::string &name,
                                                  const UnitArgs &args) const {
  auto it = m_generators.find(name);
  if (it == m_generators.end()) {
    throw ConfigurationError(fmt::format("Unknown generator: {}", name));
  }
  return it->second(args);
}

} // namespace epoch_monitor::units
