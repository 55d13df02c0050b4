#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/units/unit_registry.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor::units {

void UnitRegistry::Register(const std::string &type, UnitFactory factory) {
  if (!m_factories.emplace(type, std::move(factory)).second) {
    throw std::runtime_error(
        fmt::format("Unit type {} is already registered", type));
  }
  SPDLOG_DEBUG("Registered unit type {}", type);
}

UnitPtr UnitRegistry::Create(const std::string &type,
                             const UnitArgs &args) const {
  auto it = m_factories.find(type);
  if (it == m_factories.end()) {
    throw NotFoundError(fmt::format("Unknown unit type: {}", type));
  }
  auto unit = it->second(args);
  if (!unit || unit->GetType() != type) {
    throw ConfigurationError(fmt::format(
        "Factory for {} produced a unit of type {}", type,
        unit ? unit->GetType() : std::string{"<null>"}));
  }
  return unit;
}

std::vector<std::string> UnitRegistry::GetTypes() const {
  std::vector<std::string> types;
  types.reserve(m_factories.size());
  for (const auto &[type, _] : m_factories) {
    types.push_back(type);
  }
  return types;
}

} // namespace epoch_monitor::units
