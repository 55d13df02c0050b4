#include <algorithm>
#include <epoch_core/macros.h>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/suite/suite.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace epoch_monitor::suite {

Suite::Suite() : m_context(std::make_shared<Context>()) {}

void Suite::AssertState(std::initializer_list<epoch_core::SuiteState> allowed,
                        std::string_view operation) const {
  if (std::ranges::find(allowed, m_state) == allowed.end()) {
    throw std::logic_error(
        fmt::format("Suite::{} is not allowed in state {}", operation,
                    epoch_core::SuiteStateWrapper::ToString(m_state)));
  }
}

void Suite::Reset() {
  // Units handed out earlier keep their results; the new run gets a fresh
  // context.
  m_context = std::make_shared<Context>();
  m_units.clear();
  m_index.clear();
  m_registering.clear();
  m_state = epoch_core::SuiteState::Reset;
}

void Suite::Verify(const InputData &input) {
  AssertState({epoch_core::SuiteState::Reset}, "Verify");
  if (!input.current) {
    throw ConfigurationError("Current dataset should be present");
  }
  m_state = epoch_core::SuiteState::Verified;
}

size_t Suite::AddUnit(const units::UnitPtr &unit) {
  AssertState({epoch_core::SuiteState::Reset, epoch_core::SuiteState::Verified},
              "AddUnit");
  AssertFromStream(unit != nullptr, "Suite::AddUnit received a null unit");

  if (auto it = m_index.find(unit->GetIdentity()); it != m_index.end()) {
    unit->SetContext(m_context);
    return it->second;
  }

  const auto &identity = unit->GetIdentity();
  if (!m_registering.insert(identity).second) {
    throw ConfigurationError(fmt::format(
        "Cyclic dependency detected while registering {}", identity.ToString()));
  }
  try {
    for (const auto &dependency : unit->GetDependencies()) {
      AddUnit(dependency);
    }
  } catch (...) {
    m_registering.erase(identity);
    throw;
  }
  m_registering.erase(identity);

  const auto index = m_units.size();
  m_units.push_back(unit);
  m_index.emplace(identity, index);
  unit->SetContext(m_context);
  SPDLOG_DEBUG("Registered unit {} at index {}", identity.ToString(), index);
  return index;
}

AdditionalFeatures
Suite::CreateAdditionalFeatures(const InputData &input) const {
  AdditionalFeatures features;
  std::unordered_set<std::string> seen;
  for (const auto &unit : m_units) {
    for (const auto &generator : unit->RequiredFeatures()) {
      const auto featureId = generator->GetFeatureId();
      if (!seen.insert(featureId).second) {
        continue;
      }
      features.current.emplace(
          featureId, generator->Generate(input.Current(), input.definition));
      if (input.reference) {
        features.reference.emplace(
            featureId, generator->Generate(*input.reference, input.definition));
      }
    }
  }
  SPDLOG_DEBUG("Generated {} additional features", seen.size());
  return features;
}

void Suite::Run(const InputData &input) {
  AssertState({epoch_core::SuiteState::Verified}, "Run");
  m_state = epoch_core::SuiteState::Running;
  SPDLOG_DEBUG("Running {} units", m_units.size());

  try {
    for (const auto &unit : m_units) {
      m_context->GetOrCompute(*unit, input);
    }
  } catch (const std::exception &exp) {
    m_state = epoch_core::SuiteState::Failed;
    SPDLOG_ERROR("Suite run failed: {}", exp.what());
    throw;
  }
  m_state = epoch_core::SuiteState::Complete;
}

void Suite::Restore(std::vector<units::UnitPtr> units,
                    std::vector<Result> results) {
  AssertFromStream(units.size() == results.size(),
                   "Suite::Restore requires one result per unit, got "
                       << units.size() << " units and " << results.size()
                       << " results");
  Reset();
  for (size_t i = 0; i < units.size(); ++i) {
    const auto &identity = units[i]->GetIdentity();
    if (!m_index.emplace(identity, i).second) {
      throw CorruptSnapshotError(
          fmt::format("Duplicate unit {} in snapshot", identity.ToString()));
    }
    m_context->Insert(identity, std::move(results[i]));
    units[i]->SetContext(m_context);
  }
  m_units = std::move(units);
  m_state = epoch_core::SuiteState::Complete;
}

const units::UnitPtr &Suite::GetUnit(size_t index) const {
  if (index >= m_units.size()) {
    throw std::out_of_range(fmt::format(
        "Unit index {} out of range ({} units)", index, m_units.size()));
  }
  return m_units[index];
}

std::optional<size_t> Suite::IndexOf(const UnitIdentity &identity) const {
  auto it = m_index.find(identity);
  if (it == m_index.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace epoch_monitor::suite
