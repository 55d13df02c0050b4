#pragma once
#include <epoch_core/enum_wrapper.h>
#include <epoch_monitor/suite/context.h>
#include <epoch_monitor/units/iunit.h>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

CREATE_ENUM(SuiteState, Uninitialized, Reset, Verified, Running, Complete,
            Failed);

namespace epoch_monitor::suite {

struct AdditionalFeatures {
  FeatureMap current;
  FeatureMap reference;
};

/**
 * @brief Execution engine shared by reports and test suites.
 *
 * Holds every registered unit in an arena ordered by insertion, which is also
 * the execution order. Dependencies are inserted ahead of their dependents and
 * a unit identity occupies exactly one slot.
 *
 * Uninitialized -> Reset -> Verified -> Running -> Complete (or Failed).
 */
class Suite {
public:
  Suite();

  void Reset();

  // Throws ConfigurationError when the current dataset is absent.
  void Verify(const InputData &input);

  // Returns the arena index of the unit, reusing the slot of an equal
  // identity. Binds the unit to this suite's context. Throws
  // ConfigurationError on a dependency cycle.
  size_t AddUnit(const units::UnitPtr &unit);

  [[nodiscard]] AdditionalFeatures
  CreateAdditionalFeatures(const InputData &input) const;

  // Computes every unit once, in arena order.
  void Run(const InputData &input);

  // Rebuilds a completed suite from persisted units and their results.
  void Restore(std::vector<units::UnitPtr> units, std::vector<Result> results);

  [[nodiscard]] epoch_core::SuiteState GetState() const { return m_state; }

  [[nodiscard]] const std::vector<units::UnitPtr> &GetUnits() const {
    return m_units;
  }

  [[nodiscard]] const units::UnitPtr &GetUnit(size_t index) const;

  [[nodiscard]] std::optional<size_t>
  IndexOf(const UnitIdentity &identity) const;

  [[nodiscard]] const Context &GetContext() const { return *m_context; }

  [[nodiscard]] std::shared_ptr<const Context> GetSharedContext() const {
    return m_context;
  }

private:
  epoch_core::SuiteState m_state{epoch_core::SuiteState::Uninitialized};
  ContextPtr m_context;
  std::vector<units::UnitPtr> m_units;
  std::unordered_map<UnitIdentity, size_t, UnitIdentityHash> m_index;
  std::unordered_set<UnitIdentity, UnitIdentityHash> m_registering;

  void AssertState(std::initializer_list<epoch_core::SuiteState> allowed,
                   std::string_view operation) const;
};

} // namespace epoch_monitor::suite
