#pragma once
#include <epoch_monitor/core/result.h>
#include <epoch_monitor/core/unit_identity.h>
#include <epoch_monitor/data/input_data.h>
#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace epoch_monitor::units {
struct IComputationalUnit;
}

namespace epoch_monitor::suite {

/**
 * @brief Per-run cache of unit results keyed by structural identity.
 *
 * An identity is computed at most once between two resets and its result is
 * never overwritten. Not thread safe; one run owns one context.
 */
class Context {
public:
  using ResultMap = std::unordered_map<UnitIdentity, Result, UnitIdentityHash>;

  [[nodiscard]] const Result *Find(const UnitIdentity &identity) const;

  [[nodiscard]] bool Contains(const UnitIdentity &identity) const {
    return m_results.contains(identity);
  }

  // Computes on the first request only. A failure surfaces as
  // ComputationError carrying the identity of the failing unit.
  const Result &GetOrCompute(const units::IComputationalUnit &unit,
                             const InputData &input);

  // Throws std::logic_error when the identity already holds a result.
  void Insert(const UnitIdentity &identity, Result result);

  void Reset();

  [[nodiscard]] size_t Size() const { return m_results.size(); }

  [[nodiscard]] const ResultMap &Results() const { return m_results; }

private:
  ResultMap m_results;
  std::unordered_set<UnitIdentity, UnitIdentityHash> m_inProgress;
};

using ContextPtr = std::shared_ptr<Context>;

} // namespace epoch_monitor::suite
