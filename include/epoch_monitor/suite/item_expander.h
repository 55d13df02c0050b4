#pragma once
#include <epoch_monitor/core/metadata.h>
#include <epoch_monitor/units/items.h>
#include <string>
#include <vector>

namespace epoch_monitor::suite {

struct ExpansionResult {
  std::vector<units::UnitPtr> units;
  std::vector<std::string> presets;    // names in expansion order
  std::vector<std::string> generators; // top-level generators only
};

/**
 * @brief Flattens a declarative check list into units of one kind.
 *
 * Bare units pass through, generators emit units, presets emit units and
 * generators (resolved one level deep). Any other emission raises
 * GenerationError before anything is committed.
 */
class ItemExpander {
public:
  explicit ItemExpander(epoch_core::UnitKind kind) : m_kind(kind) {}

  [[nodiscard]] ExpansionResult
  Expand(const std::vector<units::CheckItem> &items, const InputData &input,
         const DatasetColumns &columns) const;

  // Appends preset and generator names under "<kind>_presets" and
  // "<kind>_generators".
  void RecordProvenance(const ExpansionResult &result,
                        Metadata &metadata) const;

  epoch_core::UnitKind GetKind() const { return m_kind; }

private:
  epoch_core::UnitKind m_kind;

  void ExpandGenerator(const units::IGenerator &generator,
                       const DatasetColumns &columns,
                       ExpansionResult &out) const;

  void AppendUnit(const units::UnitPtr &unit, std::string_view origin,
                  ExpansionResult &out) const;
};

} // namespace epoch_monitor::suite
