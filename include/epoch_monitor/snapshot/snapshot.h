#pragma once
#include <epoch_monitor/core/metadata.h>
#include <epoch_monitor/core/result.h>
#include <epoch_monitor/core/timestamp.h>
#include <epoch_monitor/core/unit_identity.h>
#include <epoch_monitor/report/report_base.h>
#include <epoch_monitor/units/unit_registry.h>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace epoch_monitor::snapshot {

struct SnapshotUnit {
  std::string type;
  UnitArgs args;
  Result result;

  [[nodiscard]] UnitIdentity GetIdentity() const { return {type, args}; }

  bool operator==(const SnapshotUnit &) const = default;
};

/**
 * @brief Portable record of a completed report or test suite.
 *
 * Holds every unit of the suite arena (dependencies included) with its
 * result; first_level_indices are offsets into units.
 */
struct Snapshot {
  std::string id;
  Timestamp timestamp{};
  epoch_core::UnitKind kind{epoch_core::UnitKind::Metric};
  Metadata metadata{};
  Tags tags{};
  report::ReportOptions options{};
  std::vector<SnapshotUnit> units{};
  std::vector<size_t> firstLevelIndices{};

  // First unit matching the type whose args contain the template.
  [[nodiscard]] const SnapshotUnit *
  FindUnit(const std::string &type, const UnitArgs &argsTemplate = {}) const;

  bool operator==(const Snapshot &) const = default;
};

Snapshot Capture(const report::ReportBase &report);

// Throws CorruptSnapshotError on an out-of-range index, an unknown unit type,
// invalid unit arguments or a duplicated unit identity.
report::ReportBasePtr
Restore(const Snapshot &snapshot, const units::UnitRegistry &registry,
        std::shared_ptr<const render::RendererRegistry> renderers = nullptr);

std::string ToJson(const Snapshot &snapshot);

// Throws CorruptSnapshotError on malformed input.
Snapshot FromJson(std::string_view json);

void SaveSnapshot(const Snapshot &snapshot, const std::filesystem::path &path);

Snapshot LoadSnapshot(const std::filesystem::path &path);

void SaveReport(const report::ReportBase &report,
                const std::filesystem::path &path);

report::ReportBasePtr
LoadReport(const std::filesystem::path &path,
           const units::UnitRegistry &registry,
           std::shared_ptr<const render::RendererRegistry> renderers = nullptr);

} // namespace epoch_monitor::snapshot
