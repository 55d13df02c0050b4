#pragma once
#include <epoch_monitor/dashboard/panels.h>
#include <epoch_monitor/storage/snapshot_store.h>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace epoch_monitor::dashboard {

/**
 * @brief Named set of dashboard panels over one snapshot store.
 *
 * dateFrom/dateTo bound the snapshots a dashboard reads unless the caller
 * passes explicit bounds.
 */
struct Project {
  std::string id;
  std::string name;
  std::string description{};
  std::optional<Timestamp> dateFrom{};
  std::optional<Timestamp> dateTo{};
  std::vector<DashboardPanelPtr> panels{};

  Project &AddPanel(DashboardPanelPtr panel);

  // A panel that throws a MonitorError renders as an error widget; the
  // remaining panels still render.
  [[nodiscard]] proto::DashboardInfo
  BuildDashboard(const storage::SnapshotSeries &snapshots,
                 const AggregationRegistry &aggregations) const;

  [[nodiscard]] proto::DashboardInfo
  BuildDashboard(const storage::SnapshotStore &store,
                 const AggregationRegistry &aggregations,
                 std::optional<Timestamp> from = std::nullopt,
                 std::optional<Timestamp> to = std::nullopt) const;

  void decode(const YAML::Node &element);
};

glz::generic ToGeneric(const Project &project);

// Throws ConfigurationError on a malformed project document.
Project ProjectFromGeneric(const glz::generic &value);

} // namespace epoch_monitor::dashboard

namespace YAML {
template <> struct convert<epoch_monitor::dashboard::Project> {
  static bool decode(const Node &node, epoch_monitor::dashboard::Project &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
