#pragma once
#include <epoch_monitor/dashboard/project.h>
#include <epoch_monitor/report/report_base.h>
#include <epoch_monitor/snapshot/snapshot.h>
#include <epoch_monitor/storage/snapshot_store.h>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace epoch_monitor::workspace {

inline constexpr std::string_view PROJECT_FILE = "project.json";
inline constexpr std::string_view SNAPSHOTS_DIR = "snapshots";

/**
 * @brief Root directory of projects.
 *
 * Layout:
 *   <root>/<project id>/project.json
 *   <root>/<project id>/snapshots/<snapshot id>.json
 *
 * Projects found under the root are loaded on construction. Every mutation
 * is written through to disk. Not safe for concurrent writers.
 */
class Workspace {
public:
  // Creates the root directory when missing.
  explicit Workspace(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path &GetRoot() const { return m_root; }

  dashboard::Project &CreateProject(const std::string &name,
                                    const std::string &description = "");

  // Assigns an id when the project has none. Throws ConfigurationError when
  // the id is already used.
  dashboard::Project &AddProject(dashboard::Project project);

  // Throws NotFoundError for an unknown id.
  [[nodiscard]] const dashboard::Project &
  GetProject(const std::string &projectId) const;

  // Ordered by id.
  [[nodiscard]] std::vector<const dashboard::Project *> ListProjects() const;

  // Projects whose name equals the given one.
  [[nodiscard]] std::vector<const dashboard::Project *>
  SearchProjects(const std::string &name) const;

  // Replaces name, description, date range and panels of the stored project
  // with the same id.
  void UpdateProjectInfo(const dashboard::Project &project);

  std::filesystem::path AddSnapshot(const std::string &projectId,
                                    const snapshot::Snapshot &snapshot);

  std::filesystem::path AddReport(const std::string &projectId,
                                  const report::ReportBase &report);

  // Throws NotFoundError for an unknown project or snapshot.
  [[nodiscard]] snapshot::Snapshot
  GetSnapshot(const std::string &projectId,
              const std::string &snapshotId) const;

  // Ordered by timestamp, then by file name.
  [[nodiscard]] std::vector<snapshot::Snapshot>
  ListSnapshots(const std::string &projectId) const;

  [[nodiscard]] storage::SnapshotStore
  GetSnapshotStore(const std::string &projectId) const;

  [[nodiscard]] proto::DashboardInfo
  BuildDashboard(const std::string &projectId,
                 const dashboard::AggregationRegistry &aggregations,
                 std::optional<Timestamp> from = std::nullopt,
                 std::optional<Timestamp> to = std::nullopt) const;

private:
  std::filesystem::path m_root;
  std::map<std::string, dashboard::Project> m_projects;

  [[nodiscard]] std::filesystem::path
  ProjectDirectory(const std::string &projectId) const;

  void LoadProjects();

  void SaveProject(const dashboard::Project &project) const;

  dashboard::Project &FindProject(const std::string &projectId);
};

} // namespace epoch_monitor::workspace
