#include <algorithm>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/workspace/workspace.h>
#include <fmt/format.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <sstream>

namespace epoch_monitor::workspace {

Workspace::Workspace(std::filesystem::path root) : m_root(std::move(root)) {
  std::filesystem::create_directories(m_root);
  LoadProjects();
}

std::filesystem::path
Workspace::ProjectDirectory(const std::string &projectId) const {
  return m_root / projectId;
}

void Workspace::LoadProjects() {
  for (const auto &entry : std::filesystem::directory_iterator(m_root)) {
    const auto file = entry.path() / PROJECT_FILE;
    if (!entry.is_directory() || !std::filesystem::is_regular_file(file)) {
      continue;
    }

    std::ifstream in(file);
    std::stringstream buffer;
    buffer << in.rdbuf();
    const auto text = buffer.str();

    glz::generic document;
    if (auto ec = glz::read_json(document, text)) {
      throw ConfigurationError(fmt::format("Cannot parse {}: {}", file.string(),
                                           glz::format_error(ec, text)));
    }
    auto project = dashboard::ProjectFromGeneric(document);
    const auto id = project.id;
    m_projects.insert_or_assign(id, std::move(project));
  }
  SPDLOG_INFO("Loaded {} projects from workspace {}", m_projects.size(),
              m_root.string());
}

void Workspace::SaveProject(const dashboard::Project &project) const {
  const auto directory = ProjectDirectory(project.id);
  std::filesystem::create_directories(directory / SNAPSHOTS_DIR);

  auto json = glz::write<glz::opts{.prettify = true}>(
      dashboard::ToGeneric(project));
  if (!json) {
    throw MonitorError(fmt::format("Failed to serialize project {}: {}",
                                   project.id, glz::format_error(json.error())));
  }

  const auto file = directory / PROJECT_FILE;
  std::ofstream out(file, std::ios::trunc);
  out << json.value();
  if (!out) {
    throw MonitorError(fmt::format("Failed to write {}", file.string()));
  }
}

dashboard::Project &Workspace::FindProject(const std::string &projectId) {
  auto it = m_projects.find(projectId);
  if (it == m_projects.end()) {
    throw NotFoundError(fmt::format("Project {} not found in workspace {}",
                                    projectId, m_root.string()));
  }
  return it->second;
}

dashboard::Project &Workspace::CreateProject(const std::string &name,
                                             const std::string &description) {
  return AddProject(dashboard::Project{.name = name, .description = description});
}

dashboard::Project &Workspace::AddProject(dashboard::Project project) {
  if (project.id.empty()) {
    project.id = report::GenerateId();
  }
  if (m_projects.contains(project.id)) {
    throw ConfigurationError(
        fmt::format("Project {} already exists", project.id));
  }
  SaveProject(project);
  SPDLOG_INFO("Added project {} ({})", project.name, project.id);
  const auto id = project.id;
  return m_projects.emplace(id, std::move(project)).first->second;
}

const dashboard::Project &
Workspace::GetProject(const std::string &projectId) const {
  auto it = m_projects.find(projectId);
  if (it == m_projects.end()) {
    throw NotFoundError(fmt::format("Project {} not found in workspace {}",
                                    projectId, m_root.string()));
  }
  return it->second;
}

std::vector<const dashboard::Project *> Workspace::ListProjects() const {
  std::vector<const dashboard::Project *> projects;
  projects.reserve(m_projects.size());
  for (const auto &[_, project] : m_projects) {
    projects.push_back(&project);
  }
  return projects;
}

std::vector<const dashboard::Project *>
Workspace::SearchProjects(const std::string &name) const {
  std::vector<const dashboard::Project *> matches;
  for (const auto &[_, project] : m_projects) {
    if (project.name == name) {
      matches.push_back(&project);
    }
  }
  return matches;
}

void Workspace::UpdateProjectInfo(const dashboard::Project &project) {
  auto &stored = FindProject(project.id);
  auto updated = stored;
  updated.name = project.name;
  updated.description = project.description;
  updated.dateFrom = project.dateFrom;
  updated.dateTo = project.dateTo;
  updated.panels = project.panels;
  SaveProject(updated);
  stored = std::move(updated);
}

std::filesystem::path
Workspace::AddSnapshot(const std::string &projectId,
                       const snapshot::Snapshot &snapshot) {
  const auto &project = GetProject(projectId);
  auto path = GetSnapshotStore(project.id).Save(snapshot);
  SPDLOG_DEBUG("Added snapshot {} to project {}", snapshot.id, projectId);
  return path;
}

std::filesystem::path Workspace::AddReport(const std::string &projectId,
                                           const report::ReportBase &report) {
  return AddSnapshot(projectId, snapshot::Capture(report));
}

snapshot::Snapshot Workspace::GetSnapshot(const std::string &projectId,
                                          const std::string &snapshotId) const {
  return GetSnapshotStore(projectId).Load(snapshotId);
}

std::vector<snapshot::Snapshot>
Workspace::ListSnapshots(const std::string &projectId) const {
  auto snapshots = GetSnapshotStore(projectId).LoadAll();
  std::ranges::stable_sort(snapshots, {}, &snapshot::Snapshot::timestamp);
  return snapshots;
}

storage::SnapshotStore
Workspace::GetSnapshotStore(const std::string &projectId) const {
  const auto &project = GetProject(projectId);
  return storage::SnapshotStore{ProjectDirectory(project.id) / SNAPSHOTS_DIR};
}

proto::DashboardInfo
Workspace::BuildDashboard(const std::string &projectId,
                          const dashboard::AggregationRegistry &aggregations,
                          std::optional<Timestamp> from,
                          std::optional<Timestamp> to) const {
  return GetProject(projectId).BuildDashboard(GetSnapshotStore(projectId),
                                              aggregations, from, to);
}

} // namespace epoch_monitor::workspace
