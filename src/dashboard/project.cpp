#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/dashboard/project.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor::dashboard {

namespace {
proto::Widget ErrorWidget(const IDashboardPanel &panel,
                          const std::string &message) {
  proto::Widget widget;
  widget.set_title(panel.GetTitle());
  widget.set_type(proto::WIDGET_ERROR);
  widget.set_size(panel.GetSize() == epoch_core::PanelSize::Full
                      ? proto::SIZE_FULL
                      : proto::SIZE_HALF);
  widget.set_text(message);
  return widget;
}

std::optional<Timestamp> OptionalTimestamp(const glz::generic::object_t &obj,
                                           const std::string &key) {
  auto it = obj.find(key);
  if (it == obj.end() ||
      std::holds_alternative<std::nullptr_t>(it->second.data)) {
    return std::nullopt;
  }
  const auto *text = std::get_if<std::string>(&it->second.data);
  if (!text) {
    throw ConfigurationError(
        fmt::format("Project field '{}' should be a timestamp string", key));
  }
  return TimestampFromString(*text);
}

std::string OptionalString(const glz::generic::object_t &obj,
                           const std::string &key) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return {};
  }
  const auto *text = std::get_if<std::string>(&it->second.data);
  if (!text) {
    throw ConfigurationError(
        fmt::format("Project field '{}' should be a string", key));
  }
  return *text;
}

glz::generic TimestampOrNull(const std::optional<Timestamp> &ts) {
  glz::generic out;
  if (ts) {
    out.data = ToIsoString(*ts);
  }
  return out;
}
} // namespace

Project &Project::AddPanel(DashboardPanelPtr panel) {
  if (!panel) {
    throw ConfigurationError(
        fmt::format("Project {} cannot take a null panel", name));
  }
  panels.push_back(std::move(panel));
  return *this;
}

proto::DashboardInfo
Project::BuildDashboard(const storage::SnapshotSeries &snapshots,
                        const AggregationRegistry &aggregations) const {
  proto::DashboardInfo info;
  info.set_id(id);
  info.set_name(name);

  size_t failed = 0;
  for (size_t i = 0; i < panels.size(); ++i) {
    const auto &panel = *panels[i];
    proto::Widget widget;
    try {
      widget = panel.BuildWidget(snapshots, aggregations);
    } catch (const MonitorError &e) {
      SPDLOG_WARN("Project {} panel '{}' failed: {}", id, panel.GetTitle(),
                  e.what());
      widget = ErrorWidget(panel, e.what());
      ++failed;
    }
    widget.set_id(fmt::format("panel-{}", i));
    *info.add_widgets() = std::move(widget);
  }

  SPDLOG_INFO("Built dashboard for project {} over {} snapshots ({} of {} "
              "panels failed)",
              id, snapshots.size(), failed, panels.size());
  return info;
}

proto::DashboardInfo
Project::BuildDashboard(const storage::SnapshotStore &store,
                        const AggregationRegistry &aggregations,
                        std::optional<Timestamp> from,
                        std::optional<Timestamp> to) const {
  const storage::SeriesQuery query{.from = from ? from : dateFrom,
                                   .to = to ? to : dateTo};
  return BuildDashboard(store.LoadSeries(query), aggregations);
}

void Project::decode(const YAML::Node &element) {
  if (!element["name"]) {
    throw ConfigurationError(fmt::format("Project at line {} requires a name",
                                         element.Mark().line + 1));
  }
  id = element["id"].as<std::string>("");
  name = element["name"].as<std::string>();
  description = element["description"].as<std::string>("");
  if (element["date_from"]) {
    dateFrom = TimestampFromString(element["date_from"].as<std::string>());
  }
  if (element["date_to"]) {
    dateTo = TimestampFromString(element["date_to"].as<std::string>());
  }
  panels.clear();
  for (const auto &panel : element["panels"]) {
    AddPanel(PanelFromYAML(panel));
  }
}

glz::generic ToGeneric(const Project &project) {
  glz::generic out;
  out.data = glz::generic::object_t{};
  out["id"] = project.id;
  out["name"] = project.name;
  out["description"] = project.description;
  out["date_from"] = TimestampOrNull(project.dateFrom);
  out["date_to"] = TimestampOrNull(project.dateTo);

  glz::generic::array_t panels;
  for (const auto &panel : project.panels) {
    panels.push_back(panel->ToGeneric());
  }
  out["panels"].data = std::move(panels);
  return out;
}

Project ProjectFromGeneric(const glz::generic &value) {
  const auto *obj = std::get_if<glz::generic::object_t>(&value.data);
  if (!obj) {
    throw ConfigurationError("Project document should be an object");
  }

  Project project{.id = OptionalString(*obj, "id"),
                  .name = OptionalString(*obj, "name"),
                  .description = OptionalString(*obj, "description"),
                  .dateFrom = OptionalTimestamp(*obj, "date_from"),
                  .dateTo = OptionalTimestamp(*obj, "date_to")};
  if (project.id.empty()) {
    throw ConfigurationError("Project document has no id");
  }

  if (auto it = obj->find("panels"); it != obj->end()) {
    const auto *panels = std::get_if<glz::generic::array_t>(&it->second.data);
    if (!panels) {
      throw ConfigurationError(
          fmt::format("Project {} panels should be an array", project.id));
    }
    for (const auto &panel : *panels) {
      project.AddPanel(PanelFromGeneric(panel));
    }
  }
  return project;
}

} // namespace epoch_monitor::dashboard
