#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/report/report.h>
#include <epoch_monitor/report/test_suite.h>
#include <epoch_monitor/snapshot/snapshot.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace epoch_monitor::snapshot {

namespace {
using Object = glz::generic::object_t;
using Array = glz::generic::array_t;

const glz::generic &RequireField(const Object &obj, const std::string &key,
                                 std::string_view where) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    throw CorruptSnapshotError(
        fmt::format("Snapshot {} is missing field '{}'", where, key));
  }
  return it->second;
}

template <typename T>
const T &RequireAs(const Object &obj, const std::string &key,
                   std::string_view where, std::string_view expected) {
  const auto *value = std::get_if<T>(&RequireField(obj, key, where).data);
  if (!value) {
    throw CorruptSnapshotError(fmt::format(
        "Snapshot {} field '{}' should be {}", where, key, expected));
  }
  return *value;
}

epoch_core::UnitKind KindFromString(const std::string &kind) {
  if (kind == KindPrefix(epoch_core::UnitKind::Metric)) {
    return epoch_core::UnitKind::Metric;
  }
  if (kind == KindPrefix(epoch_core::UnitKind::Test)) {
    return epoch_core::UnitKind::Test;
  }
  throw CorruptSnapshotError(fmt::format("Unknown snapshot kind '{}'", kind));
}

SnapshotUnit UnitFromGeneric(const glz::generic &node, size_t position) {
  const auto where = fmt::format("unit {}", position);
  const auto *obj = std::get_if<Object>(&node.data);
  if (!obj) {
    throw CorruptSnapshotError(
        fmt::format("Snapshot {} should be an object", where));
  }

  SnapshotUnit unit{
      .type = RequireAs<std::string>(*obj, "type", where, "a string")};
  try {
    unit.args = UnitArgsFromGeneric(RequireField(*obj, "args", where));
  } catch (const ConfigurationError &e) {
    throw CorruptSnapshotError(
        fmt::format("Snapshot {} has invalid args: {}", where, e.what()));
  }
  unit.result = Result{RequireField(*obj, "result", where)};
  return unit;
}

Metadata MetadataFromGeneric(const Object &obj) {
  Metadata metadata;
  for (const auto &[key, value] : obj) {
    MetadataValue parsed;
    if (!MetadataValueFromGeneric(value, parsed)) {
      throw CorruptSnapshotError(
          fmt::format("Snapshot metadata '{}' has an unsupported value", key));
    }
    metadata.emplace(key, std::move(parsed));
  }
  return metadata;
}
} // namespace

const SnapshotUnit *Snapshot::FindUnit(const std::string &type,
                                       const UnitArgs &argsTemplate) const {
  for (const auto &unit : units) {
    if (unit.type == type && MatchesTemplate(unit.args, argsTemplate)) {
      return &unit;
    }
  }
  return nullptr;
}

Snapshot Capture(const report::ReportBase &report) {
  const auto &suite = report.GetSuite();
  if (suite.GetState() != epoch_core::SuiteState::Complete) {
    throw std::logic_error(fmt::format(
        "Cannot snapshot {} {} before it completes, suite is {}",
        KindPrefix(report.GetKind()), report.GetId(),
        epoch_core::SuiteStateWrapper::ToString(suite.GetState())));
  }

  Snapshot snapshot{.id = report.GetId(),
                    .timestamp = report.GetTimestamp(),
                    .kind = report.GetKind(),
                    .metadata = report.GetMetadata(),
                    .tags = report.GetTags(),
                    .options = report.GetOptions(),
                    .firstLevelIndices = report.GetFirstLevelIndices()};
  snapshot.units.reserve(suite.GetUnits().size());
  for (const auto &unit : suite.GetUnits()) {
    snapshot.units.push_back(SnapshotUnit{.type = unit->GetType(),
                                          .args = unit->GetArgs(),
                                          .result = unit->GetResult()});
  }
  return snapshot;
}

report::ReportBasePtr
Restore(const Snapshot &snapshot, const units::UnitRegistry &registry,
        std::shared_ptr<const render::RendererRegistry> renderers) {
  report::RestoredState state{.id = snapshot.id,
                              .timestamp = snapshot.timestamp,
                              .metadata = snapshot.metadata,
                              .tags = snapshot.tags,
                              .options = snapshot.options,
                              .firstLevelIndices = snapshot.firstLevelIndices};
  state.units.reserve(snapshot.units.size());
  state.results.reserve(snapshot.units.size());

  for (const auto &stored : snapshot.units) {
    try {
      state.units.push_back(registry.Create(stored.type, stored.args));
    } catch (const NotFoundError &e) {
      throw CorruptSnapshotError(fmt::format(
          "Snapshot {} references an unknown unit: {}", snapshot.id, e.what()));
    } catch (const ConfigurationError &e) {
      throw CorruptSnapshotError(
          fmt::format("Snapshot {} cannot rebuild {}: {}", snapshot.id,
                      stored.GetIdentity().ToString(), e.what()));
    }
    state.results.push_back(stored.result);
  }

  for (const auto index : snapshot.firstLevelIndices) {
    if (index >= state.units.size()) {
      throw CorruptSnapshotError(
          fmt::format("Snapshot {} first-level index {} out of range ({} units)",
                      snapshot.id, index, state.units.size()));
    }
    if (state.units[index]->GetKind() != snapshot.kind) {
      throw CorruptSnapshotError(fmt::format(
          "Snapshot {} lists {} as a first-level {}", snapshot.id,
          state.units[index]->GetIdentity().ToString(), KindPrefix(snapshot.kind)));
    }
  }

  report::ReportBasePtr restored;
  if (snapshot.kind == epoch_core::UnitKind::Test) {
    restored = std::make_unique<report::TestSuite>(
        std::vector<units::CheckItem>{}, snapshot.options, std::move(renderers));
  } else {
    restored = std::make_unique<report::Report>(
        std::vector<units::CheckItem>{}, snapshot.options, std::move(renderers));
  }
  restored->Restore(std::move(state));
  return restored;
}

std::string ToJson(const Snapshot &snapshot) {
  glz::generic root;
  root.data = Object{};
  root["id"] = snapshot.id;
  root["timestamp"] = ToIsoString(snapshot.timestamp);
  root["kind"] = KindPrefix(snapshot.kind);
  root["metadata"] = ToGeneric(snapshot.metadata);

  Array tags;
  for (const auto &tag : snapshot.tags) {
    tags.emplace_back().data = tag;
  }
  root["tags"].data = std::move(tags);
  root["options"] = ToGeneric(snapshot.options);

  Array units;
  for (const auto &unit : snapshot.units) {
    glz::generic entry;
    entry.data = Object{};
    entry["type"] = unit.type;
    entry["args"] = ToGeneric(unit.args);
    entry["result"] = unit.result.Payload();
    units.push_back(std::move(entry));
  }
  root["units"].data = std::move(units);

  Array indices;
  for (const auto index : snapshot.firstLevelIndices) {
    indices.emplace_back().data = static_cast<double>(index);
  }
  root["first_level_indices"].data = std::move(indices);

  auto json = glz::write<glz::opts{.prettify = true}>(root);
  if (!json) {
    throw MonitorError(fmt::format("Failed to serialize snapshot {}: {}",
                                   snapshot.id, glz::format_error(json.error())));
  }
  return std::move(json.value());
}

Snapshot FromJson(std::string_view json) {
  const std::string buffer{json};
  glz::generic root;
  if (auto ec = glz::read_json(root, buffer)) {
    throw CorruptSnapshotError(fmt::format("Snapshot is not valid JSON: {}",
                                           glz::format_error(ec, buffer)));
  }
  const auto *obj = std::get_if<Object>(&root.data);
  if (!obj) {
    throw CorruptSnapshotError("Snapshot root should be an object");
  }

  constexpr std::string_view where = "root";
  Snapshot snapshot{.id = RequireAs<std::string>(*obj, "id", where, "a string")};

  const auto &timestamp =
      RequireAs<std::string>(*obj, "timestamp", where, "a string");
  const auto parsed = ParseTimestamp(timestamp);
  if (!parsed) {
    throw CorruptSnapshotError(fmt::format(
        "Snapshot {} has an invalid timestamp '{}'", snapshot.id, timestamp));
  }
  snapshot.timestamp = *parsed;
  snapshot.kind =
      KindFromString(RequireAs<std::string>(*obj, "kind", where, "a string"));
  snapshot.metadata =
      MetadataFromGeneric(RequireAs<Object>(*obj, "metadata", where, "an object"));

  for (const auto &tag : RequireAs<Array>(*obj, "tags", where, "an array")) {
    const auto *text = std::get_if<std::string>(&tag.data);
    if (!text) {
      throw CorruptSnapshotError(
          fmt::format("Snapshot {} has a non-string tag", snapshot.id));
    }
    snapshot.tags.push_back(*text);
  }

  try {
    snapshot.options = UnitArgsFromGeneric(RequireField(*obj, "options", where));
  } catch (const ConfigurationError &e) {
    throw CorruptSnapshotError(
        fmt::format("Snapshot {} has invalid options: {}", snapshot.id, e.what()));
  }

  const auto &units = RequireAs<Array>(*obj, "units", where, "an array");
  snapshot.units.reserve(units.size());
  for (size_t i = 0; i < units.size(); ++i) {
    snapshot.units.push_back(UnitFromGeneric(units[i], i));
  }

  for (const auto &index :
       RequireAs<Array>(*obj, "first_level_indices", where, "an array")) {
    const auto *value = std::get_if<double>(&index.data);
    if (!value || *value < 0 ||
        *value != static_cast<double>(static_cast<size_t>(*value))) {
      throw CorruptSnapshotError(fmt::format(
          "Snapshot {} has an invalid first-level index", snapshot.id));
    }
    const auto position = static_cast<size_t>(*value);
    if (position >= snapshot.units.size()) {
      throw CorruptSnapshotError(fmt::format(
          "Snapshot {} first-level index {} out of range ({} units)",
          snapshot.id, position, snapshot.units.size()));
    }
    snapshot.firstLevelIndices.push_back(position);
  }
  return snapshot;
}

void SaveSnapshot(const Snapshot &snapshot, const std::filesystem::path &path) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    throw MonitorError(
        fmt::format("Cannot open {} for writing", path.string()));
  }
  file << ToJson(snapshot);
  if (!file) {
    throw MonitorError(fmt::format("Failed to write snapshot {} to {}",
                                   snapshot.id, path.string()));
  }
  SPDLOG_DEBUG("Saved snapshot {} to {}", snapshot.id, path.string());
}

Snapshot LoadSnapshot(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    throw NotFoundError(fmt::format("Snapshot file {} not found", path.string()));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  try {
    return FromJson(buffer.str());
  } catch (const CorruptSnapshotError &e) {
    throw CorruptSnapshotError(fmt::format("{}: {}", path.string(), e.what()));
  }
}

void SaveReport(const report::ReportBase &report,
                const std::filesystem::path &path) {
  SaveSnapshot(Capture(report), path);
}

report::ReportBasePtr
LoadReport(const std::filesystem::path &path,
           const units::UnitRegistry &registry,
           std::shared_ptr<const render::RendererRegistry> renderers) {
  return Restore(LoadSnapshot(path), registry, std::move(renderers));
}

} // namespace epoch_monitor::snapshot
