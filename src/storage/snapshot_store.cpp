#include <algorithm>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/storage/snapshot_store.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <tbb/parallel_for_each.h>

namespace epoch_monitor::storage {

namespace {
constexpr std::string_view SNAPSHOT_EXTENSION = ".json";

bool InRange(Timestamp ts, const SeriesQuery &query) {
  return (!query.from || *query.from <= ts) && (!query.to || ts <= *query.to);
}
} // namespace

SnapshotStore::SnapshotStore(std::filesystem::path directory)
    : m_directory(std::move(directory)) {}

std::filesystem::path
SnapshotStore::PathOf(const std::string &snapshotId) const {
  return m_directory / (snapshotId + std::string{SNAPSHOT_EXTENSION});
}

std::vector<std::filesystem::path> SnapshotStore::ListFiles() const {
  std::vector<std::filesystem::path> files;
  if (!std::filesystem::is_directory(m_directory)) {
    return files;
  }
  for (const auto &entry : std::filesystem::directory_iterator(m_directory)) {
    if (entry.is_regular_file() &&
        entry.path().extension() == SNAPSHOT_EXTENSION) {
      files.push_back(entry.path());
    }
  }
  std::ranges::sort(files);
  return files;
}

std::vector<snapshot::Snapshot> SnapshotStore::LoadAll() const {
  const auto files = ListFiles();
  std::vector<std::optional<snapshot::Snapshot>> decoded(files.size());

  std::vector<size_t> positions(files.size());
  for (size_t i = 0; i < positions.size(); ++i) {
    positions[i] = i;
  }
  // The first failing decode is rethrown by tbb after the loop unwinds.
  tbb::parallel_for_each(positions.begin(), positions.end(), [&](size_t i) {
    decoded[i] = snapshot::LoadSnapshot(files[i]);
  });

  std::vector<snapshot::Snapshot> snapshots;
  snapshots.reserve(decoded.size());
  for (auto &item : decoded) {
    snapshots.push_back(std::move(*item));
  }
  SPDLOG_DEBUG("Loaded {} snapshots from {}", snapshots.size(),
               m_directory.string());
  return snapshots;
}

SnapshotSeries SnapshotStore::LoadSeries(const SeriesQuery &query) const {
  SnapshotSeries series;
  if (query.from && query.to && *query.from > *query.to) {
    return series;
  }

  for (auto &snapshot : LoadAll()) {
    if (query.kind && snapshot.kind != *query.kind) {
      continue;
    }
    if (!InRange(snapshot.timestamp, query)) {
      continue;
    }
    const auto ts = snapshot.timestamp;
    auto [it, inserted] = series.insert_or_assign(ts, std::move(snapshot));
    if (!inserted) {
      SPDLOG_WARN("Snapshot {} replaces another snapshot at {}", it->second.id,
                  ToIsoString(ts));
    }
  }
  return series;
}

std::filesystem::path
SnapshotStore::Save(const snapshot::Snapshot &snapshot) const {
  if (snapshot.id.empty()) {
    throw ConfigurationError("Cannot store a snapshot without an id");
  }
  auto path = PathOf(snapshot.id);
  snapshot::SaveSnapshot(snapshot, path);
  return path;
}

bool SnapshotStore::Contains(const std::string &snapshotId) const {
  return std::filesystem::is_regular_file(PathOf(snapshotId));
}

snapshot::Snapshot SnapshotStore::Load(const std::string &snapshotId) const {
  if (!Contains(snapshotId)) {
    throw NotFoundError(fmt::format("Snapshot {} not found in {}", snapshotId,
                                    m_directory.string()));
  }
  return snapshot::LoadSnapshot(PathOf(snapshotId));
}

MetricTimeSeries LoadMetricTimeSeries(const SnapshotStore &store,
                                      const units::UnitRegistry &registry,
                                      const SeriesQuery &query,
                                      const std::vector<units::UnitPtr> &unitFilter) {
  MetricTimeSeries result;
  for (const auto &[ts, stored] : store.LoadSeries(query)) {
    const auto restored = snapshot::Restore(stored, registry);

    if (unitFilter.empty()) {
      for (const auto &unit : restored->GetFirstLevelUnits()) {
        result[unit->GetIdentity()].insert_or_assign(ts, unit->GetResult());
      }
      continue;
    }

    const auto &suite = restored->GetSuite();
    for (const auto &unit : unitFilter) {
      const auto identity = unit->GetIdentity();
      if (!suite.IndexOf(identity)) {
        continue;
      }
      unit->SetContext(suite.GetSharedContext());
      result[identity].insert_or_assign(ts, unit->GetResult());
    }
  }
  SPDLOG_DEBUG("Built time series for {} units from {}", result.size(),
               store.GetDirectory().string());
  return result;
}

} // namespace epoch_monitor::storage
