#pragma once
#include <epoch_monitor/snapshot/snapshot.h>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace epoch_monitor::storage {

struct SeriesQuery {
  std::optional<Timestamp> from{};
  std::optional<Timestamp> to{};
  std::optional<epoch_core::UnitKind> kind{};
};

using SnapshotSeries = std::map<Timestamp, snapshot::Snapshot>;
using MetricTimeSeries = std::map<UnitIdentity, std::map<Timestamp, Result>>;

/**
 * @brief Directory of snapshot files, one "<snapshot id>.json" per snapshot.
 *
 * Loads decode files in parallel and merge them in file-name order. A file
 * that fails to decode fails the whole load.
 */
class SnapshotStore {
public:
  explicit SnapshotStore(std::filesystem::path directory);

  [[nodiscard]] const std::filesystem::path &GetDirectory() const {
    return m_directory;
  }

  // Regular *.json files, sorted. Empty when the directory does not exist.
  [[nodiscard]] std::vector<std::filesystem::path> ListFiles() const;

  [[nodiscard]] std::vector<snapshot::Snapshot> LoadAll() const;

  // Keeps from <= timestamp <= to; an absent bound is open. Snapshots sharing
  // a timestamp resolve to the last file in name order.
  [[nodiscard]] SnapshotSeries LoadSeries(const SeriesQuery &query = {}) const;

  // Writes "<directory>/<id>.json" and returns its path.
  std::filesystem::path Save(const snapshot::Snapshot &snapshot) const;

  [[nodiscard]] bool Contains(const std::string &snapshotId) const;

  // Throws NotFoundError for an unknown id.
  [[nodiscard]] snapshot::Snapshot Load(const std::string &snapshotId) const;

private:
  std::filesystem::path m_directory;

  [[nodiscard]] std::filesystem::path
  PathOf(const std::string &snapshotId) const;
};

/**
 * @brief Result of every tracked unit, keyed by identity then timestamp.
 *
 * Without a unit filter every first-level unit of each restored snapshot
 * contributes. With one, a snapshot contributes only for the requested units
 * it contains; each such unit is bound to that snapshot's context before its
 * result is read.
 */
MetricTimeSeries
LoadMetricTimeSeries(const SnapshotStore &store,
                     const units::UnitRegistry &registry,
                     const SeriesQuery &query = {},
                     const std::vector<units::UnitPtr> &unitFilter = {});

} // namespace epoch_monitor::storage
