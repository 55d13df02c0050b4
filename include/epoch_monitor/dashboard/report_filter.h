#pragma once
#include <epoch_monitor/core/metadata.h>
#include <epoch_monitor/storage/snapshot_store.h>
#include <glaze/glaze.hpp>
#include <yaml-cpp/yaml.h>

namespace epoch_monitor::dashboard {

// Keeps snapshots whose metadata and tags are supersets of the filter's.
struct ReportFilter {
  Metadata metadataValues{};
  Tags tagValues{};

  [[nodiscard]] bool Matches(const snapshot::Snapshot &snapshot) const;

  void decode(const YAML::Node &element);

  bool operator==(const ReportFilter &) const = default;
};

storage::SnapshotSeries FilterSnapshots(const storage::SnapshotSeries &series,
                                        const ReportFilter &filter);

glz::generic ToGeneric(const ReportFilter &filter);

// Throws ConfigurationError on a malformed filter.
ReportFilter ReportFilterFromGeneric(const glz::generic &value);

} // namespace epoch_monitor::dashboard

namespace YAML {
template <> struct convert<epoch_monitor::dashboard::ReportFilter> {
  static bool decode(const Node &node,
                     epoch_monitor::dashboard::ReportFilter &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
