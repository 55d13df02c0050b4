#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/dashboard/report_filter.h>
#include <fmt/format.h>

namespace epoch_monitor::dashboard {

bool ReportFilter::Matches(const snapshot::Snapshot &snapshot) const {
  return IsSupersetOf(snapshot.metadata, metadataValues) &&
         ContainsAllTags(snapshot.tags, tagValues);
}

void ReportFilter::decode(const YAML::Node &element) {
  metadataValues = MetadataFromYAML(element["metadata_values"]);
  tagValues = element["tag_values"].as<Tags>(Tags{});
}

storage::SnapshotSeries FilterSnapshots(const storage::SnapshotSeries &series,
                                        const ReportFilter &filter) {
  storage::SnapshotSeries kept;
  for (const auto &[ts, snapshot] : series) {
    if (filter.Matches(snapshot)) {
      kept.emplace_hint(kept.end(), ts, snapshot);
    }
  }
  return kept;
}

glz::generic ToGeneric(const ReportFilter &filter) {
  glz::generic out;
  out.data = glz::generic::object_t{};
  out["metadata_values"] = epoch_monitor::ToGeneric(filter.metadataValues);
  out["tag_values"] = epoch_monitor::ToGeneric(MetadataValue{filter.tagValues});
  return out;
}

ReportFilter ReportFilterFromGeneric(const glz::generic &value) {
  const auto *obj = std::get_if<glz::generic::object_t>(&value.data);
  if (!obj) {
    throw ConfigurationError("Report filter should be an object");
  }

  ReportFilter filter;
  if (auto it = obj->find("metadata_values"); it != obj->end()) {
    const auto *metadata = std::get_if<glz::generic::object_t>(&it->second.data);
    if (!metadata) {
      throw ConfigurationError("Report filter metadata_values should be an object");
    }
    for (const auto &[key, item] : *metadata) {
      MetadataValue parsed;
      if (!MetadataValueFromGeneric(item, parsed)) {
        throw ConfigurationError(fmt::format(
            "Report filter metadata '{}' has an unsupported value", key));
      }
      filter.metadataValues.emplace(key, std::move(parsed));
    }
  }
  if (auto it = obj->find("tag_values"); it != obj->end()) {
    MetadataValue tags;
    if (!MetadataValueFromGeneric(it->second, tags) ||
        !std::holds_alternative<Tags>(tags)) {
      throw ConfigurationError("Report filter tag_values should be a string list");
    }
    filter.tagValues = std::get<Tags>(std::move(tags));
  }
  return filter;
}

} // namespace epoch_monitor::dashboard
