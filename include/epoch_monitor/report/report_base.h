#pragma once
#include <epoch_frame/dataframe.h>
#include <epoch_monitor/core/metadata.h>
#include <epoch_monitor/core/timestamp.h>
#include <epoch_monitor/render/renderer.h>
#include <epoch_monitor/suite/suite.h>
#include <epoch_monitor/units/items.h>
#include <epoch_monitor_protos/dashboard.pb.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace epoch_monitor::report {

using ReportOptions = UnitArgs;

struct DashboardBundle {
  proto::DashboardInfo info;
  // Keyed by an id unique within the bundle.
  std::map<std::string, proto::GraphPayload> additionalGraphs;
};

// Persisted state needed to rebuild a completed report.
struct RestoredState {
  std::string id;
  Timestamp timestamp;
  Metadata metadata;
  Tags tags;
  ReportOptions options;
  std::vector<units::UnitPtr> units;
  std::vector<Result> results;
  std::vector<size_t> firstLevelIndices;
};

/**
 * @brief Configured list of checks plus the suite that runs them.
 *
 * The first-level view is a list of arena indices in expansion order; every
 * read view (dict, tables, dashboard) walks it in that order. Duplicate
 * indices are kept.
 */
class ReportBase {
public:
  ReportBase(epoch_core::UnitKind kind, std::vector<units::CheckItem> items,
             ReportOptions options = {},
             std::shared_ptr<const render::RendererRegistry> renderers = nullptr);

  virtual ~ReportBase() = default;

  // Throws ConfigurationError when current is absent, GenerationError when
  // expansion fails and ComputationError when a unit fails.
  void Run(std::optional<epoch_frame::DataFrame> reference,
           std::optional<epoch_frame::DataFrame> current,
           const ColumnMapping &mapping = {});

  [[nodiscard]] virtual glz::generic
  AsDict(const render::IncludeOptionsMap &include = {}) const;

  [[nodiscard]] std::string AsJson() const;

  // One table per unit type, rows in first-level order.
  [[nodiscard]] std::map<std::string, proto::Table> AsTables() const;

  // Throws NotFoundError when no first-level unit has the given type.
  [[nodiscard]] proto::Table AsTable(const std::string &group) const;

  [[nodiscard]] DashboardBundle AsDashboard() const;

  // Throws NotFoundError for an unknown id.
  [[nodiscard]] proto::GraphPayload
  GetAdditionalGraph(const std::string &graphId) const;

  ReportBase &SetBatchSize(const std::string &batchSize);
  ReportBase &SetModelId(const std::string &modelId);
  ReportBase &SetReferenceId(const std::string &referenceId);
  ReportBase &SetDatasetId(const std::string &datasetId);
  ReportBase &AddTag(std::string tag);
  ReportBase &SetMetadata(const std::string &key, MetadataValue value);
  ReportBase &SetTimestamp(Timestamp timestamp);

  void Restore(RestoredState state);

  [[nodiscard]] epoch_core::UnitKind GetKind() const { return m_kind; }
  [[nodiscard]] const std::string &GetId() const { return m_id; }
  [[nodiscard]] Timestamp GetTimestamp() const { return m_timestamp; }
  [[nodiscard]] const Metadata &GetMetadata() const { return m_metadata; }
  [[nodiscard]] const Tags &GetTags() const { return m_tags; }
  [[nodiscard]] const ReportOptions &GetOptions() const { return m_options; }
  [[nodiscard]] const suite::Suite &GetSuite() const { return m_suite; }
  [[nodiscard]] const std::vector<size_t> &GetFirstLevelIndices() const {
    return m_firstLevel;
  }
  [[nodiscard]] std::vector<units::UnitPtr> GetFirstLevelUnits() const;

protected:
  [[nodiscard]] const render::IRenderer &
  FindRenderer(const units::IComputationalUnit &unit) const;

  void AssertComplete(std::string_view operation) const;

private:
  epoch_core::UnitKind m_kind;
  std::vector<units::CheckItem> m_items;
  ReportOptions m_options;
  std::shared_ptr<const render::RendererRegistry> m_renderers;
  std::string m_id;
  Timestamp m_timestamp;
  Metadata m_metadata{};
  Tags m_tags{};
  suite::Suite m_suite;
  std::vector<size_t> m_firstLevel;
};

using ReportBasePtr = std::unique_ptr<ReportBase>;

std::string GenerateId();

} // namespace epoch_monitor::report
