#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/report/report_base.h>
#include <epoch_monitor/suite/item_expander.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor::report {

std::string GenerateId() {
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

ReportBase::ReportBase(epoch_core::UnitKind kind,
                       std::vector<units::CheckItem> items,
                       ReportOptions options,
                       std::shared_ptr<const render::RendererRegistry> renderers)
    : m_kind(kind), m_items(std::move(items)), m_options(std::move(options)),
      m_renderers(renderers ? std::move(renderers)
                            : std::make_shared<const render::RendererRegistry>(
                                  render::CreateDefaultRendererRegistry())),
      m_id(GenerateId()), m_timestamp(Now()) {}

void ReportBase::Run(std::optional<epoch_frame::DataFrame> reference,
                     std::optional<epoch_frame::DataFrame> current,
                     const ColumnMapping &mapping) {
  if (!current) {
    throw ConfigurationError("Current dataset should be present");
  }

  InputData input{.reference = std::move(reference),
                  .current = std::move(current),
                  .mapping = mapping};
  input.definition = CreateDataDefinition(input.reference, *input.current, mapping);

  m_firstLevel.clear();
  m_suite.Reset();
  m_suite.Verify(input);

  const suite::ItemExpander expander{m_kind};
  const auto expansion = expander.Expand(m_items, input, input.definition.columns);

  std::vector<size_t> firstLevel;
  firstLevel.reserve(expansion.units.size());
  for (const auto &unit : expansion.units) {
    firstLevel.push_back(m_suite.AddUnit(unit));
  }
  m_firstLevel = std::move(firstLevel);

  auto features = m_suite.CreateAdditionalFeatures(input);
  input.currentFeatures = std::move(features.current);
  input.referenceFeatures = std::move(features.reference);

  SPDLOG_INFO("Running {} {} with {} first-level units ({} total)", KindPrefix(m_kind),
              m_id, m_firstLevel.size(), m_suite.GetUnits().size());
  m_suite.Run(input);
  expander.RecordProvenance(expansion, m_metadata);
}

void ReportBase::AssertComplete(std::string_view operation) const {
  if (m_suite.GetState() != epoch_core::SuiteState::Complete) {
    throw std::logic_error(fmt::format(
        "{} requires a completed run, suite is {}", operation,
        epoch_core::SuiteStateWrapper::ToString(m_suite.GetState())));
  }
}

const render::IRenderer &
ReportBase::FindRenderer(const units::IComputationalUnit &unit) const {
  return m_renderers->Find(unit.GetType());
}

std::vector<units::UnitPtr> ReportBase::GetFirstLevelUnits() const {
  std::vector<units::UnitPtr> result;
  result.reserve(m_firstLevel.size());
  for (const auto index : m_firstLevel) {
    result.push_back(m_suite.GetUnit(index));
  }
  return result;
}

glz::generic ReportBase::AsDict(const render::IncludeOptionsMap &include) const {
  AssertComplete("AsDict");
  const auto prefix = KindPrefix(m_kind);

  glz::generic::array_t entries;
  for (const auto &unit : GetFirstLevelUnits()) {
    const auto it = include.find(unit->GetType());
    glz::generic entry;
    entry.data = glz::generic::object_t{};
    entry[prefix] = unit->GetType();
    entry["result"] = FindRenderer(*unit).RenderJson(
        *unit, it == include.end() ? std::nullopt : std::optional{it->second});
    entries.push_back(std::move(entry));
  }

  glz::generic out;
  out.data = glz::generic::object_t{};
  out[prefix + "s"].data = std::move(entries);
  return out;
}

std::string ReportBase::AsJson() const {
  auto dict = AsDict();
  dict["id"] = m_id;
  dict["timestamp"] = ToIsoString(m_timestamp);
  dict["metadata"] = ToGeneric(m_metadata);
  return glz::write<glz::opts{.prettify = true}>(dict).value_or("{}");
}

std::map<std::string, proto::Table> ReportBase::AsTables() const {
  AssertComplete("AsTables");
  std::map<std::string, proto::Table> tables;
  for (const auto &unit : GetFirstLevelUnits()) {
    auto rendered = FindRenderer(*unit).RenderTable(*unit);
    auto [it, inserted] = tables.try_emplace(unit->GetType(), rendered);
    if (inserted) {
      continue;
    }

    // Align cells of the new rows to the columns of the existing table.
    auto &table = it->second;
    for (const auto &row : rendered.rows()) {
      auto *aligned = table.add_rows();
      for (const auto &column : table.columns()) {
        auto *cell = aligned->add_cells();
        for (int i = 0; i < rendered.columns_size() && i < row.cells_size(); ++i) {
          if (rendered.columns(i) == column) {
            *cell = row.cells(i);
            break;
          }
        }
      }
    }
  }
  return tables;
}

proto::Table ReportBase::AsTable(const std::string &group) const {
  auto tables = AsTables();
  auto it = tables.find(group);
  if (it == tables.end()) {
    throw NotFoundError(fmt::format("{} group {} not found in this report",
                                    KindPrefix(m_kind), group));
  }
  return std::move(it->second);
}

DashboardBundle ReportBase::AsDashboard() const {
  AssertComplete("AsDashboard");
  DashboardBundle bundle;
  auto id = GenerateId();
  std::erase(id, '-');
  bundle.info.set_id("epoch_monitor_dashboard_" + id);
  bundle.info.set_name(m_kind == epoch_core::UnitKind::Test ? "Test Suite"
                                                            : "Report");

  size_t position = 0;
  for (const auto &unit : GetFirstLevelUnits()) {
    for (auto &rendered : FindRenderer(*unit).RenderWidgets(*unit)) {
      auto &widget = rendered.widget;
      const auto widgetId = fmt::format("{}-{}", unit->GetType(), position++);
      widget.set_id(widgetId);
      widget.clear_additional_graph_ids();

      for (auto &graph : rendered.additionalGraphs) {
        auto graphId = fmt::format("{}-{}", widgetId, graph.id());
        for (size_t suffix = 1; bundle.additionalGraphs.contains(graphId); ++suffix) {
          graphId = fmt::format("{}-{}-{}", widgetId, graph.id(), suffix);
        }
        graph.set_id(graphId);
        widget.add_additional_graph_ids(graphId);
        bundle.additionalGraphs.emplace(graphId, std::move(graph));
      }
      *bundle.info.add_widgets() = std::move(widget);
    }
  }
  SPDLOG_DEBUG("Built dashboard with {} widgets and {} additional graphs",
               bundle.info.widgets_size(), bundle.additionalGraphs.size());
  return bundle;
}

proto::GraphPayload
ReportBase::GetAdditionalGraph(const std::string &graphId) const {
  auto bundle = AsDashboard();
  auto it = bundle.additionalGraphs.find(graphId);
  if (it == bundle.additionalGraphs.end()) {
    throw NotFoundError(fmt::format("Graph {} not found", graphId));
  }
  return std::move(it->second);
}

ReportBase &ReportBase::SetBatchSize(const std::string &batchSize) {
  return SetMetadata(std::string{metadata_keys::BATCH_SIZE}, batchSize);
}

ReportBase &ReportBase::SetModelId(const std::string &modelId) {
  return SetMetadata(std::string{metadata_keys::MODEL_ID}, modelId);
}

ReportBase &ReportBase::SetReferenceId(const std::string &referenceId) {
  return SetMetadata(std::string{metadata_keys::REFERENCE_ID}, referenceId);
}

ReportBase &ReportBase::SetDatasetId(const std::string &datasetId) {
  return SetMetadata(std::string{metadata_keys::DATASET_ID}, datasetId);
}

ReportBase &ReportBase::AddTag(std::string tag) {
  epoch_monitor::AddTag(m_tags, std::move(tag));
  return *this;
}

ReportBase &ReportBase::SetMetadata(const std::string &key,
                                    MetadataValue value) {
  m_metadata.insert_or_assign(key, std::move(value));
  return *this;
}

ReportBase &ReportBase::SetTimestamp(Timestamp timestamp) {
  m_timestamp = timestamp;
  return *this;
}

void ReportBase::Restore(RestoredState state) {
  for (const auto index : state.firstLevelIndices) {
    if (index >= state.units.size()) {
      throw CorruptSnapshotError(fmt::format(
          "First-level index {} out of range ({} units)", index,
          state.units.size()));
    }
  }

  m_suite.Restore(state.units, std::move(state.results));
  m_id = std::move(state.id);
  m_timestamp = state.timestamp;
  m_metadata = std::move(state.metadata);
  m_tags = std::move(state.tags);
  m_options = std::move(state.options);
  m_firstLevel = std::move(state.firstLevelIndices);

  m_items.clear();
  for (const auto index : m_firstLevel) {
    m_items.emplace_back(state.units[index]);
  }
}

} // namespace epoch_monitor::report
