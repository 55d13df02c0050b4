#pragma once
#include <epoch_core/enum_wrapper.h>
#include <epoch_monitor/dashboard/aggregation.h>
#include <epoch_monitor_protos/dashboard.pb.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

CREATE_ENUM(PanelSize, Half, Full);
CREATE_ENUM(PanelPlotType, Line, Bar, Scatter, Histogram);

namespace epoch_monitor::dashboard {

struct IDashboardPanel {
  virtual const std::string &GetTitle() const = 0;

  virtual const ReportFilter &GetFilter() const = 0;

  virtual epoch_core::PanelSize GetSize() const = 0;

  // May throw FieldNotFoundError when a panel value misses its field.
  virtual proto::Widget
  BuildWidget(const storage::SnapshotSeries &snapshots,
              const AggregationRegistry &aggregations) const = 0;

  virtual glz::generic ToGeneric() const = 0;

  virtual ~IDashboardPanel() = default;
};
using DashboardPanelPtr = std::shared_ptr<const IDashboardPanel>;

struct CounterPanelOptions {
  std::string title;
  ReportFilter filter{};
  std::optional<PanelValue> value{};
  std::string text{};
  std::string agg{aggregations::NONE};
  epoch_core::PanelSize size{epoch_core::PanelSize::Half};
};

/**
 * @brief Single value panel.
 *
 * With the "none" aggregation, or without a value, the counter shows its text
 * under the title. Otherwise it shows the last point of the aggregated
 * series, labelled with the text.
 */
class DashboardPanelCounter : public IDashboardPanel {
public:
  explicit DashboardPanelCounter(CounterPanelOptions options);

  const std::string &GetTitle() const override { return m_options.title; }
  const ReportFilter &GetFilter() const override { return m_options.filter; }
  epoch_core::PanelSize GetSize() const override { return m_options.size; }

  proto::Widget BuildWidget(const storage::SnapshotSeries &snapshots,
                            const AggregationRegistry &aggregations) const override;

  glz::generic ToGeneric() const override;

  const CounterPanelOptions &GetOptions() const { return m_options; }

private:
  CounterPanelOptions m_options;
};

struct PlotPanelOptions {
  std::string title;
  ReportFilter filter{};
  std::vector<PanelValue> values{};
  epoch_core::PanelPlotType plotType{epoch_core::PanelPlotType::Line};
  epoch_core::PanelSize size{epoch_core::PanelSize::Full};
};

// One raw series per panel value. Values must be numeric.
class DashboardPanelPlot : public IDashboardPanel {
public:
  explicit DashboardPanelPlot(PlotPanelOptions options);

  const std::string &GetTitle() const override { return m_options.title; }
  const ReportFilter &GetFilter() const override { return m_options.filter; }
  epoch_core::PanelSize GetSize() const override { return m_options.size; }

  proto::Widget BuildWidget(const storage::SnapshotSeries &snapshots,
                            const AggregationRegistry &aggregations) const override;

  glz::generic ToGeneric() const override;

  const PlotPanelOptions &GetOptions() const { return m_options; }

private:
  PlotPanelOptions m_options;
};

// Dispatches on the "type" field ("counter" or "plot"). Throws
// ConfigurationError on anything else.
DashboardPanelPtr PanelFromGeneric(const glz::generic &value);

DashboardPanelPtr PanelFromYAML(const YAML::Node &node);

} // namespace epoch_monitor::dashboard
