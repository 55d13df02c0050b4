#include <cctype>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/dashboard/panels.h>
#include <fmt/format.h>

namespace epoch_monitor::dashboard {

namespace {
constexpr std::string_view COUNTER_TYPE = "counter";
constexpr std::string_view PLOT_TYPE = "plot";

// Accepts "half" as well as "Half".
std::string EnumName(std::string text) {
  if (!text.empty()) {
    text.front() = static_cast<char>(
        std::toupper(static_cast<unsigned char>(text.front())));
  }
  return text;
}

epoch_core::PanelSize ParseSize(const std::string &text) {
  auto size = epoch_core::PanelSize::Null;
  try {
    size = epoch_core::PanelSizeWrapper::FromString(EnumName(text));
  } catch (const std::exception &e) {
    throw ConfigurationError(
        fmt::format("Invalid panel size '{}': {}", text, e.what()));
  }
  if (size == epoch_core::PanelSize::Null) {
    throw ConfigurationError(fmt::format("Invalid panel size '{}'", text));
  }
  return size;
}

epoch_core::PanelPlotType ParsePlotType(const std::string &text) {
  auto type = epoch_core::PanelPlotType::Null;
  try {
    type = epoch_core::PanelPlotTypeWrapper::FromString(EnumName(text));
  } catch (const std::exception &e) {
    throw ConfigurationError(
        fmt::format("Invalid plot type '{}': {}", text, e.what()));
  }
  if (type == epoch_core::PanelPlotType::Null) {
    throw ConfigurationError(fmt::format("Invalid plot type '{}'", text));
  }
  return type;
}

proto::WidgetSize ToProto(epoch_core::PanelSize size) {
  return size == epoch_core::PanelSize::Full ? proto::SIZE_FULL
                                             : proto::SIZE_HALF;
}

proto::PlotType ToProto(epoch_core::PanelPlotType type) {
  switch (type) {
  case epoch_core::PanelPlotType::Bar:
    return proto::PLOT_BAR;
  case epoch_core::PanelPlotType::Scatter:
    return proto::PLOT_SCATTER;
  case epoch_core::PanelPlotType::Histogram:
    return proto::PLOT_HISTOGRAM;
  default:
    return proto::PLOT_LINE;
  }
}

std::optional<std::string> FindString(const glz::generic::object_t &obj,
                                      const std::string &key) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return std::nullopt;
  }
  const auto *text = std::get_if<std::string>(&it->second.data);
  if (!text) {
    throw ConfigurationError(
        fmt::format("Panel field '{}' should be a string", key));
  }
  return *text;
}

ReportFilter FilterFrom(const glz::generic::object_t &obj) {
  auto it = obj.find("filter");
  return it == obj.end() ? ReportFilter{} : ReportFilterFromGeneric(it->second);
}

glz::generic PanelBase(std::string_view type, const std::string &title,
                       const ReportFilter &filter, epoch_core::PanelSize size) {
  glz::generic out;
  out.data = glz::generic::object_t{};
  out["type"] = std::string{type};
  out["title"] = title;
  out["filter"] = dashboard::ToGeneric(filter);
  out["size"] = epoch_core::PanelSizeWrapper::ToString(size);
  return out;
}
} // namespace

DashboardPanelCounter::DashboardPanelCounter(CounterPanelOptions options)
    : m_options(std::move(options)) {}

proto::Widget
DashboardPanelCounter::BuildWidget(const storage::SnapshotSeries &snapshots,
                                   const AggregationRegistry &aggregations) const {
  proto::Widget widget;
  widget.set_title(m_options.title);
  widget.set_type(proto::WIDGET_COUNTER);
  widget.set_size(ToProto(m_options.size));

  auto *counter = widget.add_counters();
  if (!m_options.value || m_options.agg == aggregations::NONE) {
    counter->set_label(m_options.title);
    counter->set_text(m_options.text);
    return widget;
  }

  const auto series = AggregatePanel(snapshots, m_options.filter,
                                     *m_options.value, m_options.agg,
                                     aggregations);
  counter->set_label(m_options.text.empty() ? series.legend : m_options.text);
  if (series.points.empty()) {
    counter->set_text("N/A");
    return widget;
  }

  const auto &value = series.points.back().value;
  if (const auto *number = std::get_if<double>(&value.data)) {
    counter->set_decimal(*number);
  } else if (const auto *text = std::get_if<std::string>(&value.data)) {
    counter->set_text(*text);
  } else {
    counter->set_text(glz::write_json(value).value_or(""));
  }
  return widget;
}

glz::generic DashboardPanelCounter::ToGeneric() const {
  auto out = PanelBase(COUNTER_TYPE, m_options.title, m_options.filter,
                       m_options.size);
  if (m_options.value) {
    out["value"] = dashboard::ToGeneric(*m_options.value);
  }
  out["text"] = m_options.text;
  out["agg"] = m_options.agg;
  return out;
}

DashboardPanelPlot::DashboardPanelPlot(PlotPanelOptions options)
    : m_options(std::move(options)) {}

proto::Widget
DashboardPanelPlot::BuildWidget(const storage::SnapshotSeries &snapshots,
                                const AggregationRegistry &aggregations) const {
  proto::Widget widget;
  widget.set_title(m_options.title);
  widget.set_type(proto::WIDGET_PLOT);
  widget.set_size(ToProto(m_options.size));
  widget.set_plot_type(ToProto(m_options.plotType));

  for (const auto &value : m_options.values) {
    const auto series = AggregatePanel(snapshots, m_options.filter, value,
                                       aggregations::NONE, aggregations);
    auto *plotted = widget.add_series();
    plotted->set_legend(series.legend);
    for (const auto &point : series.points) {
      const auto *number = std::get_if<double>(&point.value.data);
      if (!number) {
        throw FieldNotFoundError(
            value.fieldPath, fmt::format("{} (not numeric)", value.fieldPath));
      }
      auto *added = plotted->add_points();
      added->set_timestamp(ToIsoString(point.timestamp));
      added->set_value(*number);
    }
  }
  return widget;
}

glz::generic DashboardPanelPlot::ToGeneric() const {
  auto out = PanelBase(PLOT_TYPE, m_options.title, m_options.filter,
                       m_options.size);
  glz::generic::array_t values;
  for (const auto &value : m_options.values) {
    values.push_back(dashboard::ToGeneric(value));
  }
  out["values"].data = std::move(values);
  out["plot_type"] = epoch_core::PanelPlotTypeWrapper::ToString(m_options.plotType);
  return out;
}

DashboardPanelPtr PanelFromGeneric(const glz::generic &value) {
  const auto *obj = std::get_if<glz::generic::object_t>(&value.data);
  if (!obj) {
    throw ConfigurationError("Dashboard panel should be an object");
  }
  const auto type = FindString(*obj, "type").value_or("");
  const auto title = FindString(*obj, "title").value_or("");
  const auto size = FindString(*obj, "size");

  if (type == COUNTER_TYPE) {
    CounterPanelOptions options{.title = title, .filter = FilterFrom(*obj)};
    if (auto it = obj->find("value"); it != obj->end()) {
      options.value = PanelValueFromGeneric(it->second);
    }
    options.text = FindString(*obj, "text").value_or("");
    options.agg = FindString(*obj, "agg").value_or(std::string{aggregations::NONE});
    if (size) {
      options.size = ParseSize(*size);
    }
    return std::make_shared<DashboardPanelCounter>(std::move(options));
  }

  if (type == PLOT_TYPE) {
    PlotPanelOptions options{.title = title, .filter = FilterFrom(*obj)};
    if (auto it = obj->find("values"); it != obj->end()) {
      const auto *values = std::get_if<glz::generic::array_t>(&it->second.data);
      if (!values) {
        throw ConfigurationError("Plot panel values should be an array");
      }
      for (const auto &item : *values) {
        options.values.push_back(PanelValueFromGeneric(item));
      }
    }
    if (const auto plotType = FindString(*obj, "plot_type")) {
      options.plotType = ParsePlotType(*plotType);
    }
    if (size) {
      options.size = ParseSize(*size);
    }
    return std::make_shared<DashboardPanelPlot>(std::move(options));
  }

  throw ConfigurationError(fmt::format(
      "Unknown panel type '{}', expected '{}' or '{}'", type, COUNTER_TYPE,
      PLOT_TYPE));
}

DashboardPanelPtr PanelFromYAML(const YAML::Node &node) {
  const auto type = node["type"].as<std::string>("");
  const auto title = node["title"].as<std::string>("");
  const auto filter = node["filter"] ? node["filter"].as<ReportFilter>()
                                     : ReportFilter{};

  if (type == COUNTER_TYPE) {
    CounterPanelOptions options{.title = title, .filter = filter};
    if (node["value"]) {
      options.value = node["value"].as<PanelValue>();
    }
    options.text = node["text"].as<std::string>("");
    options.agg = node["agg"].as<std::string>(std::string{aggregations::NONE});
    if (node["size"]) {
      options.size = ParseSize(node["size"].as<std::string>());
    }
    return std::make_shared<DashboardPanelCounter>(std::move(options));
  }

  if (type == PLOT_TYPE) {
    PlotPanelOptions options{.title = title, .filter = filter};
    options.values = node["values"].as<std::vector<PanelValue>>(
        std::vector<PanelValue>{});
    if (node["plot_type"]) {
      options.plotType = ParsePlotType(node["plot_type"].as<std::string>());
    }
    if (node["size"]) {
      options.size = ParseSize(node["size"].as<std::string>());
    }
    return std::make_shared<DashboardPanelPlot>(std::move(options));
  }

  throw ConfigurationError(fmt::format(
      "Unknown panel type '{}' at line {}", type, node.Mark().line + 1));
}

} // namespace epoch_monitor::dashboard
