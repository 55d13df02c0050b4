#pragma once
#include <epoch_monitor/report/report_base.h>

namespace epoch_monitor::report {

// Metric report. Provenance goes to "metric_presets" / "metric_generators".
class Report : public ReportBase {
public:
  explicit Report(std::vector<units::CheckItem> metrics,
                  ReportOptions options = {},
                  std::shared_ptr<const render::RendererRegistry> renderers =
                      nullptr)
      : ReportBase(epoch_core::UnitKind::Metric, std::move(metrics),
                   std::move(options), std::move(renderers)) {}
};

} // namespace epoch_monitor::report
