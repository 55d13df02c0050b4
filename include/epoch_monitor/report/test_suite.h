#pragma once
#include <epoch_monitor/report/report_base.h>
#include <map>

namespace epoch_monitor::report {

struct TestSummary {
  bool allPassed{true};
  size_t totalTests{0};
  size_t successTests{0};
  size_t failedTests{0};
  std::map<std::string, size_t> byStatus{};
};

// Test units whose results carry a status. Provenance goes to
// "test_presets" / "test_generators".
class TestSuite : public ReportBase {
public:
  explicit TestSuite(std::vector<units::CheckItem> tests,
                     ReportOptions options = {},
                     std::shared_ptr<const render::RendererRegistry> renderers =
                         nullptr)
      : ReportBase(epoch_core::UnitKind::Test, std::move(tests),
                   std::move(options), std::move(renderers)) {}

  // Warnings and skipped tests do not fail the suite.
  [[nodiscard]] TestSummary GetSummary() const;

  [[nodiscard]] glz::generic
  AsDict(const render::IncludeOptionsMap &include = {}) const override;
};

} // namespace epoch_monitor::report
