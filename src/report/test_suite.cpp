#include <epoch_monitor/report/test_suite.h>

namespace epoch_monitor::report {

TestSummary TestSuite::GetSummary() const {
  AssertComplete("GetSummary");
  TestSummary summary;
  for (const auto &unit : GetFirstLevelUnits()) {
    const auto status = unit->GetResult().GetStatus();
    ++summary.totalTests;
    ++summary.byStatus[epoch_core::TestStatusWrapper::ToString(status)];
    switch (status) {
    case epoch_core::TestStatus::Success:
      ++summary.successTests;
      break;
    case epoch_core::TestStatus::Fail:
    case epoch_core::TestStatus::Error:
      ++summary.failedTests;
      summary.allPassed = false;
      break;
    default:
      break;
    }
  }
  return summary;
}

glz::generic TestSuite::AsDict(const render::IncludeOptionsMap &include) const {
  auto dict = ReportBase::AsDict(include);
  const auto summary = GetSummary();

  glz::generic byStatus;
  byStatus.data = glz::generic::object_t{};
  for (const auto &[status, count] : summary.byStatus) {
    byStatus[status] = static_cast<double>(count);
  }

  glz::generic out;
  out.data = glz::generic::object_t{};
  out["all_passed"] = summary.allPassed;
  out["total_tests"] = static_cast<double>(summary.totalTests);
  out["success_tests"] = static_cast<double>(summary.successTests);
  out["failed_tests"] = static_cast<double>(summary.failedTests);
  out["by_status"] = std::move(byStatus);
  dict["summary"] = std::move(out);
  return dict;
}

} // namespace epoch_monitor::report
