#pragma once
#include <epoch_monitor/core/timestamp.h>
#include <epoch_monitor/core/unit_args.h>
#include <epoch_monitor/dashboard/report_filter.h>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace epoch_monitor::dashboard {

// Addresses one field of one unit result across snapshots. unitArgs is a
// template: only the listed (possibly dotted) keys have to match.
struct PanelValue {
  std::string unitType;
  UnitArgs unitArgs{};
  std::string fieldPath;
  std::string legend{};

  void decode(const YAML::Node &element);

  bool operator==(const PanelValue &) const = default;
};

struct PanelPoint {
  Timestamp timestamp;
  glz::generic value;
};
using PanelPoints = std::vector<PanelPoint>;

struct PanelSeries {
  std::string legend;
  PanelPoints points;
};

// Reduction over a series ordered by timestamp.
using Aggregation = std::function<PanelPoints(const PanelPoints &)>;

namespace aggregations {
inline constexpr std::string_view NONE = "none";
inline constexpr std::string_view LAST = "last";
inline constexpr std::string_view SUM = "sum";
} // namespace aggregations

class AggregationRegistry {
public:
  // Throws ConfigurationError when the name is taken.
  void Register(const std::string &name, Aggregation aggregation);

  [[nodiscard]] bool Contains(std::string_view name) const {
    return m_aggregations.contains(name);
  }

  // Throws NotFoundError for an unknown name.
  [[nodiscard]] const Aggregation &Find(std::string_view name) const;

  [[nodiscard]] std::vector<std::string> GetNames() const;

private:
  std::map<std::string, Aggregation, std::less<>> m_aggregations;
};

// none, last and sum.
AggregationRegistry CreateDefaultAggregationRegistry();

/**
 * @brief Extracts value.fieldPath from every filtered snapshot, in timestamp
 * order, then applies the named aggregation.
 *
 * A snapshot contributes through the first unit whose type equals
 * value.unitType and whose args match value.unitArgs; snapshots without such
 * a unit are skipped. A missing field throws FieldNotFoundError.
 */
PanelSeries AggregatePanel(const storage::SnapshotSeries &snapshots,
                           const ReportFilter &filter, const PanelValue &value,
                           std::string_view aggregation,
                           const AggregationRegistry &registry);

glz::generic ToGeneric(const PanelValue &value);

PanelValue PanelValueFromGeneric(const glz::generic &value);

} // namespace epoch_monitor::dashboard

namespace YAML {
template <> struct convert<epoch_monitor::dashboard::PanelValue> {
  static bool decode(const Node &node,
                     epoch_monitor::dashboard::PanelValue &t) {
    t.decode(node);
    return true;
  }
};
} // namespace YAML
