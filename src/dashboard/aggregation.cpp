#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/dashboard/aggregation.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor::dashboard {

namespace {
PanelPoints Last(const PanelPoints &points) {
  if (points.empty()) {
    return {};
  }
  return {points.back()};
}

PanelPoints Sum(const PanelPoints &points) {
  if (points.empty()) {
    return {};
  }
  double total{0};
  for (const auto &point : points) {
    if (const auto *number = std::get_if<double>(&point.value.data)) {
      total += *number;
    } else {
      throw ConfigurationError(fmt::format(
          "sum aggregation needs numeric values, got {} at {}",
          glz::write_json(point.value).value_or("<unprintable>"),
          ToIsoString(point.timestamp)));
    }
  }
  PanelPoint result{.timestamp = points.back().timestamp};
  result.value.data = total;
  return {std::move(result)};
}

const std::string &RequireString(const glz::generic::object_t &obj,
                                 const std::string &key) {
  auto it = obj.find(key);
  const auto *text =
      it == obj.end() ? nullptr : std::get_if<std::string>(&it->second.data);
  if (!text) {
    throw ConfigurationError(
        fmt::format("Panel value requires string field '{}'", key));
  }
  return *text;
}
} // namespace

void PanelValue::decode(const YAML::Node &element) {
  if (!element["unit"] || !element["field_path"]) {
    throw ConfigurationError(
        "Panel value requires 'unit' and 'field_path' entries");
  }
  unitType = element["unit"].as<std::string>();
  unitArgs = UnitArgsFromYAML(element["args"]);
  fieldPath = element["field_path"].as<std::string>();
  legend = element["legend"].as<std::string>(fieldPath);
}

void AggregationRegistry::Register(const std::string &name,
                                   Aggregation aggregation) {
  if (!m_aggregations.try_emplace(name, std::move(aggregation)).second) {
    throw ConfigurationError(
        fmt::format("Aggregation {} is already registered", name));
  }
}

const Aggregation &AggregationRegistry::Find(std::string_view name) const {
  auto it = m_aggregations.find(name);
  if (it == m_aggregations.end()) {
    throw NotFoundError(fmt::format("Unknown aggregation '{}', expected one of {}",
                                    name, GetNames()));
  }
  return it->second;
}

std::vector<std::string> AggregationRegistry::GetNames() const {
  std::vector<std::string> names;
  names.reserve(m_aggregations.size());
  for (const auto &[name, _] : m_aggregations) {
    names.push_back(name);
  }
  return names;
}

AggregationRegistry CreateDefaultAggregationRegistry() {
  AggregationRegistry registry;
  registry.Register(std::string{aggregations::NONE},
                    [](const PanelPoints &points) { return points; });
  registry.Register(std::string{aggregations::LAST}, Last);
  registry.Register(std::string{aggregations::SUM}, Sum);
  return registry;
}

PanelSeries AggregatePanel(const storage::SnapshotSeries &snapshots,
                           const ReportFilter &filter, const PanelValue &value,
                           std::string_view aggregation,
                           const AggregationRegistry &registry) {
  const auto &reduce = registry.Find(aggregation);

  PanelPoints points;
  for (const auto &[ts, snapshot] : snapshots) {
    if (!filter.Matches(snapshot)) {
      continue;
    }
    const auto *unit = snapshot.FindUnit(value.unitType, value.unitArgs);
    if (!unit) {
      continue;
    }
    points.push_back(PanelPoint{.timestamp = ts,
                                .value = unit->result.Get(value.fieldPath)});
  }
  SPDLOG_DEBUG("Panel value {}:{} collected {} points", value.unitType,
               value.fieldPath, points.size());

  return PanelSeries{.legend = value.legend.empty() ? value.fieldPath
                                                    : value.legend,
                     .points = reduce(points)};
}

glz::generic ToGeneric(const PanelValue &value) {
  glz::generic out;
  out.data = glz::generic::object_t{};
  out["unit"] = value.unitType;
  out["args"] = epoch_monitor::ToGeneric(value.unitArgs);
  out["field_path"] = value.fieldPath;
  out["legend"] = value.legend;
  return out;
}

PanelValue PanelValueFromGeneric(const glz::generic &value) {
  const auto *obj = std::get_if<glz::generic::object_t>(&value.data);
  if (!obj) {
    throw ConfigurationError("Panel value should be an object");
  }
  PanelValue result{.unitType = RequireString(*obj, "unit"),
                    .fieldPath = RequireString(*obj, "field_path")};
  if (auto it = obj->find("args"); it != obj->end()) {
    result.unitArgs = UnitArgsFromGeneric(it->second);
  }
  if (auto it = obj->find("legend"); it != obj->end()) {
    if (const auto *legend = std::get_if<std::string>(&it->second.data)) {
      result.legend = *legend;
    }
  }
  return result;
}

} // namespace epoch_monitor::dashboard
