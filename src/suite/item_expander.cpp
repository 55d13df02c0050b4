#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/suite/item_expander.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor::suite {

void ItemExpander::AppendUnit(const units::UnitPtr &unit,
                              std::string_view origin,
                              ExpansionResult &out) const {
  if (!unit) {
    throw GenerationError(fmt::format("{} produced a null unit", origin));
  }
  if (unit->GetKind() != m_kind) {
    throw GenerationError(fmt::format(
        "{} produced {} of kind {}, expected {}", origin,
        unit->GetIdentity().ToString(),
        epoch_core::UnitKindWrapper::ToString(unit->GetKind()),
        epoch_core::UnitKindWrapper::ToString(m_kind)));
  }
  out.units.push_back(unit);
}

void ItemExpander::ExpandGenerator(const units::IGenerator &generator,
                                   const DatasetColumns &columns,
                                   ExpansionResult &out) const {
  const auto origin = fmt::format("Generator {}", generator.GetName());
  for (const auto &item : generator.Generate(columns)) {
    const auto *unit = std::get_if<units::UnitPtr>(&item);
    if (!unit) {
      throw GenerationError(fmt::format("{} must emit units only, got {}",
                                        origin, units::DescribeItem(item)));
    }
    AppendUnit(*unit, origin, out);
  }
}

ExpansionResult
ItemExpander::Expand(const std::vector<units::CheckItem> &items,
                     const InputData &input,
                     const DatasetColumns &columns) const {
  ExpansionResult result;
  for (const auto &item : items) {
    std::visit(
        [&](const auto &ptr) {
          using K = std::decay_t<decltype(ptr)>;
          if constexpr (std::is_same_v<K, units::UnitPtr>) {
            AppendUnit(ptr, "Check list", result);
          } else if constexpr (std::is_same_v<K, units::GeneratorPtr>) {
            if (!ptr) {
              throw GenerationError("Check list contains a null generator");
            }
            ExpandGenerator(*ptr, columns, result);
            result.generators.push_back(ptr->GetName());
          } else {
            if (!ptr) {
              throw GenerationError("Check list contains a null preset");
            }
            const auto origin = fmt::format("Preset {}", ptr->GetName());
            for (const auto &nested : ptr->Generate(input, columns)) {
              if (const auto *unit = std::get_if<units::UnitPtr>(&nested)) {
                AppendUnit(*unit, origin, result);
              } else if (const auto *generator =
                             std::get_if<units::GeneratorPtr>(&nested);
                         generator && *generator) {
                ExpandGenerator(**generator, columns, result);
              } else {
                throw GenerationError(
                    fmt::format("{} cannot emit {}", origin,
                                units::DescribeItem(nested)));
              }
            }
            result.presets.push_back(ptr->GetName());
          }
        },
        item);
  }

  SPDLOG_DEBUG("Expanded {} items into {} {} units ({} presets, {} generators)",
               items.size(), result.units.size(), KindPrefix(m_kind),
               result.presets.size(), result.generators.size());
  return result;
}

void ItemExpander::RecordProvenance(const ExpansionResult &result,
                                    Metadata &metadata) const {
  for (const auto &name : result.presets) {
    AppendToList(metadata, PresetsKey(m_kind), name);
  }
  for (const auto &name : result.generators) {
    AppendToList(metadata, GeneratorsKey(m_kind), name);
  }
}

} // namespace epoch_monitor::suite
