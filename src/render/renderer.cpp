#include <algorithm>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/render/renderer.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor::render {

namespace {
void FlattenInto(const glz::generic &node, const std::string &prefix,
                 std::vector<std::pair<std::string, const glz::generic *>> &out) {
  if (const auto *obj = std::get_if<glz::generic::object_t>(&node.data)) {
    for (const auto &[key, child] : *obj) {
      FlattenInto(child, prefix.empty() ? key : prefix + "." + key, out);
    }
    return;
  }
  if (const auto *arr = std::get_if<glz::generic::array_t>(&node.data)) {
    for (size_t i = 0; i < arr->size(); ++i) {
      FlattenInto((*arr)[i],
                  prefix.empty() ? std::to_string(i)
                                 : prefix + "." + std::to_string(i),
                  out);
    }
    return;
  }
  out.emplace_back(prefix, &node);
}

proto::Table DetailsTable(const units::IComputationalUnit &unit) {
  proto::Table table;
  table.set_title(fmt::format("{} details", unit.GetType()));
  table.add_columns("field");
  table.add_columns("value");
  for (const auto &[path, value] : FlattenPayload(unit.GetResult().Payload())) {
    auto *row = table.add_rows();
    row->add_cells()->set_text(path);
    *row->add_cells() = MakeCell(*value);
  }
  return table;
}
} // namespace

std::vector<std::pair<std::string, const glz::generic *>>
FlattenPayload(const glz::generic &payload) {
  std::vector<std::pair<std::string, const glz::generic *>> out;
  FlattenInto(payload, "", out);
  return out;
}

proto::Cell MakeCell(const glz::generic &value) {
  proto::Cell cell;
  if (const auto *d = std::get_if<double>(&value.data)) {
    cell.set_decimal(*d);
  } else if (const auto *b = std::get_if<bool>(&value.data)) {
    cell.set_boolean(*b);
  } else if (const auto *s = std::get_if<std::string>(&value.data)) {
    cell.set_text(*s);
  } else if (!std::holds_alternative<std::nullptr_t>(value.data)) {
    cell.set_text(glz::write_json(value).value_or(""));
  }
  return cell;
}

glz::generic
DefaultRenderer::RenderJson(const units::IComputationalUnit &unit,
                            const std::optional<IncludeOptions> &options) const {
  glz::generic payload = unit.GetResult().Payload();
  auto *obj = std::get_if<glz::generic::object_t>(&payload.data);
  if (!options || !obj) {
    return payload;
  }
  if (!options->include.empty()) {
    std::erase_if(*obj, [&](const auto &entry) {
      return std::ranges::find(options->include, entry.first) ==
             options->include.end();
    });
  }
  for (const auto &key : options->exclude) {
    obj->erase(key);
  }
  return payload;
}

proto::Table
DefaultRenderer::RenderTable(const units::IComputationalUnit &unit) const {
  proto::Table table;
  table.set_title(unit.GetType());
  auto *row = table.add_rows();
  for (const auto &[path, value] : FlattenPayload(unit.GetResult().Payload())) {
    table.add_columns(path);
    *row->add_cells() = MakeCell(*value);
  }
  return table;
}

std::vector<RenderedWidget>
DefaultRenderer::RenderWidgets(const units::IComputationalUnit &unit) const {
  const auto &result = unit.GetResult();
  RenderedWidget rendered;
  auto &widget = rendered.widget;
  widget.set_title(unit.GetType());
  widget.set_size(proto::SIZE_HALF);

  if (unit.GetKind() == epoch_core::UnitKind::Test) {
    widget.set_type(proto::WIDGET_TEXT);
    const auto status = result.GetStatus();
    auto *counter = widget.add_counters();
    counter->set_label("status");
    counter->set_text(epoch_core::TestStatusWrapper::ToString(status));
    if (result.Contains(DESCRIPTION_FIELD)) {
      if (const auto *text =
              std::get_if<std::string>(&result.Get(DESCRIPTION_FIELD).data)) {
        widget.set_text(*text);
      }
    }
  } else {
    widget.set_type(proto::WIDGET_COUNTER);
    const auto &payload = result.Payload();
    const auto *current =
        result.Contains("current") ? &result.Get("current") : &payload;
    for (const auto &[path, value] : FlattenPayload(*current)) {
      if (const auto *d = std::get_if<double>(&value->data)) {
        auto *counter = widget.add_counters();
        counter->set_label(path);
        counter->set_decimal(*d);
      }
    }
  }

  proto::GraphPayload details;
  details.set_id("details");
  details.set_title(fmt::format("{} details", unit.GetType()));
  *details.mutable_table() = DetailsTable(unit);
  widget.add_additional_graph_ids(details.id());
  rendered.additionalGraphs.push_back(std::move(details));

  return {std::move(rendered)};
}

void RendererRegistry::Register(const std::string &unitType,
                                RendererPtr renderer) {
  m_renderers.insert_or_assign(unitType, std::move(renderer));
}

const IRenderer &RendererRegistry::Find(const std::string &unitType) const {
  if (auto it = m_renderers.find(unitType); it != m_renderers.end()) {
    return *it->second;
  }
  if (m_fallback) {
    return *m_fallback;
  }
  throw ConfigurationError(
      fmt::format("No renderer registered for unit type {}", unitType));
}

RendererRegistry CreateDefaultRendererRegistry() {
  RendererRegistry registry;
  registry.SetFallback(std::make_shared<DefaultRenderer>());
  return registry;
}

} // namespace epoch_monitor::render
