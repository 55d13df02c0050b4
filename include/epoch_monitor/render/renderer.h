#pragma once
#include <epoch_monitor/units/iunit.h>
#include <epoch_monitor_protos/dashboard.pb.h>
#include <glaze/glaze.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace epoch_monitor::render {

// Field filter applied to a unit's JSON view. Entries are top-level keys.
struct IncludeOptions {
  std::vector<std::string> include{};
  std::vector<std::string> exclude{};
};
using IncludeOptionsMap = std::map<std::string, IncludeOptions>;

struct RenderedWidget {
  proto::Widget widget;
  // Widget-local ids; made unique when assembled into a dashboard.
  std::vector<proto::GraphPayload> additionalGraphs;
};

struct IRenderer {
  virtual glz::generic
  RenderJson(const units::IComputationalUnit &unit,
             const std::optional<IncludeOptions> &options) const = 0;

  virtual proto::Table RenderTable(const units::IComputationalUnit &unit) const = 0;

  virtual std::vector<RenderedWidget>
  RenderWidgets(const units::IComputationalUnit &unit) const = 0;

  virtual ~IRenderer() = default;
};
using RendererPtr = std::shared_ptr<const IRenderer>;

/**
 * @brief Generic presentation of any unit result.
 *
 * JSON is the payload filtered by IncludeOptions. The table has one row with
 * a column per leaf field. Metrics render as a counter widget over the
 * numeric leaves of "current"; tests render as a text widget carrying the
 * status. Every widget links a details table as an additional graph.
 */
class DefaultRenderer : public IRenderer {
public:
  glz::generic
  RenderJson(const units::IComputationalUnit &unit,
             const std::optional<IncludeOptions> &options) const override;

  proto::Table RenderTable(const units::IComputationalUnit &unit) const override;

  std::vector<RenderedWidget>
  RenderWidgets(const units::IComputationalUnit &unit) const override;
};

class RendererRegistry {
public:
  void Register(const std::string &unitType, RendererPtr renderer);

  void SetFallback(RendererPtr renderer) { m_fallback = std::move(renderer); }

  // Throws ConfigurationError when neither a specific nor a fallback renderer
  // exists.
  [[nodiscard]] const IRenderer &Find(const std::string &unitType) const;

private:
  std::map<std::string, RendererPtr> m_renderers;
  RendererPtr m_fallback;
};

RendererRegistry CreateDefaultRendererRegistry();

// Leaf fields of a payload as (dotted path, value) pairs in key order.
std::vector<std::pair<std::string, const glz::generic *>>
FlattenPayload(const glz::generic &payload);

proto::Cell MakeCell(const glz::generic &value);

} // namespace epoch_monitor::render
