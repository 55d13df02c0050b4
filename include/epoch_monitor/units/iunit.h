#pragma once
#include <epoch_frame/dataframe.h>
#include <epoch_monitor/core/metadata.h>
#include <epoch_monitor/core/result.h>
#include <epoch_monitor/core/unit_identity.h>
#include <epoch_monitor/data/input_data.h>
#include <memory>
#include <string>
#include <vector>

namespace epoch_monitor::suite {
class Context;
}

namespace epoch_monitor::units {

// A derived column generated once per run for current and reference data.
struct IFeatureGenerator {
  virtual std::string GetFeatureId() const = 0;

  virtual epoch_frame::DataFrame
  Generate(const epoch_frame::DataFrame &data,
           const DataDefinition &definition) const = 0;

  virtual ~IFeatureGenerator() = default;
};
using FeatureGeneratorPtr = std::shared_ptr<const IFeatureGenerator>;

struct IComputationalUnit;
using UnitPtr = std::shared_ptr<IComputationalUnit>;

struct IComputationalUnit {
  virtual std::string GetType() const = 0;

  virtual const UnitArgs &GetArgs() const = 0;

  virtual const UnitIdentity &GetIdentity() const = 0;

  virtual epoch_core::UnitKind GetKind() const = 0;

  // Units this unit reads from the context. They are registered ahead of it.
  virtual std::vector<UnitPtr> GetDependencies() const = 0;

  virtual std::vector<FeatureGeneratorPtr> RequiredFeatures() const = 0;

  // Pure function of the input and of dependency results in the context.
  virtual Result Compute(const InputData &input,
                         suite::Context &context) const = 0;

  // Binds the unit to the context holding its result.
  virtual void SetContext(std::shared_ptr<const suite::Context> context) = 0;

  // Throws ResultNotReadyError when unbound or not yet computed.
  virtual const Result &GetResult() const = 0;

  virtual ~IComputationalUnit() = default;
};

class ComputationalUnit : public IComputationalUnit {

public:
  ComputationalUnit(std::string type, UnitArgs args, epoch_core::UnitKind kind)
      : m_identity{std::move(type), std::move(args)}, m_kind(kind) {}

  std::string GetType() const final { return m_identity.type; }

  const UnitArgs &GetArgs() const final { return m_identity.args; }

  const UnitIdentity &GetIdentity() const final { return m_identity; }

  epoch_core::UnitKind GetKind() const final { return m_kind; }

  std::vector<UnitPtr> GetDependencies() const override { return {}; }

  std::vector<FeatureGeneratorPtr> RequiredFeatures() const override {
    return {};
  }

  void SetContext(std::shared_ptr<const suite::Context> context) final {
    m_context = std::move(context);
  }

  const Result &GetResult() const final;

protected:
  const ArgValue &GetArg(const std::string &key) const;

  // Result of a dependency, computing it through the context when missing.
  static const Result &GetDependencyResult(const IComputationalUnit &unit,
                                           const InputData &input,
                                           suite::Context &context);

private:
  UnitIdentity m_identity;
  epoch_core::UnitKind m_kind;
  std::shared_ptr<const suite::Context> m_context;
};

} // namespace epoch_monitor::units
