#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/suite/context.h>
#include <epoch_monitor/units/iunit.h>
#include <fmt/format.h>

namespace epoch_monitor::units {

const Result &ComputationalUnit::GetResult() const {
  if (m_context) {
    if (const auto *result = m_context->Find(m_identity)) {
      return *result;
    }
  }
  throw ResultNotReadyError(m_identity);
}

const ArgValue &ComputationalUnit::GetArg(const std::string &key) const {
  auto it = m_identity.args.find(key);
  if (it == m_identity.args.end()) {
    throw ConfigurationError(fmt::format("{} requires argument '{}'",
                                         m_identity.type, key));
  }
  return it->second;
}

const Result &ComputationalUnit::GetDependencyResult(
    const IComputationalUnit &unit, const InputData &input,
    suite::Context &context) {
  return context.GetOrCompute(unit, input);
}

} // namespace epoch_monitor::units
