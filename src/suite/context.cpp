#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/suite/context.h>
#include <epoch_monitor/units/iunit.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_monitor::suite {

const Result *Context::Find(const UnitIdentity &identity) const {
  auto it = m_results.find(identity);
  return it == m_results.end() ? nullptr : &it->second;
}

const Result &Context::GetOrCompute(const units::IComputationalUnit &unit,
                                    const InputData &input) {
  const auto &identity = unit.GetIdentity();
  if (const auto *cached = Find(identity)) {
    return *cached;
  }
  if (m_inProgress.contains(identity)) {
    throw std::logic_error(
        fmt::format("Cyclic dependency detected at {}", identity.ToString()));
  }

  m_inProgress.insert(identity);
  Result result;
  try {
    SPDLOG_DEBUG("Computing {}", identity.ToString());
    result = unit.Compute(input, *this);
  } catch (const ComputationError &) {
    m_inProgress.erase(identity);
    throw;
  } catch (const std::exception &exp) {
    m_inProgress.erase(identity);
    SPDLOG_ERROR("Unit {} failed: {}", identity.ToString(), exp.what());
    throw ComputationError(identity, exp.what());
  }
  m_inProgress.erase(identity);

  auto [it, inserted] = m_results.emplace(identity, std::move(result));
  return it->second;
}

void Context::Insert(const UnitIdentity &identity, Result result) {
  auto [it, inserted] = m_results.emplace(identity, std::move(result));
  if (!inserted) {
    throw std::logic_error(fmt::format("Result for {} already stored",
                                       identity.ToString()));
  }
}

void Context::Reset() {
  m_results.clear();
  m_inProgress.clear();
}

} // namespace epoch_monitor::suite
