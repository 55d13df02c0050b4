#include <epoch_monitor/core/errors.h>
#include <fmt/format.h>

namespace epoch_monitor {

ComputationError::ComputationError(UnitIdentity identity,
                                   const std::string &cause)
    : MonitorError(fmt::format("Computation of {} failed: {}",
                               identity.ToString(), cause)),
      m_identity(std::move(identity)) {}

FieldNotFoundError::FieldNotFoundError(std::string path,
                                       const std::string &segment)
    : MonitorError(fmt::format("Field '{}' not found (missing segment '{}')",
                               path, segment)),
      m_path(std::move(path)) {}

ResultNotReadyError::ResultNotReadyError(const UnitIdentity &identity)
    : std::logic_error(fmt::format(
          "Result of {} requested before it was computed or bound",
          identity.ToString())) {}

} // namespace epoch_monitor
