#pragma once
#include <epoch_monitor/core/unit_identity.h>
#include <stdexcept>
#include <string>

namespace epoch_monitor {

class MonitorError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Invalid report or project configuration: missing current data, missing
// renderer, malformed declarative config.
class ConfigurationError : public MonitorError {
public:
  using MonitorError::MonitorError;
};

// A preset or generator emitted something other than a unit of the expected
// kind.
class GenerationError : public ConfigurationError {
public:
  using ConfigurationError::ConfigurationError;
};

class ComputationError : public MonitorError {
public:
  ComputationError(UnitIdentity identity, const std::string &cause);

  const UnitIdentity &Identity() const { return m_identity; }

private:
  UnitIdentity m_identity;
};

// Unknown group, graph, project, snapshot or aggregation.
class NotFoundError : public MonitorError {
public:
  using MonitorError::MonitorError;
};

class CorruptSnapshotError : public MonitorError {
public:
  using MonitorError::MonitorError;
};

class FieldNotFoundError : public MonitorError {
public:
  FieldNotFoundError(std::string path, const std::string &segment);

  const std::string &Path() const { return m_path; }

private:
  std::string m_path;
};

class ResultNotReadyError : public std::logic_error {
public:
  explicit ResultNotReadyError(const UnitIdentity &identity);
};

} // namespace epoch_monitor
