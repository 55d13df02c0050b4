#pragma once
#include <epoch_monitor/core/unit_args.h>
#include <functional>
#include <ostream>
#include <string>

namespace epoch_monitor {

/**
 * @brief Structural key of a computational unit.
 *
 * Two units with the same type tag and equal canonical arguments are
 * indistinguishable: they share one cache slot and one arena entry.
 */
struct UnitIdentity {
  std::string type;
  UnitArgs args{};

  [[nodiscard]] std::string ToString() const;

  bool operator==(const UnitIdentity &other) const {
    return type == other.type && args == other.args;
  }

  bool operator<(const UnitIdentity &other) const;
};

struct UnitIdentityHash {
  size_t operator()(const UnitIdentity &identity) const;
};

std::ostream &operator<<(std::ostream &os, const UnitIdentity &identity);

} // namespace epoch_monitor

template <> struct std::hash<epoch_monitor::UnitIdentity> {
  size_t operator()(const epoch_monitor::UnitIdentity &identity) const {
    return epoch_monitor::UnitIdentityHash{}(identity);
  }
};
