#pragma once
#include <epoch_monitor/units/iunit.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace epoch_monitor::units {

using UnitFactory = std::function<UnitPtr(const UnitArgs &)>;

// Maps a unit type tag to a constructor from arguments. Snapshot restore
// builds every unit through one of these.
class UnitRegistry {
public:
  void Register(const std::string &type, UnitFactory factory);

  template <typename T> void Register() {
    Register(std::string{T::TYPE}, [](const UnitArgs &args) -> UnitPtr {
      return std::make_shared<T>(args);
    });
  }

  [[nodiscard]] bool Contains(const std::string &type) const {
    return m_factories.contains(type);
  }

  // Throws NotFoundError for an unknown type and ConfigurationError when the
  // arguments are invalid or the factory yields a unit of another type.
  [[nodiscard]] UnitPtr Create(const std::string &type,
                               const UnitArgs &args) const;

  [[nodiscard]] std::vector<std::string> GetTypes() const;

private:
  std::map<std::string, UnitFactory> m_factories;
};

} // namespace epoch_monitor::units
