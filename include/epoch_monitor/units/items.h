#pragma once
#include <epoch_core/enum_wrapper.h>
#include <epoch_monitor/units/iunit.h>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

CREATE_ENUM(ColumnSelection, Numerical, Categorical, All);

namespace epoch_monitor::units {

struct IPreset;
struct IGenerator;
using PresetPtr = std::shared_ptr<const IPreset>;
using GeneratorPtr = std::shared_ptr<const IGenerator>;

// One entry of a declarative check list.
using CheckItem = std::variant<UnitPtr, PresetPtr, GeneratorPtr>;

// Named bundle of checks chosen from the data. May emit units and
// generators; nested generators are resolved by the expander.
struct IPreset {
  virtual std::string GetName() const = 0;

  virtual std::vector<CheckItem> Generate(const InputData &input,
                                          const DatasetColumns &columns) const = 0;

  virtual ~IPreset() = default;
};

// Emits units only, typically one per column.
struct IGenerator {
  virtual std::string GetName() const = 0;

  virtual std::vector<CheckItem>
  Generate(const DatasetColumns &columns) const = 0;

  virtual ~IGenerator() = default;
};

std::string DescribeItem(const CheckItem &item);

std::vector<std::string> SelectColumns(const DatasetColumns &columns,
                                       epoch_core::ColumnSelection selection);

// Instantiates one unit per selected column.
class ColumnGenerator : public IGenerator {
public:
  using Factory = std::function<UnitPtr(const std::string &column)>;

  ColumnGenerator(std::string name, Factory factory,
                  epoch_core::ColumnSelection selection,
                  std::optional<std::vector<std::string>> columns = std::nullopt)
      : m_name(std::move(name)), m_factory(std::move(factory)),
        m_selection(selection), m_columns(std::move(columns)) {}

  std::string GetName() const override { return m_name; }

  std::vector<CheckItem> Generate(const DatasetColumns &columns) const override;

private:
  std::string m_name;
  Factory m_factory;
  epoch_core::ColumnSelection m_selection;
  std::optional<std::vector<std::string>> m_columns;
};

template <typename Unit, typename... Args>
GeneratorPtr MakeColumnGenerator(std::string name,
                                 epoch_core::ColumnSelection selection,
                                 Args... extraArgs) {
  return std::make_shared<ColumnGenerator>(
      std::move(name),
      [=](const std::string &column) -> UnitPtr {
        return std::make_shared<Unit>(column, extraArgs...);
      },
      selection);
}

using PresetFactory = std::function<PresetPtr(const UnitArgs &)>;
using GeneratorFactory = std::function<GeneratorPtr(const UnitArgs &)>;

// Named presets and generators available to declarative configuration.
class ItemFactoryRegistry {
public:
  void RegisterPreset(const std::string &name, PresetFactory factory);
  void RegisterGenerator(const std::string &name, GeneratorFactory factory);

  // Throws ConfigurationError for an unknown name.
  [[nodiscard]] PresetPtr CreatePreset(const std::string &name,
                                       const UnitArgs &args) const;
  [[nodiscard]] GeneratorPtr CreateGenerator(const std::string &name,
                                             const UnitArgs &args) const;

private:
  std::map<std::string, PresetFactory> m_presets;
  std::map<std::string, GeneratorFactory> m_generators;
};

} // namespace epoch_monitor::units
