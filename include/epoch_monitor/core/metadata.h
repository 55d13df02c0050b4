#pragma once
#include <epoch_core/enum_wrapper.h>
#include <glaze/glaze.hpp>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>

CREATE_ENUM(UnitKind, Metric, Test);

namespace epoch_monitor {

using MetadataValue =
    std::variant<std::string, double, bool, std::vector<std::string>>;
using Metadata = std::map<std::string, MetadataValue>;
using Tags = std::vector<std::string>;

namespace metadata_keys {
inline constexpr std::string_view BATCH_SIZE = "batch_size";
inline constexpr std::string_view MODEL_ID = "model_id";
inline constexpr std::string_view REFERENCE_ID = "reference_id";
inline constexpr std::string_view DATASET_ID = "dataset_id";
} // namespace metadata_keys

// "metric" or "test"; prefixes provenance keys and names dict sections.
std::string KindPrefix(epoch_core::UnitKind kind);

// "<kind>_presets"
std::string PresetsKey(epoch_core::UnitKind kind);

// "<kind>_generators"
std::string GeneratorsKey(epoch_core::UnitKind kind);

// Appends value to the string list stored under key, creating it if absent.
void AppendToList(Metadata &metadata, const std::string &key,
                  std::string value);

// Every entry of subset is present in metadata with an equal value.
bool IsSupersetOf(const Metadata &metadata, const Metadata &subset);

bool ContainsAllTags(const Tags &tags, const Tags &required);

void AddTag(Tags &tags, std::string tag);

glz::generic ToGeneric(const MetadataValue &value);
glz::generic ToGeneric(const Metadata &metadata);

// Returns false when the value shape is not a metadata value.
bool MetadataValueFromGeneric(const glz::generic &value, MetadataValue &out);

Metadata MetadataFromYAML(const YAML::Node &node);

std::string ToString(const MetadataValue &value);

} // namespace epoch_monitor
