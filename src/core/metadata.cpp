#include <algorithm>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/core/metadata.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace epoch_monitor {

std::string KindPrefix(epoch_core::UnitKind kind) {
  switch (kind) {
  case epoch_core::UnitKind::Metric:
    return "metric";
  case epoch_core::UnitKind::Test:
    return "test";
  default:
    break;
  }
  throw ConfigurationError(fmt::format("Invalid unit kind: {}",
                                       epoch_core::UnitKindWrapper::ToString(kind)));
}

std::string PresetsKey(epoch_core::UnitKind kind) {
  return KindPrefix(kind) + "_presets";
}

std::string GeneratorsKey(epoch_core::UnitKind kind) {
  return KindPrefix(kind) + "_generators";
}

void AppendToList(Metadata &metadata, const std::string &key,
                  std::string value) {
  auto [it, inserted] =
      metadata.try_emplace(key, std::vector<std::string>{});
  auto *list = std::get_if<std::vector<std::string>>(&it->second);
  if (!list) {
    throw ConfigurationError(fmt::format(
        "Metadata key '{}' holds a scalar, cannot append '{}'", key, value));
  }
  list->push_back(std::move(value));
}

bool IsSupersetOf(const Metadata &metadata, const Metadata &subset) {
  return std::ranges::all_of(subset, [&](const auto &entry) {
    auto it = metadata.find(entry.first);
    return it != metadata.end() && it->second == entry.second;
  });
}

bool ContainsAllTags(const Tags &tags, const Tags &required) {
  return std::ranges::all_of(required, [&](const std::string &tag) {
    return std::ranges::find(tags, tag) != tags.end();
  });
}

void AddTag(Tags &tags, std::string tag) {
  if (std::ranges::find(tags, tag) == tags.end()) {
    tags.push_back(std::move(tag));
  }
}

glz::generic ToGeneric(const MetadataValue &value) {
  glz::generic out;
  std::visit(
      [&](const auto &item) {
        using K = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<K, std::vector<std::string>>) {
          glz::generic::array_t arr;
          for (const auto &element : item) {
            glz::generic g;
            g.data = element;
            arr.push_back(std::move(g));
          }
          out.data = std::move(arr);
        } else {
          out.data = item;
        }
      },
      value);
  return out;
}

glz::generic ToGeneric(const Metadata &metadata) {
  glz::generic out;
  out.data = glz::generic::object_t{};
  auto &obj = std::get<glz::generic::object_t>(out.data);
  for (const auto &[key, value] : metadata) {
    obj.emplace(key, ToGeneric(value));
  }
  return out;
}

bool MetadataValueFromGeneric(const glz::generic &value, MetadataValue &out) {
  if (const auto *s = std::get_if<std::string>(&value.data)) {
    out = *s;
    return true;
  }
  if (const auto *d = std::get_if<double>(&value.data)) {
    out = *d;
    return true;
  }
  if (const auto *b = std::get_if<bool>(&value.data)) {
    out = *b;
    return true;
  }
  if (const auto *arr = std::get_if<glz::generic::array_t>(&value.data)) {
    std::vector<std::string> list;
    list.reserve(arr->size());
    for (const auto &element : *arr) {
      const auto *s = std::get_if<std::string>(&element.data);
      if (!s) {
        return false;
      }
      list.push_back(*s);
    }
    out = std::move(list);
    return true;
  }
  return false;
}

Metadata MetadataFromYAML(const YAML::Node &node) {
  Metadata metadata;
  if (!node || node.IsNull()) {
    return metadata;
  }
  for (const auto &item : node) {
    const auto key = item.first.as<std::string>();
    const auto &value = item.second;
    if (value.IsSequence()) {
      metadata.emplace(key, value.as<std::vector<std::string>>());
      continue;
    }
    bool boolean{};
    double decimal{};
    if (value.Tag() != "!" && YAML::convert<bool>::decode(value, boolean)) {
      metadata.emplace(key, boolean);
    } else if (value.Tag() != "!" &&
               YAML::convert<double>::decode(value, decimal)) {
      metadata.emplace(key, decimal);
    } else {
      metadata.emplace(key, value.as<std::string>());
    }
  }
  return metadata;
}

std::string ToString(const MetadataValue &value) {
  return std::visit(
      [](const auto &item) -> std::string {
        using K = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<K, std::vector<std::string>>) {
          return fmt::format("[{}]", fmt::join(item, ", "));
        } else {
          return fmt::format("{}", item);
        }
      },
      value);
}

} // namespace epoch_monitor
