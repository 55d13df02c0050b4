#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/core/unit_args.h>
#include <cmath>
#include <fmt/format.h>
#include <typeinfo>

namespace epoch_monitor {

namespace {
std::string QuoteString(const std::string &value) {
  return glz::write_json(value).value_or("\"\"");
}

std::string FormatDecimal(double value) { return fmt::format("{:.17g}", value); }

double NormalizeDecimal(double value) {
  if (std::isnan(value)) {
    throw ConfigurationError("NaN is not a valid unit argument");
  }
  return value == 0.0 ? 0.0 : value;
}

template <class K> const K &GetOrThrow(const ArgValue::T &value) {
  if (const auto *ptr = std::get_if<K>(&value)) {
    return *ptr;
  }
  throw ConfigurationError(fmt::format(
      "Bad argument access: expected {}, got variant index {}",
      typeid(K).name(), value.index()));
}
} // namespace

ArgValue::ArgValue(double value) : m_value(NormalizeDecimal(value)) {}

ArgValue::ArgValue(const std::vector<std::string> &values) {
  ArgSequence seq;
  seq.reserve(values.size());
  for (const auto &val : values) {
    seq.emplace_back(val);
  }
  m_value = std::move(seq);
}

bool ArgValue::GetBoolean() const { return GetOrThrow<bool>(m_value); }

double ArgValue::GetDecimal() const { return GetOrThrow<double>(m_value); }

const std::string &ArgValue::GetString() const {
  return GetOrThrow<std::string>(m_value);
}

const ArgSequence &ArgValue::GetSequence() const {
  return GetOrThrow<ArgSequence>(m_value);
}

const ArgMapping &ArgValue::GetMapping() const {
  return GetOrThrow<ArgMapping>(m_value);
}

const ArgValue *ArgValue::Find(std::string_view dottedPath) const {
  if (dottedPath.empty()) {
    return this;
  }
  const auto *mapping = std::get_if<ArgMapping>(&m_value);
  if (!mapping) {
    return nullptr;
  }
  const auto dot = dottedPath.find('.');
  const std::string head{dottedPath.substr(0, dot)};
  auto it = mapping->find(head);
  if (it == mapping->end()) {
    return nullptr;
  }
  if (dot == std::string_view::npos) {
    return &it->second;
  }
  return it->second.Find(dottedPath.substr(dot + 1));
}

std::string ArgValue::ToString() const {
  return std::visit(
      [](const auto &value) -> std::string {
        using K = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<K, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<K, bool>) {
          return value ? "true" : "false";
        } else if constexpr (std::is_same_v<K, double>) {
          return FormatDecimal(value);
        } else if constexpr (std::is_same_v<K, std::string>) {
          return QuoteString(value);
        } else if constexpr (std::is_same_v<K, ArgSequence>) {
          std::string out = "[";
          for (size_t i = 0; i < value.size(); ++i) {
            if (i > 0) {
              out += ",";
            }
            out += value[i].ToString();
          }
          return out + "]";
        } else {
          std::string out = "{";
          bool first = true;
          for (const auto &[key, item] : value) {
            if (!first) {
              out += ",";
            }
            first = false;
            out += QuoteString(key) + ":" + item.ToString();
          }
          return out + "}";
        }
      },
      m_value);
}

bool ArgValue::operator==(const ArgValue &other) const {
  return m_value == other.m_value;
}

void ArgValue::decode(const YAML::Node &node) {
  switch (node.Type()) {
  case YAML::NodeType::Null:
  case YAML::NodeType::Undefined:
    m_value = std::monostate{};
    return;
  case YAML::NodeType::Sequence: {
    ArgSequence seq;
    for (const auto &item : node) {
      seq.push_back(item.as<ArgValue>());
    }
    m_value = std::move(seq);
    return;
  }
  case YAML::NodeType::Map: {
    ArgMapping mapping;
    for (const auto &item : node) {
      mapping.emplace(item.first.as<std::string>(), item.second.as<ArgValue>());
    }
    m_value = std::move(mapping);
    return;
  }
  case YAML::NodeType::Scalar:
    break;
  }

  // Quoted scalars stay strings.
  if (node.Tag() == "!") {
    m_value = node.as<std::string>();
    return;
  }
  bool boolean{};
  if (YAML::convert<bool>::decode(node, boolean)) {
    m_value = boolean;
    return;
  }
  double decimal{};
  if (YAML::convert<double>::decode(node, decimal)) {
    m_value = NormalizeDecimal(decimal);
    return;
  }
  m_value = node.as<std::string>();
}

std::string ToCanonicalString(const UnitArgs &args) {
  return ArgValue{args}.ToString();
}

const ArgValue *FindArg(const UnitArgs &args, std::string_view dottedPath) {
  const auto dot = dottedPath.find('.');
  auto it = args.find(std::string{dottedPath.substr(0, dot)});
  if (it == args.end()) {
    return nullptr;
  }
  if (dot == std::string_view::npos) {
    return &it->second;
  }
  return it->second.Find(dottedPath.substr(dot + 1));
}

bool MatchesTemplate(const UnitArgs &args, const UnitArgs &argsTemplate) {
  for (const auto &[key, expected] : argsTemplate) {
    const auto *actual = FindArg(args, key);
    if (!actual || !(*actual == expected)) {
      return false;
    }
  }
  return true;
}

glz::generic ToGeneric(const ArgValue &value) {
  return std::visit(
      [](const auto &item) -> glz::generic {
        using K = std::decay_t<decltype(item)>;
        glz::generic out;
        if constexpr (std::is_same_v<K, std::monostate>) {
          out.data = nullptr;
        } else if constexpr (std::is_same_v<K, ArgSequence>) {
          glz::generic::array_t arr;
          arr.reserve(item.size());
          for (const auto &element : item) {
            arr.push_back(ToGeneric(element));
          }
          out.data = std::move(arr);
        } else if constexpr (std::is_same_v<K, ArgMapping>) {
          glz::generic::object_t obj;
          for (const auto &[key, element] : item) {
            obj.emplace(key, ToGeneric(element));
          }
          out.data = std::move(obj);
        } else {
          out.data = item;
        }
        return out;
      },
      value.GetVariant());
}

glz::generic ToGeneric(const UnitArgs &args) {
  glz::generic out;
  out.data = glz::generic::object_t{};
  auto &obj = std::get<glz::generic::object_t>(out.data);
  for (const auto &[key, value] : args) {
    obj.emplace(key, ToGeneric(value));
  }
  return out;
}

ArgValue ArgValueFromGeneric(const glz::generic &value) {
  if (const auto *b = std::get_if<bool>(&value.data)) {
    return ArgValue{*b};
  }
  if (const auto *d = std::get_if<double>(&value.data)) {
    return ArgValue{*d};
  }
  if (const auto *s = std::get_if<std::string>(&value.data)) {
    return ArgValue{*s};
  }
  if (const auto *arr = std::get_if<glz::generic::array_t>(&value.data)) {
    ArgSequence seq;
    seq.reserve(arr->size());
    for (const auto &element : *arr) {
      seq.push_back(ArgValueFromGeneric(element));
    }
    return ArgValue{std::move(seq)};
  }
  if (const auto *obj = std::get_if<glz::generic::object_t>(&value.data)) {
    ArgMapping mapping;
    for (const auto &[key, element] : *obj) {
      mapping.emplace(key, ArgValueFromGeneric(element));
    }
    return ArgValue{std::move(mapping)};
  }
  return ArgValue{};
}

UnitArgs UnitArgsFromGeneric(const glz::generic &value) {
  const auto *obj = std::get_if<glz::generic::object_t>(&value.data);
  if (!obj) {
    throw ConfigurationError(
        fmt::format("Unit arguments must be an object, got: {}",
                    glz::write_json(value).value_or("<unprintable>")));
  }
  UnitArgs args;
  for (const auto &[key, element] : *obj) {
    args.emplace(key, ArgValueFromGeneric(element));
  }
  return args;
}

UnitArgs UnitArgsFromYAML(const YAML::Node &node) {
  UnitArgs args;
  if (!node || node.IsNull()) {
    return args;
  }
  if (!node.IsMap()) {
    throw ConfigurationError(
        fmt::format("Unit arguments must be a mapping at line {}",
                    node.Mark().line + 1));
  }
  for (const auto &item : node) {
    args.emplace(item.first.as<std::string>(), item.second.as<ArgValue>());
  }
  return args;
}

} // namespace epoch_monitor
