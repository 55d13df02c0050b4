#include <charconv>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/core/result.h>
#include <fmt/format.h>

namespace epoch_monitor {

namespace {
// Walks the payload, returning nullptr with the failing segment on a miss.
const glz::generic *Resolve(const glz::generic &root, std::string_view path,
                            std::string &missingSegment) {
  const glz::generic *node = &root;
  size_t start = 0;
  while (start <= path.size()) {
    const auto dot = path.find('.', start);
    const auto segment = path.substr(
        start, dot == std::string_view::npos ? std::string_view::npos
                                             : dot - start);

    if (const auto *obj = std::get_if<glz::generic::object_t>(&node->data)) {
      auto it = obj->find(segment);
      if (it == obj->end()) {
        missingSegment = std::string{segment};
        return nullptr;
      }
      node = &it->second;
    } else if (const auto *arr =
                   std::get_if<glz::generic::array_t>(&node->data)) {
      size_t index{};
      auto [ptr, ec] = std::from_chars(segment.data(),
                                       segment.data() + segment.size(), index);
      if (ec != std::errc{} || ptr != segment.data() + segment.size() ||
          index >= arr->size()) {
        missingSegment = std::string{segment};
        return nullptr;
      }
      node = &(*arr)[index];
    } else {
      missingSegment = std::string{segment};
      return nullptr;
    }

    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  return node;
}
} // namespace

const glz::generic &Result::Get(std::string_view path) const {
  std::string missing;
  const auto *node = Resolve(m_payload, path, missing);
  if (!node) {
    throw FieldNotFoundError(std::string{path}, missing);
  }
  return *node;
}

bool Result::Contains(std::string_view path) const {
  std::string missing;
  return Resolve(m_payload, path, missing) != nullptr;
}

double Result::GetNumber(std::string_view path) const {
  const auto &node = Get(path);
  if (const auto *value = std::get_if<double>(&node.data)) {
    return *value;
  }
  if (const auto *flag = std::get_if<bool>(&node.data)) {
    return *flag ? 1.0 : 0.0;
  }
  throw FieldNotFoundError(std::string{path},
                           fmt::format("{} (not numeric)", path));
}

epoch_core::TestStatus Result::GetStatus() const {
  std::string missing;
  const auto *node = Resolve(m_payload, STATUS_FIELD, missing);
  if (!node) {
    return epoch_core::TestStatus::Null;
  }
  const auto *status = std::get_if<std::string>(&node->data);
  return status ? epoch_core::TestStatusWrapper::FromString(*status)
                : epoch_core::TestStatus::Null;
}

std::string Result::ToJson() const {
  return glz::write_json(m_payload).value_or("null");
}

glz::generic MakeTestPayload(epoch_core::TestStatus status,
                             std::string description,
                             glz::generic parameters) {
  glz::generic payload;
  payload.data = glz::generic::object_t{};
  auto &obj = std::get<glz::generic::object_t>(payload.data);
  obj[std::string{STATUS_FIELD}].data =
      epoch_core::TestStatusWrapper::ToString(status);
  obj[std::string{DESCRIPTION_FIELD}].data = std::move(description);
  if (!std::holds_alternative<std::nullptr_t>(parameters.data)) {
    obj["parameters"] = std::move(parameters);
  }
  return payload;
}

} // namespace epoch_monitor
