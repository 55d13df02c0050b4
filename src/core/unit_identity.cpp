#include <boost/container_hash/hash.hpp>
#include <epoch_monitor/core/unit_identity.h>
#include <tuple>

namespace epoch_monitor {

std::string UnitIdentity::ToString() const {
  return type + ToCanonicalString(args);
}

bool UnitIdentity::operator<(const UnitIdentity &other) const {
  return std::forward_as_tuple(type, ToCanonicalString(args)) <
         std::forward_as_tuple(other.type, ToCanonicalString(other.args));
}

size_t UnitIdentityHash::operator()(const UnitIdentity &identity) const {
  size_t seed = 0;
  boost::hash_combine(seed, identity.type);
  boost::hash_combine(seed, ToCanonicalString(identity.args));
  return seed;
}

std::ostream &operator<<(std::ostream &os, const UnitIdentity &identity) {
  return os << identity.ToString();
}

} // namespace epoch_monitor
