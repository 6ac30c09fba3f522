#include "gc/scene/ResourceRegistry.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace gc {

Id ResourceRegistry::allocate(ResourceKind kind) {
  // Client-reserved ids may sit anywhere; skip over them.
  while (next_ == kInvalidId || kinds_.count(next_) != 0) ++next_;
  const Id id = next_++;
  kinds_.emplace(id, kind);
  return id;
}

bool ResourceRegistry::reserve(Id id, ResourceKind kind) {
  if (id == kInvalidId) return false;
  return kinds_.emplace(id, kind).second;
}

bool ResourceRegistry::exists(Id id) const {
  return kinds_.count(id) != 0;
}

ResourceKind ResourceRegistry::kindOf(Id id) const {
  auto it = kinds_.find(id);
  if (it == kinds_.end()) {
    throw std::runtime_error("ResourceRegistry: unknown id " + idStr(id));
  }
  return it->second;
}

bool ResourceRegistry::release(Id id) {
  return kinds_.erase(id) > 0;
}

std::vector<Id> ResourceRegistry::list(ResourceKind kind) const {
  std::vector<Id> out;
  for (const auto& kv : kinds_) {
    if (kv.second == kind) out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace gc
