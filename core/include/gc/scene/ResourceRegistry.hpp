#pragma once
#include "gc/scene/Types.hpp"
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace gc {

// Tracks existence + kind for IDs (and generates IDs if client doesn't provide one).
// Single-threaded: every GeoCharting object is driven from one thread.
class ResourceRegistry {
public:
  ResourceRegistry() = default;

  Id allocate(ResourceKind kind);               // auto-id
  bool reserve(Id id, ResourceKind kind);       // client-provided id (fails if taken)

  bool exists(Id id) const;
  ResourceKind kindOf(Id id) const;             // throws std::runtime_error if unknown

  bool release(Id id);                          // removes from registry

  std::vector<Id> list(ResourceKind kind) const; // ascending
  std::size_t size() const { return kinds_.size(); }

private:
  Id next_{1};
  std::unordered_map<Id, ResourceKind> kinds_;
};

} // namespace gc
