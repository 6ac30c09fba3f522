#pragma once
#include "gc/proj/Transform.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gc {

// Holds the axis' current Transform and notifies listeners when it is
// replaced. Identity is the held pointer; version() counts replacements.
class TransformHolder {
public:
  using Listener = std::function<void(const std::shared_ptr<const Transform>&)>;

  // Throws std::invalid_argument if `initial` is null.
  explicit TransformHolder(std::shared_ptr<const Transform> initial);

  const std::shared_ptr<const Transform>& get() const { return current_; }
  std::uint64_t version() const { return version_; }

  // Builds a new transform; on InvalidProjectionError the held one is kept.
  void set(const std::string& source, const std::string& dest);

  // Setting the pointer already held is a no-op.
  void set(std::shared_ptr<const Transform> transform);

  std::uint32_t subscribe(Listener fn);
  void unsubscribe(std::uint32_t token);

private:
  struct Subscription {
    std::uint32_t token;
    Listener fn;
  };

  std::shared_ptr<const Transform> current_;
  std::uint64_t version_{0};
  std::uint32_t nextToken_{1};
  std::vector<Subscription> listeners_;
};

} // namespace gc
