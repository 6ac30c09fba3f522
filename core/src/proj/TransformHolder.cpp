#include "gc/proj/TransformHolder.hpp"

#include <algorithm>
#include <stdexcept>

namespace gc {

TransformHolder::TransformHolder(std::shared_ptr<const Transform> initial)
  : current_(std::move(initial)) {
  if (!current_) throw std::invalid_argument("TransformHolder: null transform");
}

void TransformHolder::set(const std::string& source, const std::string& dest) {
  set(Transform::create(source, dest));
}

void TransformHolder::set(std::shared_ptr<const Transform> transform) {
  if (!transform) throw std::invalid_argument("TransformHolder: null transform");
  if (transform == current_) return;

  current_ = std::move(transform);
  version_++;

  // Listeners may unsubscribe while being notified.
  const auto snapshot = listeners_;
  for (const auto& s : snapshot) s.fn(current_);
}

std::uint32_t TransformHolder::subscribe(Listener fn) {
  const std::uint32_t token = nextToken_++;
  listeners_.push_back(Subscription{token, std::move(fn)});
  return token;
}

void TransformHolder::unsubscribe(std::uint32_t token) {
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [token](const Subscription& s) { return s.token == token; }),
                   listeners_.end());
}

} // namespace gc
