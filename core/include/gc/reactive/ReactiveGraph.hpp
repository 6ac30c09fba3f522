#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace gc {

using NodeId = std::uint32_t;

enum class NodeState : std::uint8_t { Clean, Dirty };
enum class GraphState : std::uint8_t { Idle, Recomputing };

// Dirty/clean dependency graph with a coalescing scheduler.
//
// Source nodes hold inputs; derived nodes run a compute callback. Derived
// nodes may only depend on nodes created before them, so creation order is a
// topological order. invalidate() marks a node and everything downstream
// dirty, then flushes unless a batch is open. Invalidations that arrive
// while a flush is running set a pending flag; exactly one more pass runs
// afterwards, however many arrived.
class ReactiveGraph {
public:
  NodeId addSource(const std::string& name);

  // Throws std::invalid_argument for unknown dependencies.
  NodeId addDerived(const std::string& name, const std::vector<NodeId>& deps,
                    std::function<void()> compute);

  void invalidate(NodeId id);

  // Recompute every dirty derived node in creation order. Re-entrant calls
  // during a pass are coalesced into the pending pass. If a compute callback
  // throws, that node stays dirty, the graph returns to Idle and the
  // exception propagates.
  void flush();

  void beginBatch();
  void endBatch();   // flushes when the outermost batch closes

  // beginBatch/endBatch around fn. If fn throws, the batch is closed
  // without flushing and the exception propagates.
  template <typename Fn>
  void batch(Fn&& fn) {
    beginBatch();
    try {
      fn();
    } catch (...) {
      batchDepth_--;
      throw;
    }
    endBatch();
  }

  NodeState state(NodeId id) const;
  GraphState graphState() const { return graphState_; }
  const std::string& name(NodeId id) const;
  std::size_t nodeCount() const { return nodes_.size(); }

  // Completed passes (a pass recomputes all currently dirty nodes once).
  std::uint64_t passCount() const { return passCount_; }

private:
  struct Node {
    std::string name;
    NodeState state{NodeState::Clean};
    std::vector<NodeId> dependents;
    std::function<void()> compute; // empty for sources
  };

  const Node& node(NodeId id) const;
  void markDirty(NodeId id);
  bool anyDirty() const;

  std::vector<Node> nodes_;
  GraphState graphState_{GraphState::Idle};
  int batchDepth_{0};
  bool pendingPass_{false};
  std::uint64_t passCount_{0};
};

} // namespace gc
