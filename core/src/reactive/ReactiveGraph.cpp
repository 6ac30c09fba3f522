#include "gc/reactive/ReactiveGraph.hpp"

#include <stdexcept>

namespace gc {

const ReactiveGraph::Node& ReactiveGraph::node(NodeId id) const {
  if (id >= nodes_.size()) throw std::out_of_range("ReactiveGraph: unknown node " + std::to_string(id));
  return nodes_[id];
}

NodeId ReactiveGraph::addSource(const std::string& name) {
  Node n;
  n.name = name;
  nodes_.push_back(std::move(n));
  return static_cast<NodeId>(nodes_.size() - 1);
}

NodeId ReactiveGraph::addDerived(const std::string& name, const std::vector<NodeId>& deps,
                                 std::function<void()> compute) {
  if (!compute) throw std::invalid_argument("ReactiveGraph: derived node '" + name + "' has no compute");
  const auto id = static_cast<NodeId>(nodes_.size());
  for (NodeId d : deps) {
    if (d >= id) throw std::invalid_argument("ReactiveGraph: '" + name + "' depends on unknown node");
  }

  Node n;
  n.name = name;
  n.compute = std::move(compute);
  nodes_.push_back(std::move(n));
  for (NodeId d : deps) nodes_[d].dependents.push_back(id);
  return id;
}

void ReactiveGraph::markDirty(NodeId id) {
  std::vector<NodeId> stack{id};
  while (!stack.empty()) {
    const NodeId cur = stack.back();
    stack.pop_back();
    Node& n = nodes_[cur];
    n.state = NodeState::Dirty;
    for (NodeId d : n.dependents) {
      if (nodes_[d].state != NodeState::Dirty) stack.push_back(d);
    }
  }
}

void ReactiveGraph::invalidate(NodeId id) {
  node(id); // range check
  markDirty(id);

  if (graphState_ == GraphState::Recomputing) {
    pendingPass_ = true;
    return;
  }
  if (batchDepth_ > 0) return;
  flush();
}

bool ReactiveGraph::anyDirty() const {
  for (const Node& n : nodes_) {
    if (n.state == NodeState::Dirty) return true;
  }
  return false;
}

void ReactiveGraph::flush() {
  if (graphState_ == GraphState::Recomputing) {
    pendingPass_ = true;
    return;
  }
  if (!anyDirty()) return;

  graphState_ = GraphState::Recomputing;
  do {
    pendingPass_ = false;
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
      if (nodes_[i].state != NodeState::Dirty) continue;
      nodes_[i].state = NodeState::Clean;
      if (!nodes_[i].compute) continue;
      try {
        nodes_[i].compute();
      } catch (...) {
        nodes_[i].state = NodeState::Dirty;
        pendingPass_ = false;
        graphState_ = GraphState::Idle;
        throw;
      }
    }
    passCount_++;
  } while (pendingPass_);
  graphState_ = GraphState::Idle;
}

void ReactiveGraph::beginBatch() {
  batchDepth_++;
}

void ReactiveGraph::endBatch() {
  if (batchDepth_ == 0) throw std::logic_error("ReactiveGraph: endBatch without beginBatch");
  if (--batchDepth_ == 0) flush();
}

NodeState ReactiveGraph::state(NodeId id) const {
  return node(id).state;
}

const std::string& ReactiveGraph::name(NodeId id) const {
  return node(id).name;
}

} // namespace gc
