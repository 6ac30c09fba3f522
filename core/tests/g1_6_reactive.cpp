// G1.6 — ReactiveGraph
// Tests:
//   1. invalidate marks downstream dirty and flushes in creation order
//   2. batch folds several invalidations into one recompute
//   3. invalidations during a pass coalesce into exactly one more pass
//   4. a throwing compute leaves its node dirty and the graph idle
//   5. misuse is reported

#include "gc/reactive/ReactiveGraph.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: order ---
  {
    gc::ReactiveGraph g;
    std::vector<std::string> log;
    const gc::NodeId a = g.addSource("a");
    const gc::NodeId b = g.addSource("b");
    const gc::NodeId sum = g.addDerived("sum", {a, b}, [&] { log.push_back("sum"); });
    const gc::NodeId out = g.addDerived("out", {sum}, [&] { log.push_back("out"); });
    const gc::NodeId other = g.addDerived("other", {b}, [&] { log.push_back("other"); });

    requireTrue(g.nodeCount() == 5, "five nodes");
    requireTrue(g.name(sum) == "sum", "node names kept");

    g.invalidate(a);
    requireTrue(log.size() == 2 && log[0] == "sum" && log[1] == "out", "a -> sum, out");
    requireTrue(g.state(out) == gc::NodeState::Clean, "clean after flush");
    requireTrue(g.state(other) == gc::NodeState::Clean, "untouched node clean");

    log.clear();
    g.invalidate(b);
    requireTrue(log.size() == 3, "b reaches all three");
    requireTrue(log[0] == "sum" && log[1] == "out" && log[2] == "other", "creation order");
    requireTrue(g.graphState() == gc::GraphState::Idle, "idle after flush");
    std::printf("  Test 1 (order): PASS\n");
  }

  // --- Test 2: batch ---
  {
    gc::ReactiveGraph g;
    int runs = 0;
    const gc::NodeId a = g.addSource("a");
    const gc::NodeId b = g.addSource("b");
    g.addDerived("d", {a, b}, [&] { runs++; });

    g.batch([&] {
      g.invalidate(a);
      g.invalidate(b);
      g.invalidate(a);
      requireTrue(runs == 0, "nothing runs inside a batch");
    });
    requireTrue(runs == 1, "one recompute per batch");

    g.beginBatch();
    g.beginBatch();
    g.invalidate(a);
    g.endBatch();
    requireTrue(runs == 1, "inner batch end does not flush");
    g.endBatch();
    requireTrue(runs == 2, "outer batch end flushes");

    const auto passes = g.passCount();
    g.batch([] {});
    requireTrue(g.passCount() == passes, "empty batch runs no pass");
    std::printf("  Test 2 (batch): PASS\n");
  }

  // --- Test 3: coalescing ---
  {
    gc::ReactiveGraph g;
    int runs = 0;
    int lastSeen = 0;
    int value = 0;
    const gc::NodeId src = g.addSource("src");
    g.addDerived("d", {src}, [&] {
      runs++;
      lastSeen = value;
      if (runs == 1) {
        // three triggers while Recomputing
        requireTrue(g.graphState() == gc::GraphState::Recomputing, "recomputing inside compute");
        value = 1; g.invalidate(src);
        value = 2; g.invalidate(src);
        value = 3; g.invalidate(src);
      }
    });

    const auto before = g.passCount();
    g.invalidate(src);
    requireTrue(runs == 2, "exactly one extra pass");
    requireTrue(lastSeen == 3, "last value wins");
    requireTrue(g.passCount() == before + 2, "two passes");
    std::printf("  Test 3 (coalescing): PASS\n");
  }

  // --- Test 4: throwing compute ---
  {
    gc::ReactiveGraph g;
    bool fail = true;
    int runs = 0;
    const gc::NodeId src = g.addSource("src");
    const gc::NodeId d = g.addDerived("d", {src}, [&] {
      runs++;
      if (fail) throw std::runtime_error("boom");
    });

    bool threw = false;
    try {
      g.invalidate(src);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    requireTrue(threw, "exception propagates");
    requireTrue(g.state(d) == gc::NodeState::Dirty, "failed node stays dirty");
    requireTrue(g.graphState() == gc::GraphState::Idle, "graph idle after failure");

    fail = false;
    g.flush();
    requireTrue(runs == 2 && g.state(d) == gc::NodeState::Clean, "retry succeeds");

    bool batchThrew = false;
    try {
      g.batch([&] {
        g.invalidate(src);
        throw std::logic_error("abort batch");
      });
    } catch (const std::logic_error&) {
      batchThrew = true;
    }
    requireTrue(batchThrew, "batch body exception propagates");
    g.flush();
    requireTrue(runs == 3, "batch closed; later flush runs the pending change");
    std::printf("  Test 4 (throwing compute): PASS\n");
  }

  // --- Test 5: misuse ---
  {
    gc::ReactiveGraph g;
    const gc::NodeId s = g.addSource("s");
    bool threw = false;
    try {
      g.addDerived("bad", {s, 42}, [] {});
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "unknown dependency rejected");

    threw = false;
    try {
      g.addDerived("nocompute", {s}, nullptr);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "missing compute rejected");

    threw = false;
    try {
      g.endBatch();
    } catch (const std::logic_error&) {
      threw = true;
    }
    requireTrue(threw, "unmatched endBatch rejected");

    threw = false;
    try {
      g.invalidate(99);
    } catch (const std::out_of_range&) {
      threw = true;
    }
    requireTrue(threw, "unknown node rejected");
    std::printf("  Test 5 (misuse): PASS\n");
  }

  std::printf("G1.6 reactive PASS\n");
  return 0;
}
