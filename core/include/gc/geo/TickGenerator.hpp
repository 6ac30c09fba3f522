#pragma once
#include "gc/math/NiceTicks.hpp"

#include <functional>
#include <string>
#include <vector>

namespace gc {

struct TickPolicy {
  int targetCount{7};
  StepLadder ladder{StepLadder::Geographic};
  // When non-empty, used as-is (values outside [lo, hi] dropped).
  std::vector<double> explicitValues;
};

// Labels for a whole tick vector at once; must return one label per value.
using TickFormatter = std::function<std::vector<std::string>(const std::vector<double>&)>;

// Index-aligned tick values and labels.
struct TickLabels {
  std::vector<double> values;
  std::vector<std::string> labels;
  double step{0};
};

TickFormatter longitudeFormatter();
TickFormatter latitudeFormatter();
TickFormatter degreeFormatter();

// Pure. Throws std::runtime_error if the formatter returns the wrong count.
// An empty formatter falls back to degreeFormatter().
TickLabels generateTicks(double lo, double hi, const TickPolicy& policy,
                         const TickFormatter& formatter);

} // namespace gc
