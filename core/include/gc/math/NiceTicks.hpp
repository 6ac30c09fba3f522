#pragma once
#include <vector>

namespace gc {

// Multiplier ladders for snapping a raw step to a nice one.
//   Decimal:    {1, 2, 2.5, 5, 10} x 10^n
//   Geographic: {1, 1.5, 1.8, 2, 3, 6, 10} x 10^n  (15, 30, 60, 90 degree steps)
enum class StepLadder { Decimal, Geographic };

const std::vector<double>& ladderSteps(StepLadder ladder);

// Upper bound on the requested tick count.
constexpr int kMaxTickCount = 100;

struct NiceTicks {
  double min{0}, max{0}, step{0};
  std::vector<double> values;
};

// Ticks are the integer multiples of the snapped step inside [lo, hi].
// Inverted or zero-width ranges give the single tick {lo}.
NiceTicks computeNiceTicks(double lo, double hi, int targetCount = 7,
                           StepLadder ladder = StepLadder::Geographic);

} // namespace gc
