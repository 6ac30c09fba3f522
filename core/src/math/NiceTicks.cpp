#include "gc/math/NiceTicks.hpp"
#include <algorithm>
#include <cmath>

namespace gc {

const std::vector<double>& ladderSteps(StepLadder ladder) {
  static const std::vector<double> decimal{1.0, 2.0, 2.5, 5.0, 10.0};
  static const std::vector<double> geographic{1.0, 1.5, 1.8, 2.0, 3.0, 6.0, 10.0};
  return ladder == StepLadder::Geographic ? geographic : decimal;
}

NiceTicks computeNiceTicks(double lo, double hi, int targetCount, StepLadder ladder) {
  NiceTicks result;
  if (!std::isfinite(lo) || !std::isfinite(hi)) return result;

  if (hi <= lo) {
    result.min = lo;
    result.max = lo;
    result.values.push_back(lo);
    return result;
  }
  targetCount = std::min(std::max(targetCount, 2), kMaxTickCount);

  const double rawStep = (hi - lo) / static_cast<double>(targetCount - 1);

  const double mag = std::pow(10.0, std::floor(std::log10(rawStep)));
  const double residual = rawStep / mag;

  double niceStep = 10.0 * mag;
  for (double m : ladderSteps(ladder)) {
    if (residual <= m * (1.0 + 1e-9)) {
      niceStep = m * mag;
      break;
    }
  }

  const double eps = 1e-9;
  const long long kLo = static_cast<long long>(std::ceil(lo / niceStep - eps));
  const long long kHi = static_cast<long long>(std::floor(hi / niceStep + eps));

  result.step = niceStep;
  result.min = static_cast<double>(kLo) * niceStep;
  result.max = static_cast<double>(kHi) * niceStep;
  for (long long k = kLo; k <= kHi; ++k) {
    result.values.push_back(k == 0 ? 0.0 : static_cast<double>(k) * niceStep);
  }
  return result;
}

} // namespace gc
