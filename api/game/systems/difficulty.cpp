#include "difficulty.h"

#include <algorithm>

namespace game {

int DifficultyCurve::TickIntervalMs(int score) const {
  const int floor_ms = std::max(1, min_ms);
  const int per_step = std::max(1, points_per_step);
  const long long steps = std::max(0, score) / per_step;
  const long long interval = static_cast<long long>(base_ms) - steps * std::max(0, step_ms);
  return static_cast<int>(std::max<long long>(floor_ms, interval));
}

}  // namespace game
