#pragma once

namespace game {

// interval = max(min_ms, base_ms - floor(score / points_per_step) * step_ms)
struct DifficultyCurve {
  int base_ms = 150;
  int step_ms = 5;
  int points_per_step = 50;
  int min_ms = 50;

  int TickIntervalMs(int score) const;
};

}  // namespace game
