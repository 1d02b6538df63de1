#pragma once

#include <cstdint>
#include <random>

#include "grid.h"
#include "live_player.h"

namespace game {

// Cosmetic playback of a borrowed LivePlayer snapshot for one viewer. Moves always wrap and
// never collide; this is not a second rules engine and has no authority over the real game.
class SpectatorSimulator {
 public:
  SpectatorSimulator(int grid_size, int food_reward, int turn_percent, uint32_t seed);

  // Returns the next frame; the input is left untouched. Only Playing snapshots advance.
  LivePlayer Step(const LivePlayer& player);

 private:
  Dir RandomTurn(Dir current);

  Grid grid_;
  int food_reward_;
  int turn_percent_;
  std::mt19937 rng_;
};

}  // namespace game
