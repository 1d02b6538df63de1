#pragma once

#include <optional>
#include <random>

#include "../entities/snake.h"
#include "../grid.h"

namespace game {

class SpawnSystem {
 public:
  static constexpr int kMaxRandomTries = 2000;

  // Uniform pick over free cells by rejection sampling. After kMaxRandomTries misses it scans
  // row-major for the first free cell; nullopt only when the body covers the whole board.
  static std::optional<Cell> Spawn(const Body& body, const Grid& grid, std::mt19937& rng);
};

}  // namespace game
