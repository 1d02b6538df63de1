#include "spectator_simulator.h"

#include <algorithm>
#include <array>

#include "systems/spawn_system.h"

namespace game {

SpectatorSimulator::SpectatorSimulator(int grid_size, int food_reward, int turn_percent, uint32_t seed)
    : grid_(grid_size),
      food_reward_(food_reward),
      turn_percent_(std::max(0, std::min(100, turn_percent))),
      rng_(seed) {}

LivePlayer SpectatorSimulator::Step(const LivePlayer& player) {
  LivePlayer next = player;
  if (next.status != GameStatus::Playing || next.snake.empty()) return next;

  const Cell head = *grid_.Wrap(Grid::Step(next.snake.front(), next.direction), Mode::PassThrough);
  const bool ate = head == next.food;
  next.snake = Advance(next.snake, head, ate);
  if (ate) {
    next.score += food_reward_;
    const auto food = SpawnSystem::Spawn(next.snake, grid_, rng_);
    if (food.has_value()) next.food = *food;
  }

  std::uniform_int_distribution<int> percent(0, 99);
  if (percent(rng_) < turn_percent_) next.direction = RandomTurn(next.direction);
  return next;
}

Dir SpectatorSimulator::RandomTurn(Dir current) {
  static const std::array<Dir, 4> kAll = {Dir::Up, Dir::Down, Dir::Left, Dir::Right};
  std::array<Dir, 3> legal{};
  size_t n = 0;
  for (Dir d : kAll) {
    if (d != OppositeDir(current)) legal[n++] = d;
  }
  std::uniform_int_distribution<size_t> pick(0, n - 1);
  return legal[pick(rng_)];
}

}  // namespace game
