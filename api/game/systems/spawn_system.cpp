#include "spawn_system.h"

#include <unordered_set>

namespace game {

namespace {

long long CellKey(const Cell& c) {
  return (static_cast<long long>(c.x) << 32) ^ static_cast<unsigned long long>(c.y & 0xffffffff);
}

}  // namespace

std::optional<Cell> SpawnSystem::Spawn(const Body& body, const Grid& grid, std::mt19937& rng) {
  std::unordered_set<long long> occupied;
  for (const auto& c : body) {
    if (grid.InBounds(c)) occupied.insert(CellKey(c));
  }
  if (static_cast<int>(occupied.size()) >= grid.CellCount()) return std::nullopt;

  std::uniform_int_distribution<int> coord(0, grid.Size() - 1);
  for (int tries = 0; tries < kMaxRandomTries; ++tries) {
    Cell candidate{coord(rng), coord(rng)};
    if (!occupied.count(CellKey(candidate))) return candidate;
  }

  for (int y = 0; y < grid.Size(); ++y) {
    for (int x = 0; x < grid.Size(); ++x) {
      Cell c{x, y};
      if (!occupied.count(CellKey(c))) return c;
    }
  }
  return std::nullopt;
}

}  // namespace game
