#pragma once

#include <optional>

#include "entities/snake.h"
#include "game_types.h"

namespace game {

// Square N x N board. Valid cells satisfy 0 <= x, y < N.
class Grid {
 public:
  explicit Grid(int size);

  int Size() const;
  int CellCount() const;
  bool InBounds(Cell c) const;

  // PassThrough reduces both coordinates modulo N; Walls returns nullopt for out-of-bounds cells.
  std::optional<Cell> Wrap(Cell c, Mode mode) const;

  // One step in direction d, unwrapped.
  static Cell Step(Cell c, Dir d);

 private:
  int size_;
};

}  // namespace game
