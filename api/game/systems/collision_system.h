#pragma once

#include "../entities/snake.h"
#include "../game_types.h"
#include "../grid.h"

namespace game {

enum class CollisionReason : int {
  None = 0,
  Wall = 1,
  Self = 2,
};

struct CollisionResult {
  bool ok = false;
  Cell head;  // wrapped head when ok
  CollisionReason reason = CollisionReason::None;
};

class CollisionSystem {
 public:
  // Validates one head step. The self check skips the head, the segment right behind it and
  // the tail: the tail vacates this tick, and Grow() keeps that true on eating ticks because
  // growth is materialised by a duplicated tail cell that is checked on the following tick.
  static CollisionResult CheckMove(const Grid& grid, const Body& body, Cell proposed_head, Mode mode);
};

}  // namespace game
