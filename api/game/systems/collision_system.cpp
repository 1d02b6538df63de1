#include "collision_system.h"

namespace game {

CollisionResult CollisionSystem::CheckMove(const Grid& grid, const Body& body, Cell proposed_head, Mode mode) {
  CollisionResult out;

  const auto head = grid.Wrap(proposed_head, mode);
  if (!head.has_value()) {
    out.reason = CollisionReason::Wall;
    return out;
  }

  for (size_t i = 2; i + 1 < body.size(); ++i) {
    if (body[i] == *head) {
      out.reason = CollisionReason::Self;
      return out;
    }
  }

  out.ok = true;
  out.head = *head;
  return out;
}

}  // namespace game
