#pragma once

#include <vector>

namespace game {

struct Cell {
  int x = 0;
  int y = 0;

  bool operator==(const Cell& o) const {
    return x == o.x && y == o.y;
  }
  bool operator!=(const Cell& o) const {
    return !(*this == o);
  }
};

enum class Dir : int {
  Up = 1,
  Down = 2,
  Left = 3,
  Right = 4,
};

Dir OppositeDir(Dir d);

// Head is body[0], tail is body.back().
using Body = std::vector<Cell>;

// Prepends new_head; drops the tail unless grew is set. Surviving segments keep their order.
Body Advance(const Body& body, Cell new_head, bool grew);

// Duplicates the tail cell, so the extra segment materialises when the snake next moves.
Body Grow(const Body& body);

bool Occupies(const Body& body, Cell c);

}  // namespace game
