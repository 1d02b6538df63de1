#include "grid.h"

#include <algorithm>

namespace game {

namespace {

int floor_mod(int v, int n) {
  const int r = v % n;
  return r < 0 ? r + n : r;
}

}  // namespace

Grid::Grid(int size) : size_(std::max(1, size)) {}

int Grid::Size() const {
  return size_;
}

int Grid::CellCount() const {
  return size_ * size_;
}

bool Grid::InBounds(Cell c) const {
  return c.x >= 0 && c.x < size_ && c.y >= 0 && c.y < size_;
}

std::optional<Cell> Grid::Wrap(Cell c, Mode mode) const {
  if (mode == Mode::PassThrough) {
    return Cell{floor_mod(c.x, size_), floor_mod(c.y, size_)};
  }
  if (!InBounds(c)) return std::nullopt;
  return c;
}

Cell Grid::Step(Cell c, Dir d) {
  switch (d) {
    case Dir::Left:
      --c.x;
      break;
    case Dir::Right:
      ++c.x;
      break;
    case Dir::Up:
      --c.y;
      break;
    case Dir::Down:
      ++c.y;
      break;
  }
  return c;
}

}  // namespace game
