#include "snake.h"

#include <algorithm>

namespace game {

Dir OppositeDir(Dir d) {
  switch (d) {
    case Dir::Left:
      return Dir::Right;
    case Dir::Right:
      return Dir::Left;
    case Dir::Up:
      return Dir::Down;
    case Dir::Down:
      return Dir::Up;
  }
  return d;
}

Body Advance(const Body& body, Cell new_head, bool grew) {
  Body out;
  out.reserve(body.size() + 1);
  out.push_back(new_head);
  out.insert(out.end(), body.begin(), body.end());
  if (!grew && out.size() > 1) out.pop_back();
  return out;
}

Body Grow(const Body& body) {
  Body out = body;
  if (!out.empty()) out.push_back(out.back());
  return out;
}

bool Occupies(const Body& body, Cell c) {
  return std::find(body.begin(), body.end(), c) != body.end();
}

}  // namespace game
