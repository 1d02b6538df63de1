#pragma once

#include <string>

#include "entities/snake.h"
#include "game_types.h"

namespace game {

// Snapshot of someone else's game as published for spectators.
struct LivePlayer {
  std::string id;
  std::string username;
  int score = 0;
  Mode mode = Mode::Walls;
  Body snake;
  Cell food;
  Dir direction = Dir::Right;
  GameStatus status = GameStatus::Playing;
  int viewers = 0;
};

}  // namespace game
