#pragma once

#include <optional>
#include <string>

#include "entities/snake.h"

namespace game {

enum class Mode : int {
  Walls = 0,
  PassThrough = 1,
};

enum class GameStatus : int {
  Idle = 0,
  Playing = 1,
  Paused = 2,
  GameOver = 3,
};

// Wire names: "walls" / "pass-through", "idle" / "playing" / "paused" / "game-over", "UP" ...
const char* ModeName(Mode m);
const char* StatusName(GameStatus s);
const char* DirName(Dir d);

std::optional<Mode> ParseMode(const std::string& s);
std::optional<GameStatus> ParseStatus(const std::string& s);
std::optional<Dir> ParseDir(const std::string& s);

}  // namespace game
