#include "game_types.h"

#include <cctype>

namespace game {

namespace {

std::string lower(const std::string& s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

}  // namespace

const char* ModeName(Mode m) {
  return m == Mode::PassThrough ? "pass-through" : "walls";
}

const char* StatusName(GameStatus s) {
  switch (s) {
    case GameStatus::Idle:
      return "idle";
    case GameStatus::Playing:
      return "playing";
    case GameStatus::Paused:
      return "paused";
    case GameStatus::GameOver:
      return "game-over";
  }
  return "idle";
}

const char* DirName(Dir d) {
  switch (d) {
    case Dir::Up:
      return "UP";
    case Dir::Down:
      return "DOWN";
    case Dir::Left:
      return "LEFT";
    case Dir::Right:
      return "RIGHT";
  }
  return "RIGHT";
}

std::optional<Mode> ParseMode(const std::string& s) {
  const std::string v = lower(s);
  if (v == "walls") return Mode::Walls;
  // Underscore spelling is accepted for env files and shell scripts.
  if (v == "pass-through" || v == "pass_through") return Mode::PassThrough;
  return std::nullopt;
}

std::optional<GameStatus> ParseStatus(const std::string& s) {
  const std::string v = lower(s);
  if (v == "idle") return GameStatus::Idle;
  if (v == "playing") return GameStatus::Playing;
  if (v == "paused") return GameStatus::Paused;
  if (v == "game-over") return GameStatus::GameOver;
  return std::nullopt;
}

std::optional<Dir> ParseDir(const std::string& s) {
  const std::string v = lower(s);
  if (v == "up") return Dir::Up;
  if (v == "down") return Dir::Down;
  if (v == "left") return Dir::Left;
  if (v == "right") return Dir::Right;
  return std::nullopt;
}

}  // namespace game
