#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include "entities/snake.h"
#include "game_types.h"
#include "grid.h"
#include "high_score_store.h"
#include "systems/collision_system.h"
#include "systems/difficulty.h"

namespace game {

struct SessionConfig {
  int grid_size = 20;
  int food_reward = 10;
  DifficultyCurve difficulty;
};

struct GameSnapshot {
  Body snake;
  Cell food;
  bool has_food = true;
  Dir direction = Dir::Right;
  GameStatus status = GameStatus::Idle;
  Mode mode = Mode::Walls;
  int score = 0;
  int high_score = 0;
  int tick_interval_ms = 0;
  int grid_size = 0;
  uint64_t tick = 0;
};

// Authoritative single-player state machine:
//   Idle --Start--> Playing <--TogglePause--> Paused
//   Playing --collision--> GameOver (terminal until Reset)
// Calls that do not apply to the current status are ignored.
// Not thread-safe; the host serializes calls for one session.
class GameSession {
 public:
  // Smallest board the centered three-cell starting snake fits on; smaller sizes are raised to it.
  static constexpr int kMinGridSize = 4;

  GameSession(const SessionConfig& cfg, Mode mode, HighScoreStore& high_scores, uint32_t seed);

  void Start();
  void TogglePause();
  // Last write before the next tick wins. Reversals of the current direction are dropped.
  void RequestDirection(Dir d);
  void Tick();
  // Replaces the whole session with a fresh Idle one, optionally in another mode.
  void Reset(std::optional<Mode> mode = std::nullopt);

  GameStatus Status() const;
  Mode CurrentMode() const;
  const Body& SnakeBody() const;
  Cell Food() const;
  bool HasFood() const;
  Dir Direction() const;
  Dir PendingDirection() const;
  int Score() const;
  int HighScore() const;
  int TickIntervalMs() const;
  uint64_t TickCount() const;
  CollisionReason LastCollision() const;
  GameSnapshot Snapshot() const;

  // Board setup for scripted scenarios; only honoured before the game starts.
  void PlaceSnake(const Body& body, Dir dir);
  void PlaceFood(Cell c);

 private:
  static Body InitialBody(const Grid& grid);
  void CommitHighScore();

  SessionConfig cfg_;
  Grid grid_;
  Mode mode_;
  HighScoreStore* high_scores_;
  std::mt19937 rng_;

  GameStatus status_ = GameStatus::Idle;
  Body body_;
  Cell food_;
  bool has_food_ = false;
  Dir dir_ = Dir::Right;
  Dir pending_dir_ = Dir::Right;
  int score_ = 0;
  int high_score_ = 0;
  int tick_interval_ms_ = 0;
  uint64_t tick_ = 0;
  CollisionReason last_collision_ = CollisionReason::None;
};

}  // namespace game
