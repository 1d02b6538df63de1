#include "game_session.h"

#include <algorithm>

#include "systems/spawn_system.h"

namespace game {

GameSession::GameSession(const SessionConfig& cfg, Mode mode, HighScoreStore& high_scores, uint32_t seed)
    : cfg_(cfg),
      grid_(std::max(cfg.grid_size, kMinGridSize)),
      mode_(mode),
      high_scores_(&high_scores),
      rng_(seed) {
  body_ = InitialBody(grid_);
  const auto food = SpawnSystem::Spawn(body_, grid_, rng_);
  has_food_ = food.has_value();
  if (has_food_) food_ = *food;
  high_score_ = std::max(0, high_scores_->ReadHighScore(mode_));
  tick_interval_ms_ = cfg_.difficulty.TickIntervalMs(score_);
}

void GameSession::Start() {
  if (status_ != GameStatus::Idle) return;
  status_ = GameStatus::Playing;
}

void GameSession::TogglePause() {
  if (status_ == GameStatus::Playing) {
    status_ = GameStatus::Paused;
  } else if (status_ == GameStatus::Paused) {
    status_ = GameStatus::Playing;
  }
}

void GameSession::RequestDirection(Dir d) {
  if (status_ != GameStatus::Playing) return;
  if (d == OppositeDir(dir_)) return;
  pending_dir_ = d;
}

void GameSession::Tick() {
  if (status_ != GameStatus::Playing || body_.empty()) return;

  const Dir dir = pending_dir_;
  const CollisionResult move = CollisionSystem::CheckMove(grid_, body_, Grid::Step(body_.front(), dir), mode_);
  if (!move.ok) {
    // Board stays as it was before the move.
    last_collision_ = move.reason;
    status_ = GameStatus::GameOver;
    CommitHighScore();
    return;
  }

  Body next = Advance(body_, move.head, false);
  if (has_food_ && move.head == food_) {
    body_ = Grow(next);
    score_ += cfg_.food_reward;
    tick_interval_ms_ = cfg_.difficulty.TickIntervalMs(score_);

    const auto food = SpawnSystem::Spawn(body_, grid_, rng_);
    has_food_ = food.has_value();
    if (has_food_) {
      food_ = *food;
    } else {
      status_ = GameStatus::GameOver;
    }
    CommitHighScore();
  } else {
    body_ = std::move(next);
  }

  dir_ = dir;
  ++tick_;
}

void GameSession::Reset(std::optional<Mode> mode) {
  const uint32_t seed = static_cast<uint32_t>(rng_());
  *this = GameSession(cfg_, mode.value_or(mode_), *high_scores_, seed);
}

GameStatus GameSession::Status() const {
  return status_;
}

Mode GameSession::CurrentMode() const {
  return mode_;
}

const Body& GameSession::SnakeBody() const {
  return body_;
}

Cell GameSession::Food() const {
  return food_;
}

bool GameSession::HasFood() const {
  return has_food_;
}

Dir GameSession::Direction() const {
  return dir_;
}

Dir GameSession::PendingDirection() const {
  return pending_dir_;
}

int GameSession::Score() const {
  return score_;
}

int GameSession::HighScore() const {
  return high_score_;
}

int GameSession::TickIntervalMs() const {
  return tick_interval_ms_;
}

uint64_t GameSession::TickCount() const {
  return tick_;
}

CollisionReason GameSession::LastCollision() const {
  return last_collision_;
}

GameSnapshot GameSession::Snapshot() const {
  GameSnapshot snap;
  snap.snake = body_;
  snap.food = food_;
  snap.has_food = has_food_;
  snap.direction = dir_;
  snap.status = status_;
  snap.mode = mode_;
  snap.score = score_;
  snap.high_score = high_score_;
  snap.tick_interval_ms = tick_interval_ms_;
  snap.grid_size = grid_.Size();
  snap.tick = tick_;
  return snap;
}

void GameSession::PlaceSnake(const Body& body, Dir dir) {
  if (status_ != GameStatus::Idle || body.empty()) return;
  body_ = body;
  dir_ = dir;
  pending_dir_ = dir;
  if (has_food_ && Occupies(body_, food_)) {
    const auto food = SpawnSystem::Spawn(body_, grid_, rng_);
    has_food_ = food.has_value();
    if (has_food_) food_ = *food;
  }
}

void GameSession::PlaceFood(Cell c) {
  if (status_ != GameStatus::Idle || !grid_.InBounds(c) || Occupies(body_, c)) return;
  food_ = c;
  has_food_ = true;
}

Body GameSession::InitialBody(const Grid& grid) {
  const int c = grid.Size() / 2;
  return Body{{c, c}, {c - 1, c}, {c - 2, c}};
}

void GameSession::CommitHighScore() {
  if (score_ <= high_score_) return;
  high_score_ = score_;
  high_scores_->WriteHighScore(mode_, high_score_);
}

}  // namespace game
