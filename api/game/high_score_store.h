#pragma once

#include "game_types.h"

namespace game {

// Read/write capability a session gets at construction. Implementations must not throw.
class HighScoreStore {
 public:
  virtual ~HighScoreStore() = default;

  virtual int ReadHighScore(Mode mode) = 0;
  virtual void WriteHighScore(Mode mode, int value) = 0;
};

}  // namespace game
