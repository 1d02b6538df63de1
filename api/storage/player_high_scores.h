#pragma once

#include <string>

#include "../game/high_score_store.h"
#include "storage.h"

namespace storage {

// Binds one user's high-score rows to the capability a GameSession expects.
class PlayerHighScores : public game::HighScoreStore {
 public:
  PlayerHighScores(IStorage& storage, std::string user_id);

  int ReadHighScore(game::Mode mode) override;
  // A failed write is logged; the session keeps its in-memory value.
  void WriteHighScore(game::Mode mode, int value) override;

 private:
  IStorage& storage_;
  std::string user_id_;
};

}  // namespace storage
