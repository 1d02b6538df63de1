#include "player_high_scores.h"

#include <ctime>
#include <iostream>
#include <utility>

namespace storage {

PlayerHighScores::PlayerHighScores(IStorage& storage, std::string user_id)
    : storage_(storage), user_id_(std::move(user_id)) {}

int PlayerHighScores::ReadHighScore(game::Mode mode) {
  return storage_.GetHighScore(user_id_, game::ModeName(mode)).value_or(0);
}

void PlayerHighScores::WriteHighScore(game::Mode mode, int value) {
  HighScore h;
  h.user_id = user_id_;
  h.mode = game::ModeName(mode);
  h.score = value;
  h.updated_at = static_cast<int64_t>(time(nullptr));
  if (!storage_.PutHighScore(h)) {
    std::cerr << "High score write failed: user=" << user_id_ << " mode=" << h.mode << " score=" << value << "\n";
  }
}

}  // namespace storage
