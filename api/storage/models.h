#pragma once

#include <cstdint>
#include <string>

namespace storage {

struct User {
  std::string user_id;
  std::string username;
  std::string password_hash;
  int64_t created_at = 0;
};

// One row per (user, mode). Mode uses the wire names "walls" / "pass-through".
struct HighScore {
  std::string user_id;
  std::string mode;
  int score = 0;
  int64_t updated_at = 0;
};

struct ScoreEntry {
  std::string score_id;
  std::string user_id;
  std::string username;
  int score = 0;
  std::string mode;
  int64_t created_at = 0;
  int rank = 0;  // filled by ListScores, 1-based
};

}  // namespace storage
