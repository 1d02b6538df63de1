#pragma once

#include <optional>
#include <string>
#include <vector>

#include "models.h"

namespace storage {

class IStorage {
 public:
  virtual ~IStorage() = default;

  virtual std::optional<User> GetUserByUsername(const std::string& username) = 0;
  virtual std::optional<User> GetUserById(const std::string& user_id) = 0;
  virtual bool PutUser(const User& u) = 0;

  virtual std::optional<int> GetHighScore(const std::string& user_id, const std::string& mode) = 0;
  virtual bool PutHighScore(const HighScore& h) = 0;

  virtual bool AppendScore(const ScoreEntry& e) = 0;
  // Highest first, ties broken by earlier created_at. Empty mode lists every mode.
  virtual std::vector<ScoreEntry> ListScores(const std::string& mode, size_t limit) = 0;

  virtual bool HealthCheck() = 0;
  virtual bool ResetForDev() = 0;
};

// Shared ordering and rank assignment for ListScores implementations.
void RankScores(std::vector<ScoreEntry>& entries, size_t limit);

}  // namespace storage
