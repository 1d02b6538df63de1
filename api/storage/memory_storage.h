#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "storage.h"

namespace storage {

// Process-local backend. Default for development and the only one tests use.
class MemoryStorage : public IStorage {
 public:
  std::optional<User> GetUserByUsername(const std::string& username) override;
  std::optional<User> GetUserById(const std::string& user_id) override;
  bool PutUser(const User& u) override;

  std::optional<int> GetHighScore(const std::string& user_id, const std::string& mode) override;
  bool PutHighScore(const HighScore& h) override;

  bool AppendScore(const ScoreEntry& e) override;
  std::vector<ScoreEntry> ListScores(const std::string& mode, size_t limit) override;

  bool HealthCheck() override;
  bool ResetForDev() override;

 private:
  std::mutex mu_;
  std::unordered_map<std::string, User> users_;
  std::map<std::pair<std::string, std::string>, HighScore> high_scores_;
  std::vector<ScoreEntry> scores_;
};

}  // namespace storage
