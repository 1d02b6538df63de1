#include "memory_storage.h"

namespace storage {

std::optional<User> MemoryStorage::GetUserByUsername(const std::string& username) {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& kv : users_) {
    if (kv.second.username == username) return kv.second;
  }
  return std::nullopt;
}

std::optional<User> MemoryStorage::GetUserById(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = users_.find(user_id);
  if (it == users_.end()) return std::nullopt;
  return it->second;
}

bool MemoryStorage::PutUser(const User& u) {
  if (u.user_id.empty() || u.username.empty()) return false;
  std::lock_guard<std::mutex> lock(mu_);
  users_[u.user_id] = u;
  return true;
}

std::optional<int> MemoryStorage::GetHighScore(const std::string& user_id, const std::string& mode) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = high_scores_.find({user_id, mode});
  if (it == high_scores_.end()) return std::nullopt;
  return it->second.score;
}

bool MemoryStorage::PutHighScore(const HighScore& h) {
  if (h.user_id.empty() || h.mode.empty() || h.score < 0) return false;
  std::lock_guard<std::mutex> lock(mu_);
  high_scores_[{h.user_id, h.mode}] = h;
  return true;
}

bool MemoryStorage::AppendScore(const ScoreEntry& e) {
  if (e.score_id.empty() || e.score < 0) return false;
  std::lock_guard<std::mutex> lock(mu_);
  scores_.push_back(e);
  return true;
}

std::vector<ScoreEntry> MemoryStorage::ListScores(const std::string& mode, size_t limit) {
  std::vector<ScoreEntry> out;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& e : scores_) {
      if (mode.empty() || e.mode == mode) out.push_back(e);
    }
  }
  RankScores(out, limit);
  return out;
}

bool MemoryStorage::HealthCheck() {
  return true;
}

bool MemoryStorage::ResetForDev() {
  std::lock_guard<std::mutex> lock(mu_);
  users_.clear();
  high_scores_.clear();
  scores_.clear();
  return true;
}

}  // namespace storage
