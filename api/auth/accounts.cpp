#include "accounts.h"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <iostream>
#include <random>

namespace auth {

std::string RandomToken(size_t n) {
  static const char* chars = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  static thread_local std::mt19937 rng(static_cast<uint32_t>(std::random_device{}()));
  std::uniform_int_distribution<int> dist(0, static_cast<int>(std::strlen(chars)) - 1);
  std::string t;
  t.reserve(n);
  for (size_t i = 0; i < n; ++i) t.push_back(chars[dist(rng)]);
  return t;
}

Accounts::Accounts(storage::IStorage& storage) : storage_(storage) {}

std::optional<LoginResult> Accounts::Login(const std::string& username, const std::string& password) {
  auto u = storage_.GetUserByUsername(username);
  if (!u || u->password_hash != password) return std::nullopt;
  return LoginResult{u->user_id, u->username, IssueToken(u->user_id)};
}

SignupStatus Accounts::Signup(const std::string& username, const std::string& password, LoginResult& out) {
  if (!ValidUsername(username) || !ValidPassword(password)) return SignupStatus::InvalidInput;

  std::lock_guard<std::mutex> lock(signup_mu_);
  if (storage_.GetUserByUsername(username).has_value()) return SignupStatus::UsernameTaken;

  storage::User u;
  u.user_id = "u_" + RandomToken(16);
  u.username = username;
  u.password_hash = password;
  u.created_at = static_cast<int64_t>(time(nullptr));
  if (!storage_.PutUser(u)) {
    std::cerr << "Signup write failed: username=" << username << "\n";
    return SignupStatus::StorageError;
  }

  out = LoginResult{u.user_id, u.username, IssueToken(u.user_id)};
  return SignupStatus::Created;
}

std::optional<std::string> Accounts::UserForToken(const std::string& token) {
  std::lock_guard<std::mutex> lock(tokens_mu_);
  auto it = token_to_uid_.find(token);
  if (it == token_to_uid_.end()) return std::nullopt;
  return it->second;
}

bool Accounts::Logout(const std::string& token) {
  std::lock_guard<std::mutex> lock(tokens_mu_);
  return token_to_uid_.erase(token) > 0;
}

bool Accounts::ValidUsername(const std::string& username) {
  if (username.size() < 3 || username.size() > 32) return false;
  for (unsigned char c : username) {
    if (!std::isalnum(c) && c != '_' && c != '-') return false;
  }
  return true;
}

bool Accounts::ValidPassword(const std::string& password) {
  return password.size() >= 4;
}

std::string Accounts::IssueToken(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(tokens_mu_);
  std::string token = RandomToken();
  token_to_uid_[token] = user_id;
  return token;
}

}  // namespace auth
