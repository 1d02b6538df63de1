#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../storage/storage.h"

namespace auth {

struct LoginResult {
  std::string user_id;
  std::string username;
  std::string token;
};

enum class SignupStatus {
  Created,
  InvalidInput,
  UsernameTaken,
  StorageError,
};

// Accounts and opaque bearer tokens. Tokens live in process memory and die with the server.
class Accounts {
 public:
  explicit Accounts(storage::IStorage& storage);

  std::optional<LoginResult> Login(const std::string& username, const std::string& password);
  // Usernames are 3..32 chars of [A-Za-z0-9_-]; passwords at least 4 chars.
  // On Created, out holds the new user id and a token already issued for it.
  SignupStatus Signup(const std::string& username, const std::string& password, LoginResult& out);

  std::optional<std::string> UserForToken(const std::string& token);
  // False when the token was not issued or already revoked.
  bool Logout(const std::string& token);

  static bool ValidUsername(const std::string& username);
  static bool ValidPassword(const std::string& password);

 private:
  std::string IssueToken(const std::string& user_id);

  storage::IStorage& storage_;
  std::mutex signup_mu_;  // serializes the taken-check and insert of Signup
  std::mutex tokens_mu_;
  std::unordered_map<std::string, std::string> token_to_uid_;
};

std::string RandomToken(size_t n = 32);

}  // namespace auth
