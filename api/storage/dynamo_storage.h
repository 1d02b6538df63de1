#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <aws/dynamodb/DynamoDBClient.h>

#include "storage.h"

namespace storage {

struct DynamoConfig {
  std::string region = "us-east-1";
  std::string endpoint;
  std::string users_table;
  std::string high_scores_table;
  std::string scores_table;
};

class DynamoStorage : public IStorage {
 public:
  explicit DynamoStorage(DynamoConfig cfg);

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
  DynamoConfig cfg_;
  std::shared_ptr<Aws::DynamoDB::DynamoDBClient> client_;
};

}  // namespace storage
