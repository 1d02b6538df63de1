#include "dynamo_storage.h"

#include <iostream>
#include <utility>

#include <aws/core/client/ClientConfiguration.h>
#include <aws/dynamodb/DynamoDBErrors.h>
#include <aws/dynamodb/model/AttributeValue.h>
#include <aws/dynamodb/model/DeleteItemRequest.h>
#include <aws/dynamodb/model/DescribeTableRequest.h>
#include <aws/dynamodb/model/GetItemRequest.h>
#include <aws/dynamodb/model/PutItemRequest.h>
#include <aws/dynamodb/model/QueryRequest.h>
#include <aws/dynamodb/model/ScanRequest.h>
#include <aws/dynamodb/model/UpdateItemRequest.h>

namespace storage {
namespace {

using Aws::DynamoDB::Model::AttributeValue;
using Aws::Map;
using Aws::String;

std::string GetString(const Map<String, AttributeValue>& item, const char* key, const std::string& def = "") {
  auto it = item.find(key);
  if (it == item.end()) return def;
  return it->second.GetS().c_str();
}

int64_t GetInt64(const Map<String, AttributeValue>& item, const char* key, int64_t def = 0) {
  auto it = item.find(key);
  if (it == item.end()) return def;
  const auto& n = it->second.GetN();
  if (n.empty()) return def;
  try {
    return std::stoll(n.c_str());
  } catch (const std::exception&) {
    return def;
  }
}

AttributeValue S(const std::string& v) {
  AttributeValue a;
  a.SetS(v.c_str());
  return a;
}

AttributeValue N(int64_t v) {
  AttributeValue a;
  a.SetN(std::to_string(v).c_str());
  return a;
}

User UserFromItem(const Map<String, AttributeValue>& item) {
  User u;
  u.user_id = GetString(item, "user_id");
  u.username = GetString(item, "username");
  u.password_hash = GetString(item, "password_hash");
  u.created_at = GetInt64(item, "created_at");
  return u;
}

ScoreEntry ScoreFromItem(const Map<String, AttributeValue>& item) {
  ScoreEntry e;
  e.score_id = GetString(item, "score_id");
  e.user_id = GetString(item, "user_id");
  e.username = GetString(item, "username");
  e.score = static_cast<int>(GetInt64(item, "score", 0));
  e.mode = GetString(item, "mode", "walls");
  e.created_at = GetInt64(item, "created_at", 0);
  return e;
}

}  // namespace

DynamoStorage::DynamoStorage(DynamoConfig cfg) : cfg_(std::move(cfg)) {
  Aws::Client::ClientConfiguration cc;
  cc.region = cfg_.region.c_str();
  if (!cfg_.endpoint.empty()) {
    cc.endpointOverride = cfg_.endpoint.c_str();
    cc.scheme = Aws::Http::Scheme::HTTP;
  }
  client_ = std::make_shared<Aws::DynamoDB::DynamoDBClient>(cc);
}

std::optional<User> DynamoStorage::GetUserByUsername(const std::string& username) {
  Aws::DynamoDB::Model::QueryRequest req;
  req.SetTableName(cfg_.users_table.c_str());
  req.SetIndexName("gsi_username");
  req.SetKeyConditionExpression("username = :u");
  req.SetLimit(1);
  req.AddExpressionAttributeValues(":u", S(username));

  auto out = client_->Query(req);
  if (!out.IsSuccess()) return std::nullopt;
  const auto& items = out.GetResult().GetItems();
  if (items.empty()) return std::nullopt;
  return UserFromItem(items[0]);
}

std::optional<User> DynamoStorage::GetUserById(const std::string& user_id) {
  Aws::DynamoDB::Model::GetItemRequest req;
  req.SetTableName(cfg_.users_table.c_str());
  req.AddKey("user_id", S(user_id));

  auto out = client_->GetItem(req);
  if (!out.IsSuccess()) return std::nullopt;
  const auto& item = out.GetResult().GetItem();
  if (item.empty()) return std::nullopt;
  return UserFromItem(item);
}

bool DynamoStorage::PutUser(const User& u) {
  Aws::DynamoDB::Model::PutItemRequest req;
  req.SetTableName(cfg_.users_table.c_str());
  req.AddItem("user_id", S(u.user_id));
  req.AddItem("username", S(u.username));
  req.AddItem("password_hash", S(u.password_hash));
  req.AddItem("created_at", N(u.created_at));
  return client_->PutItem(req).IsSuccess();
}

std::optional<int> DynamoStorage::GetHighScore(const std::string& user_id, const std::string& mode) {
  Aws::DynamoDB::Model::GetItemRequest req;
  req.SetTableName(cfg_.high_scores_table.c_str());
  req.AddKey("user_id", S(user_id));
  req.AddKey("mode", S(mode));

  auto out = client_->GetItem(req);
  if (!out.IsSuccess()) {
    std::cerr << "Dynamo high score read failed: " << out.GetError().GetMessage() << "\n";
    return std::nullopt;
  }
  const auto& item = out.GetResult().GetItem();
  if (item.empty()) return std::nullopt;
  return static_cast<int>(GetInt64(item, "score", 0));
}

bool DynamoStorage::PutHighScore(const HighScore& h) {
  // Conditional update so a slower writer never lowers a newer maximum.
  Aws::DynamoDB::Model::UpdateItemRequest req;
  req.SetTableName(cfg_.high_scores_table.c_str());
  req.AddKey("user_id", S(h.user_id));
  req.AddKey("mode", S(h.mode));
  req.SetUpdateExpression("SET score = :s, updated_at = :t");
  req.SetConditionExpression("attribute_not_exists(score) OR score < :s");
  req.AddExpressionAttributeValues(":s", N(h.score));
  req.AddExpressionAttributeValues(":t", N(h.updated_at));

  auto res = client_->UpdateItem(req);
  if (res.IsSuccess()) return true;
  if (res.GetError().GetErrorType() == Aws::DynamoDB::DynamoDBErrors::CONDITIONAL_CHECK_FAILED) return true;
  std::cerr << "Dynamo high score write failed: " << res.GetError().GetMessage() << "\n";
  return false;
}

bool DynamoStorage::AppendScore(const ScoreEntry& e) {
  Aws::DynamoDB::Model::PutItemRequest req;
  req.SetTableName(cfg_.scores_table.c_str());
  req.AddItem("score_id", S(e.score_id));
  req.AddItem("user_id", S(e.user_id));
  req.AddItem("username", S(e.username));
  req.AddItem("score", N(e.score));
  req.AddItem("mode", S(e.mode));
  req.AddItem("created_at", N(e.created_at));
  return client_->PutItem(req).IsSuccess();
}

std::vector<ScoreEntry> DynamoStorage::ListScores(const std::string& mode, size_t limit) {
  std::vector<ScoreEntry> out;
  Aws::DynamoDB::Model::ScanRequest req;
  req.SetTableName(cfg_.scores_table.c_str());
  if (!mode.empty()) {
    req.SetFilterExpression("#m = :m");
    req.AddExpressionAttributeNames("#m", "mode");
    req.AddExpressionAttributeValues(":m", S(mode));
  }

  while (true) {
    auto res = client_->Scan(req);
    if (!res.IsSuccess()) {
      std::cerr << "Dynamo score scan failed: " << res.GetError().GetMessage() << "\n";
      break;
    }
    for (const auto& item : res.GetResult().GetItems()) {
      out.push_back(ScoreFromItem(item));
    }

    const auto& lek = res.GetResult().GetLastEvaluatedKey();
    if (lek.empty()) break;
    req.SetExclusiveStartKey(lek);
  }

  RankScores(out, limit);
  return out;
}

bool DynamoStorage::HealthCheck() {
  for (const auto& table : {cfg_.users_table, cfg_.high_scores_table, cfg_.scores_table}) {
    Aws::DynamoDB::Model::DescribeTableRequest req;
    req.SetTableName(table.c_str());
    auto res = client_->DescribeTable(req);
    if (!res.IsSuccess()) {
      std::cerr << "Dynamo health check failed for " << table << ": " << res.GetError().GetMessage() << "\n";
      return false;
    }
  }
  return true;
}

bool DynamoStorage::ResetForDev() {
  auto delete_by_scan = [&](const std::string& table, const std::string& pk, const std::optional<std::string>& sk) {
    Aws::DynamoDB::Model::ScanRequest scan;
    scan.SetTableName(table.c_str());
    while (true) {
      auto out = client_->Scan(scan);
      if (!out.IsSuccess()) return false;
      for (const auto& item : out.GetResult().GetItems()) {
        Aws::DynamoDB::Model::DeleteItemRequest del;
        del.SetTableName(table.c_str());
        auto it_pk = item.find(pk.c_str());
        if (it_pk == item.end()) continue;
        del.AddKey(pk.c_str(), it_pk->second);
        if (sk.has_value()) {
          auto it_sk = item.find(sk->c_str());
          if (it_sk == item.end()) continue;
          del.AddKey(sk->c_str(), it_sk->second);
        }
        if (!client_->DeleteItem(del).IsSuccess()) return false;
      }
      const auto& lek = out.GetResult().GetLastEvaluatedKey();
      if (lek.empty()) break;
      scan.SetExclusiveStartKey(lek);
    }
    return true;
  };

  return delete_by_scan(cfg_.scores_table, "score_id", std::nullopt) &&
         delete_by_scan(cfg_.high_scores_table, "user_id", std::optional<std::string>("mode")) &&
         delete_by_scan(cfg_.users_table, "user_id", std::nullopt);
}

}  // namespace storage
