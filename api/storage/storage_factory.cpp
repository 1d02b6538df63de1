#include "storage_factory.h"

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>

#include "dynamo_storage.h"
#include "memory_storage.h"

namespace storage {
namespace {

// First non-empty variable among the given names.
std::optional<std::string> LookupEnv(std::initializer_list<const char*> names) {
  for (const char* name : names) {
    const char* v = std::getenv(name);
    if (v && *v) return std::string(v);
  }
  return std::nullopt;
}

std::string RequireTable(const char* name, const char* legacy_name) {
  const auto v = LookupEnv({name, legacy_name});
  if (!v.has_value()) {
    throw std::runtime_error(std::string("DynamoDB table not configured: set ") + name + " or " + legacy_name);
  }
  return *v;
}

}  // namespace

std::unique_ptr<IStorage> CreateStorageFromEnv() {
  const std::string backend = LookupEnv({"STORAGE_BACKEND"}).value_or("memory");
  if (backend == "memory") return std::make_unique<MemoryStorage>();
  if (backend != "dynamo") {
    throw std::runtime_error("Unknown STORAGE_BACKEND '" + backend + "', use memory or dynamo");
  }

  DynamoConfig cfg;
  cfg.endpoint = LookupEnv({"DDB_ENDPOINT", "DYNAMO_ENDPOINT"}).value_or("");
  cfg.region = LookupEnv({"DYNAMO_REGION", "AWS_REGION"}).value_or("us-east-1");
  cfg.users_table = RequireTable("TABLE_USERS", "DYNAMO_TABLE_USERS");
  cfg.high_scores_table = RequireTable("TABLE_HIGH_SCORES", "DYNAMO_TABLE_HIGH_SCORES");
  cfg.scores_table = RequireTable("TABLE_SCORES", "DYNAMO_TABLE_SCORES");
  return std::make_unique<DynamoStorage>(cfg);
}

}  // namespace storage
