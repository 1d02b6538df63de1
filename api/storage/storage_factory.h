#pragma once

#include <memory>

#include "storage.h"

namespace storage {

// STORAGE_BACKEND=memory (default) or dynamo. Throws std::runtime_error on bad configuration.
std::unique_ptr<IStorage> CreateStorageFromEnv();

}  // namespace storage
