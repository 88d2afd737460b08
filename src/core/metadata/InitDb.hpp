#pragma once
#include <string>

namespace recstore {

// Opens (creating if needed) the SQLite file at dbPath and applies the
// schema script. Idempotent. Throws std::runtime_error on failure.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace recstore
