#pragma once
#include <string>

namespace mmig {

// Creates the store file if needed, applies pragmas and the schema file.
// Idempotent: the schema only uses CREATE ... IF NOT EXISTS.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace mmig
