#pragma once

/**
 * @file presets.hpp
 * @brief Canned database schemas for common application shapes.
 *
 * Each preset is a DatabaseSchema at version 1 with no records, ready for
 * Registry::seed(). Append records to the stores before seeding as needed.
 */

#include "mockidb/registry.hpp"

#include <string>

namespace mockidb::presets {

/// "data" store keyed by "key".
DatabaseSchema key_value_store(std::string name = "kvStore");

/// "users" (unique email/username) and "sessions" (userId, expiresAt).
DatabaseSchema users_database(std::string name = "usersDb");

/// "todos" (completed, createdAt, priority) and "categories".
DatabaseSchema todo_database(std::string name = "todoDb");

/// Offline cache: "requests" and "responses", both keyed by "url".
DatabaseSchema cache_database(std::string name = "cacheDb");

} // namespace mockidb::presets
