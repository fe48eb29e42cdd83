#pragma once

/**
 * @file mockidb.hpp
 * @brief Umbrella header for the in-memory IndexedDB engine.
 *
 * Typical harness usage:
 *
 *   mockidb::Registry registry;
 *   auto open = registry.open("shop", 1, [](const mockidb::UpgradeEvent &e) {
 *     (void)e.transaction->create_object_store("items", {.key_path = "id"});
 *   });
 *   registry.run_until_idle();
 *   auto db = open->result();
 */

#include "mockidb/connection.hpp"
#include "mockidb/core.hpp"
#include "mockidb/cursor.hpp"
#include "mockidb/database.hpp"
#include "mockidb/error.hpp"
#include "mockidb/index.hpp"
#include "mockidb/key.hpp"
#include "mockidb/key_path.hpp"
#include "mockidb/object_store.hpp"
#include "mockidb/presets.hpp"
#include "mockidb/registry.hpp"
#include "mockidb/request.hpp"
#include "mockidb/scheduler.hpp"
#include "mockidb/schema.hpp"
#include "mockidb/store_handle.hpp"
#include "mockidb/trace.hpp"
#include "mockidb/transaction.hpp"
#include "mockidb/value.hpp"
