/**
 * @file test_registry.cpp
 * @brief Database registry: open/upgrade, versioning, deletion and fixtures.
 *
 * Tests cover:
 *   - New databases run an upgrade from version 0; reopening does not.
 *   - The version gate (VersionError, DataError for 0).
 *   - Aborted upgrades restore the previous catalog, or drop a new database.
 *   - versionchange notification of other connections, concurrent upgrades.
 *   - deleteDatabase closing connections, databases() listing.
 *   - Seeding, introspection, presets and engine information.
 *   - A unique index whose backfill collides aborts the upgrade.
 */

#include "harness.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace mockidb;
using mockidb::test::RegistryTest;

// ═══════════════════════════════════════════════════════════════════════════
// Open & Upgrade
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(RegistryTest, OpenNewDatabaseRunsUpgradeFirst) {
  std::vector<std::string> events;
  auto request = registry_.open("app");
  request->on_upgrade_needed([&](const UpgradeEvent &event) {
    events.push_back("upgradeneeded");
    EXPECT_EQ(event.old_version, 0u);
    EXPECT_EQ(event.new_version, 1u);
    EXPECT_EQ(event.transaction->mode(), TransactionMode::VersionChange);
    EXPECT_EQ(event.connection->version(), 1u);
    ASSERT_TRUE(event.connection->create_object_store("notes"));
  });
  request->on_success([&](OpenRequest::Request &r) {
    events.push_back("success");
    EXPECT_EQ(r.result()->object_store_names(),
              std::vector<std::string>{"notes"});
  });

  EXPECT_EQ(request->ready_state(), ReadyState::Pending);
  EXPECT_TRUE(events.empty());
  drain();
  EXPECT_EQ(events, (std::vector<std::string>{"upgradeneeded", "success"}));
  EXPECT_EQ(request->result()->version(), 1u);
}

TEST_F(RegistryTest, ReopenAtSameVersionSkipsUpgrade) {
  open_db("app", 3, [](Transaction &txn) { create_store(txn, "s"); });

  bool upgraded = false;
  auto request = registry_.open("app", 3, [&](const UpgradeEvent &) {
    upgraded = true;
  });
  auto current = registry_.open("app");
  drain();
  EXPECT_FALSE(upgraded);
  EXPECT_EQ(request->result()->version(), 3u);
  EXPECT_EQ(current->result()->version(), 3u);
  EXPECT_EQ(current->result()->object_store_names(),
            std::vector<std::string>{"s"});
}

TEST_F(RegistryTest, LowerVersionIsVersionError) {
  open_db("app", 2);
  auto request = registry_.open("app", 1);
  drain();
  ASSERT_TRUE(request->error().has_value());
  EXPECT_EQ(request->error()->kind, ErrorKind::Version);
  EXPECT_EQ(request->error()->name(), "VersionError");
}

TEST_F(RegistryTest, VersionZeroIsDataError) {
  auto request = registry_.open("app", 0);
  drain();
  EXPECT_EQ(request->error()->kind, ErrorKind::Data);
  EXPECT_FALSE(registry_.has_database("app"));
}

TEST_F(RegistryTest, UpgradeCanWriteRecords) {
  auto db = open_db("app", 1, [](Transaction &txn) {
    create_store(txn, "kv", {.key_path = "k"});
    txn.store("kv").value().put(Value::object({{"k", "a"}, {"v", 1}}));
  });
  auto records = registry_.store_records("app", "kv").value();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_TRUE(records.contains("a"));
}

TEST_F(RegistryTest, AbortedUpgradeRestoresPreviousCatalog) {
  auto v1 = open_db("app", 1, [](Transaction &txn) {
    create_store(txn, "a");
    txn.store("a").value().put("kept", Key(1));
  });

  auto request = registry_.open("app", 2, [](const UpgradeEvent &event) {
    create_store(*event.transaction, "b");
    ASSERT_TRUE(event.transaction->delete_object_store("a"));
    ASSERT_TRUE(event.transaction->abort());
  });
  drain();

  ASSERT_TRUE(request->error().has_value());
  EXPECT_EQ(request->error()->kind, ErrorKind::Abort);
  EXPECT_EQ(v1->version(), 1u);
  EXPECT_EQ(v1->object_store_names(), std::vector<std::string>{"a"});
  EXPECT_EQ(registry_.store_records("app", "a")->size(), 1u);
}

TEST_F(RegistryTest, AbortedFirstUpgradeDropsTheDatabase) {
  auto request = registry_.open("tmp", 1, [](const UpgradeEvent &event) {
    create_store(*event.transaction, "s");
    ASSERT_TRUE(event.transaction->abort());
  });
  drain();
  EXPECT_EQ(request->error()->kind, ErrorKind::Abort);
  EXPECT_FALSE(registry_.has_database("tmp"));

  auto list = registry_.databases();
  drain();
  EXPECT_TRUE(list->result().empty());
}

TEST_F(RegistryTest, CatalogErrorInUpgradeAbortsIt) {
  std::shared_ptr<Transaction> upgrade;
  auto request = registry_.open("app", 1, [&](const UpgradeEvent &event) {
    upgrade = event.transaction;
    create_store(*event.transaction, "s");
    auto dup = event.transaction->create_object_store("s");
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().kind, ErrorKind::Constraint);
    EXPECT_EQ(event.transaction->state(), TransactionState::Aborted);
  });
  drain();
  EXPECT_EQ(request->error()->kind, ErrorKind::Abort);
  ASSERT_NE(upgrade, nullptr);
  EXPECT_EQ(upgrade->error()->kind, ErrorKind::Constraint);
}

TEST_F(RegistryTest, UniqueIndexBackfillCollisionAbortsUpgrade) {
  auto v1 = open_db("app", 1, [](Transaction &txn) {
    create_store(txn, "users", {.key_path = "id"});
    auto users = txn.store("users").value();
    users.add(mockidb::test::user(1, "a", "same@x"));
    users.add(mockidb::test::user(2, "b", "same@x"));
  });
  ASSERT_NE(v1, nullptr);

  std::optional<Error> index_error;
  auto request = registry_.open("app", 2, [&](const UpgradeEvent &event) {
    auto users = event.transaction->store("users").value();
    auto created = users.create_index("email", "email", {.unique = true});
    ASSERT_FALSE(created.has_value());
    index_error = created.error();
  });
  drain();

  ASSERT_TRUE(index_error.has_value());
  EXPECT_EQ(index_error->kind, ErrorKind::Constraint);
  ASSERT_TRUE(request->error().has_value());
  EXPECT_EQ(request->error()->kind, ErrorKind::Abort);

  EXPECT_EQ(registry_.all_databases().at("app").version, 1u);
  EXPECT_EQ(registry_.store_records("app", "users")->size(), 2u);

  auto reopened = open_db("app", 1);
  ASSERT_NE(reopened, nullptr);
  auto txn = begin(reopened, {"users"}, TransactionMode::ReadOnly);
  EXPECT_TRUE(store(txn, "users").index_names().empty());
  EXPECT_EQ(store(txn, "users").index("email").error().kind,
            ErrorKind::NotFound);
}

TEST_F(RegistryTest, NoOtherTransactionsDuringUpgrade) {
  open_db("app", 1, [](Transaction &txn) { create_store(txn, "s"); });
  auto request = registry_.open("app", 2, [](const UpgradeEvent &event) {
    auto txn = event.connection->transaction({"s"});
    ASSERT_FALSE(txn.has_value());
    EXPECT_EQ(txn.error().kind, ErrorKind::InvalidState);
  });
  drain();
  auto db = request->result();
  EXPECT_TRUE(db->transaction({"s"}).has_value());
}

TEST_F(RegistryTest, ConcurrentUpgradeIsRejected) {
  open_db("app", 1);
  auto first = registry_.open("app", 2);
  auto second = registry_.open("app", 3);
  drain();
  EXPECT_FALSE(first->error().has_value());
  EXPECT_EQ(second->error()->kind, ErrorKind::InvalidState);
  EXPECT_EQ(first->result()->version(), 2u);
}

TEST_F(RegistryTest, VersionChangeNotifiesOpenConnections) {
  auto v1 = open_db("app", 1);
  std::vector<VersionChangeEvent> seen;
  v1->on_version_change(
      [&](Connection &self, const VersionChangeEvent &event) {
        seen.push_back(event);
        self.close();
      });

  auto v2 = open_db("app", 2);
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].old_version, 1u);
  EXPECT_EQ(seen[0].new_version, std::optional<uint64_t>(2));
  EXPECT_TRUE(v1->closed());
  EXPECT_FALSE(v2->closed());

  auto history = registry_.trace().get_history(v1->source());
  ASSERT_FALSE(history.empty());
  EXPECT_EQ(history[0].kind, TraceKind::VersionChange);
}

// ═══════════════════════════════════════════════════════════════════════════
// Delete & List
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(RegistryTest, DeleteDatabaseClosesConnections) {
  auto db = open_db("app", 4, [](Transaction &txn) { create_store(txn, "s"); });
  std::vector<std::string> events;
  db->on_version_change([&](Connection &, const VersionChangeEvent &event) {
    EXPECT_FALSE(event.new_version.has_value());
    events.push_back("versionchange");
  });
  db->on_close([&](Connection &) { events.push_back("close"); });

  auto request = registry_.delete_database("app");
  request->on_success([&](VoidRequest &) { events.push_back("deleted"); });
  EXPECT_FALSE(registry_.has_database("app"));
  EXPECT_TRUE(events.empty());

  drain();
  EXPECT_EQ(events, (std::vector<std::string>{"versionchange", "close",
                                              "deleted"}));
  EXPECT_TRUE(db->closed());

  auto fresh = open_db("app", 1);
  EXPECT_TRUE(fresh->object_store_names().empty());
}

TEST_F(RegistryTest, DeleteUnknownDatabaseSucceeds) {
  auto request = registry_.delete_database("ghost");
  drain();
  EXPECT_TRUE(request->done());
  EXPECT_FALSE(request->error().has_value());
}

TEST_F(RegistryTest, DatabasesListsNamesAndVersions) {
  open_db("zeta", 2);
  open_db("alpha", 5);
  auto list = registry_.databases();
  drain();
  EXPECT_EQ(list->result(), (std::vector<DatabaseInfo>{{"alpha", 5},
                                                       {"zeta", 2}}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Fixtures & Introspection
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(RegistryTest, SeedThenOpen) {
  DatabaseSchema schema{.name = "shop", .version = 3};
  schema.stores.push_back(StoreSchema{
      .name = "items",
      .options = {.key_path = "id", .auto_increment = true},
      .indexes = {{"sku", "sku", {.unique = true}}},
      .records = {{Value::object({{"sku", "A"}})},
                  {Value::object({{"sku", "B"}})}}});
  ASSERT_TRUE(registry_.seed(schema));

  auto records = registry_.store_records("shop", "items").value();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(*records.at(2).find("id"), Value(2));

  auto db = open_db("shop", 3);
  auto txn = begin(db, {"items"});
  auto next = store(txn, "items").add(Value::object({{"sku", "C"}}));
  drain();
  EXPECT_EQ(next->result(), Key(3));

  auto all = registry_.all_databases();
  ASSERT_TRUE(all.contains("shop"));
  EXPECT_EQ(all.at("shop").version, 3u);
  EXPECT_EQ(all.at("shop").stores.at("items").size(), 3u);
  EXPECT_EQ(registry_.database_records("shop")->size(), 1u);
}

TEST_F(RegistryTest, FailedSeedLeavesRegistryUnchanged) {
  open_db("shop", 1, [](Transaction &txn) { create_store(txn, "old"); });

  DatabaseSchema schema{.name = "shop"};
  schema.stores.push_back(StoreSchema{
      .name = "users",
      .options = {.key_path = "id"},
      .indexes = {{"email", "email", {.unique = true}}},
      .records = {{Value::object({{"id", 1}, {"email", "x"}})},
                  {Value::object({{"id", 2}, {"email", "x"}})}}});
  auto seeded = registry_.seed(schema);
  ASSERT_FALSE(seeded.has_value());
  EXPECT_EQ(seeded.error().kind, ErrorKind::Constraint);

  EXPECT_TRUE(registry_.store_records("shop", "old").has_value());
  EXPECT_EQ(registry_.store_records("shop", "users").error().kind,
            ErrorKind::NotFound);
  EXPECT_EQ(registry_.store_records("nope", "x").error().kind,
            ErrorKind::NotFound);
}

TEST_F(RegistryTest, SeedRejectsVersionZero) {
  DatabaseSchema schema{.name = "shop", .version = 0};
  auto seeded = registry_.seed(schema);
  ASSERT_FALSE(seeded.has_value());
  EXPECT_EQ(seeded.error().kind, ErrorKind::Data);
  EXPECT_FALSE(registry_.has_database("shop"));
}

TEST_F(RegistryTest, SeedReplacesAndClosesConnections) {
  auto db = open_db("kv", 1);
  ASSERT_TRUE(registry_.seed(presets::key_value_store("kv")));
  EXPECT_TRUE(db->closed());
  EXPECT_EQ(registry_.store_records("kv", "data")->size(), 0u);
}

TEST_F(RegistryTest, ClearAllDropsEverything) {
  auto a = open_db("a", 1);
  open_db("b", 1);
  registry_.clear_all();
  EXPECT_TRUE(a->closed());
  EXPECT_FALSE(registry_.has_database("a"));
  EXPECT_TRUE(registry_.all_databases().empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Presets & Build Info
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(RegistryTest, PresetSchemas) {
  ASSERT_TRUE(registry_.seed(presets::users_database()));
  ASSERT_TRUE(registry_.seed(presets::todo_database()));
  ASSERT_TRUE(registry_.seed(presets::cache_database()));

  auto users = open_db("usersDb", 1);
  EXPECT_EQ(users->object_store_names(),
            (std::vector<std::string>{"sessions", "users"}));
  auto todos = open_db("todoDb", 1);
  EXPECT_EQ(todos->object_store_names(),
            (std::vector<std::string>{"categories", "todos"}));
  auto cache = open_db("cacheDb", 1);
  EXPECT_EQ(cache->object_store_names(),
            (std::vector<std::string>{"requests", "responses"}));

  auto txn = begin(users, {"users"});
  auto store_handle = store(txn, "users");
  EXPECT_EQ(store_handle.index_names(),
            (std::vector<std::string>{"email", "username"}));
  auto first = store_handle.add(
      Value::object({{"email", "a@x"}, {"username", "a"}}));
  auto clash = store_handle.add(
      Value::object({{"email", "a@x"}, {"username", "b"}}));
  clash->on_error([](KeyRequest &r) { r.prevent_default(); });
  drain();
  EXPECT_EQ(first->result(), Key(1));
  EXPECT_EQ(clash->error()->kind, ErrorKind::Constraint);
}

TEST(CoreTest, EngineInfoReportsRegistryDefaults) {
  auto info = core::get_engine_info();
  EXPECT_EQ(info.version, core::version());
  EXPECT_EQ(info.max_generated_key, 9007199254740992.0);
  EXPECT_EQ(info.default_max_turns, RegistryOptions{}.max_turns_per_drain);
  EXPECT_EQ(info.default_trace_capacity, RegistryOptions{}.trace_capacity);
  EXPECT_TRUE(info.trace_enabled_by_default);

  auto text = info.to_string();
  EXPECT_NE(text.find("mockidb 0.3.0"), std::string::npos) << text;
  EXPECT_NE(text.find("keys <= 9007199254740992"), std::string::npos) << text;
  EXPECT_NE(text.find("trace on"), std::string::npos) << text;
}
