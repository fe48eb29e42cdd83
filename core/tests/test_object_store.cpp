/**
 * @file test_object_store.cpp
 * @brief Unit tests for the record table, key generator and indices.
 *
 * Tests cover:
 *   - Key resolution: explicit key, key path, generator, and their errors.
 *   - Generator monotonicity and the bump from explicit numeric keys.
 *   - Unique index enforcement leaving the store untouched on failure.
 *   - Index consistency across put/overwrite, delete and clear.
 *   - Index creation: backfill, duplicate detection, option validation.
 *   - Database catalog rules for object stores.
 *   - Indices rebuilt from the records after randomized transactions
 *     (writes, cursor update/delete, aborts) match the maintained ones.
 */

#include "harness.hpp"
#include "mockidb/database.hpp"
#include "mockidb/object_store.hpp"

#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

using namespace mockidb;

namespace {

size_t index_pairs(const ObjectStore &os, const std::string &name) {
  const Index *index = os.index(name);
  return index ? index->size() : 0;
}

/// Few categories, skus and tags so unique clashes and shared keys are common.
Value random_item(int id, std::mt19937 &rng) {
  std::uniform_int_distribution<int> pick(0, 5);
  Value v = Value::object(
      {{"id", id}, {"category", "c" + std::to_string(pick(rng) % 3)}});
  if (pick(rng) != 0)
    v["sku"] = "s" + std::to_string(pick(rng) + pick(rng));
  Value::Array tags;
  for (int n = pick(rng) % 4; n > 0; --n)
    tags.emplace_back(std::string(1, static_cast<char>('a' + pick(rng) % 3)));
  if (pick(rng) != 0)
    v["tags"] = Value(std::move(tags));
  return v;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Key Resolution
// ═══════════════════════════════════════════════════════════════════════════

TEST(ObjectStoreTest, InlineKeyFromKeyPath) {
  ObjectStore os("users", {.key_path = "id"});
  auto key = os.store_record(Value::object({{"id", 7}, {"n", "a"}}),
                             std::nullopt, false);
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(*key, Key(7));
  ASSERT_NE(os.find(7), nullptr);
}

TEST(ObjectStoreTest, OutOfLineKeyRequired) {
  ObjectStore os("blobs", {});
  auto missing = os.store_record(Value("payload"), std::nullopt, false);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().kind, ErrorKind::Data);

  auto stored = os.store_record(Value("payload"), Key("k1"), false);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(*os.find("k1"), Value("payload"));
}

TEST(ObjectStoreTest, KeyPathYieldingInvalidKeyIsDataError) {
  ObjectStore os("users", {.key_path = "id", .auto_increment = true});
  auto result =
      os.store_record(Value::object({{"id", true}}), std::nullopt, false);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Data);
  EXPECT_EQ(os.size(), 0u);
  EXPECT_EQ(os.key_generator(), 1.0);
}

TEST(ObjectStoreTest, AddRejectsExistingKeyPutOverwrites) {
  ObjectStore os("kv", {.key_path = "key"});
  ASSERT_TRUE(os.store_record(Value::object({{"key", "a"}, {"v", 1}}),
                              std::nullopt, false));

  auto dup = os.store_record(Value::object({{"key", "a"}, {"v", 2}}),
                             std::nullopt, false);
  ASSERT_FALSE(dup.has_value());
  EXPECT_EQ(dup.error().kind, ErrorKind::Constraint);
  EXPECT_EQ(os.find("a")->find("v")->as_number(), 1.0);

  ASSERT_TRUE(os.store_record(Value::object({{"key", "a"}, {"v", 2}}),
                              std::nullopt, true));
  EXPECT_EQ(os.find("a")->find("v")->as_number(), 2.0);
  EXPECT_EQ(os.size(), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Key Generator
// ═══════════════════════════════════════════════════════════════════════════

TEST(KeyGeneratorTest, GeneratesAndInjectsSequentialKeys) {
  ObjectStore os("users", {.key_path = "id", .auto_increment = true});
  auto a = os.store_record(Value::object({{"name", "Alice"}}), std::nullopt,
                           false);
  auto b =
      os.store_record(Value::object({{"name", "Bob"}}), std::nullopt, false);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(*a, Key(1));
  EXPECT_EQ(*b, Key(2));
  EXPECT_EQ(*os.find(1)->find("id"), Value(1));
  EXPECT_EQ(*os.find(2)->find("name"), Value("Bob"));
}

TEST(KeyGeneratorTest, ExplicitNumericKeyBumpsGenerator) {
  ObjectStore os("items", {.auto_increment = true});
  ASSERT_TRUE(os.store_record(Value("x"), Key(10.5), false));
  EXPECT_EQ(os.key_generator(), 11.0);

  auto next = os.store_record(Value("y"), std::nullopt, false);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(*next, Key(11));

  // Smaller and non-numeric keys leave it alone.
  ASSERT_TRUE(os.store_record(Value("z"), Key(3), false));
  ASSERT_TRUE(os.store_record(Value("w"), Key("str"), false));
  EXPECT_EQ(os.key_generator(), 12.0);
}

TEST(KeyGeneratorTest, FailedWritesDoNotAdvanceTheGenerator) {
  ObjectStore os("users", {.key_path = "id", .auto_increment = true});
  ASSERT_TRUE(os.create_index({"email", "email", true, false}));
  ASSERT_TRUE(os.store_record(Value::object({{"email", "a@x"}}),
                              std::nullopt, false));

  auto clash = os.store_record(Value::object({{"email", "a@x"}}),
                               std::nullopt, false);
  ASSERT_FALSE(clash.has_value());
  EXPECT_EQ(os.key_generator(), 2.0);
}

TEST(KeyGeneratorTest, ClearKeepsTheGenerator) {
  ObjectStore os("items", {.auto_increment = true});
  ASSERT_TRUE(os.store_record(Value("a"), std::nullopt, false));
  ASSERT_TRUE(os.store_record(Value("b"), std::nullopt, false));
  os.clear();
  EXPECT_EQ(os.size(), 0u);
  EXPECT_EQ(*os.store_record(Value("c"), std::nullopt, false), Key(3));
}

TEST(KeyGeneratorTest, ExhaustionIsConstraintError) {
  ObjectStore os("items", {.auto_increment = true});
  ASSERT_TRUE(os.store_record(Value("max"), Key(MAX_GENERATED_KEY), false));
  auto overflow = os.store_record(Value("next"), std::nullopt, false);
  ASSERT_FALSE(overflow.has_value());
  EXPECT_EQ(overflow.error().kind, ErrorKind::Constraint);

  // Explicit keys still work.
  EXPECT_TRUE(os.store_record(Value("explicit"), Key(-1), false));
}

TEST(KeyGeneratorTest, UninjectableValueIsDataError) {
  ObjectStore os("users", {.key_path = "id", .auto_increment = true});
  auto result = os.store_record(Value("not an object"), std::nullopt, false);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Data);
}

// ═══════════════════════════════════════════════════════════════════════════
// Indices
// ═══════════════════════════════════════════════════════════════════════════

TEST(IndexTest, UniqueViolationLeavesStoreUnchanged) {
  ObjectStore os("users", {.key_path = "id"});
  ASSERT_TRUE(os.create_index({"email", "email", true, false}));
  ASSERT_TRUE(os.store_record(
      Value::object({{"id", 1}, {"email", "a@x.com"}}), std::nullopt, false));

  auto dup = os.store_record(Value::object({{"id", 2}, {"email", "a@x.com"}}),
                             std::nullopt, false);
  ASSERT_FALSE(dup.has_value());
  EXPECT_EQ(dup.error().kind, ErrorKind::Constraint);
  EXPECT_EQ(os.size(), 1u);
  EXPECT_EQ(os.find(2), nullptr);
  EXPECT_EQ(index_pairs(os, "email"), 1u);
}

TEST(IndexTest, OverwriteKeepsOwnUniqueKey) {
  ObjectStore os("users", {.key_path = "id"});
  ASSERT_TRUE(os.create_index({"email", "email", true, false}));
  ASSERT_TRUE(os.store_record(Value::object({{"id", 1}, {"email", "a"}}),
                              std::nullopt, false));
  // Same record, same email: not a conflict.
  EXPECT_TRUE(os.store_record(
      Value::object({{"id", 1}, {"email", "a"}, {"v", 2}}), std::nullopt,
      true));
}

TEST(IndexTest, PutMovesIndexEntries) {
  ObjectStore os("todos", {.key_path = "id"});
  ASSERT_TRUE(os.create_index({"tag", "tags", false, true}));
  ASSERT_TRUE(os.store_record(
      Value::object({{"id", 1}, {"tags", Value::array({"a", "b"})}}),
      std::nullopt, false));
  ASSERT_TRUE(os.store_record(
      Value::object({{"id", 1}, {"tags", Value::array({"c"})}}), std::nullopt,
      true));

  const auto &entries = os.index("tag")->entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries.begin()->first, Key("c"));
  EXPECT_EQ(*entries.begin()->second.begin(), Key(1));
}

TEST(IndexTest, RemoveRangeAndClearRetractEntries) {
  ObjectStore os("n", {.key_path = "id"});
  ASSERT_TRUE(os.create_index({"parity", "parity", false, false}));
  for (int i = 1; i <= 6; ++i) {
    ASSERT_TRUE(os.store_record(
        Value::object({{"id", i}, {"parity", i % 2 ? "odd" : "even"}}),
        std::nullopt, false));
  }

  EXPECT_EQ(os.remove_range(KeyRange::bound(2, 4).value()), 3u);
  EXPECT_EQ(os.size(), 3u);
  EXPECT_EQ(index_pairs(os, "parity"), 3u);

  os.clear();
  EXPECT_EQ(index_pairs(os, "parity"), 0u);
}

TEST(IndexTest, RecordsWithoutIndexKeyAreNotIndexed) {
  ObjectStore os("users", {.key_path = "id"});
  ASSERT_TRUE(os.create_index({"email", "email", true, false}));
  ASSERT_TRUE(os.store_record(Value::object({{"id", 1}}), std::nullopt,
                              false));
  ASSERT_TRUE(os.store_record(Value::object({{"id", 2}}), std::nullopt,
                              false));
  EXPECT_EQ(index_pairs(os, "email"), 0u);
}

TEST(IndexTest, CreateBackfillsExistingRecords) {
  ObjectStore os("users", {.key_path = "id"});
  ASSERT_TRUE(os.store_record(Value::object({{"id", 1}, {"age", 30}}),
                              std::nullopt, false));
  ASSERT_TRUE(os.store_record(Value::object({{"id", 2}, {"age", 30}}),
                              std::nullopt, false));

  ASSERT_TRUE(os.create_index({"age", "age", false, false}));
  EXPECT_EQ(index_pairs(os, "age"), 2u);

  auto unique = os.create_index({"age_u", "age", true, false});
  ASSERT_FALSE(unique.has_value());
  EXPECT_EQ(unique.error().kind, ErrorKind::Constraint);
  EXPECT_FALSE(os.has_index("age_u"));
}

TEST(IndexTest, CreateValidatesOptions) {
  ObjectStore os("s", {});
  ASSERT_TRUE(os.create_index({"a", "a", false, false}));

  EXPECT_EQ(os.create_index({"a", "b", false, false}).error().kind,
            ErrorKind::Constraint);
  EXPECT_EQ(os.create_index({"bad", "1x", false, false}).error().kind,
            ErrorKind::Data);
  EXPECT_EQ(os.create_index({"none", KeyPath(), false, false}).error().kind,
            ErrorKind::Data);
  EXPECT_EQ(os.create_index({"multi", KeyPath::compound({"a", "b"}), false,
                             true})
                .error()
                .kind,
            ErrorKind::InvalidAccess);

  EXPECT_TRUE(os.delete_index("a"));
  EXPECT_EQ(os.delete_index("a").error().kind, ErrorKind::NotFound);
  EXPECT_TRUE(os.index_names().empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Database Catalog
// ═══════════════════════════════════════════════════════════════════════════

TEST(DatabaseCatalogTest, StoreCreationRules) {
  Database db("shop", 1);
  ASSERT_TRUE(db.create_store("orders", {.key_path = "id"}));

  EXPECT_EQ(db.create_store("orders", {}).error().kind,
            ErrorKind::Constraint);
  EXPECT_EQ(db.create_store("bad", {.key_path = "a..b"}).error().kind,
            ErrorKind::Data);
  EXPECT_EQ(
      db.create_store("gen", {.key_path = "", .auto_increment = true})
          .error()
          .kind,
      ErrorKind::InvalidAccess);
  EXPECT_EQ(db.create_store("gen2", {.key_path = KeyPath::compound({"a"}),
                                     .auto_increment = true})
                .error()
                .kind,
            ErrorKind::InvalidAccess);
  EXPECT_TRUE(db.create_store("gen3", {.auto_increment = true}));

  EXPECT_EQ(db.store_names(), (std::vector<std::string>{"gen3", "orders"}));
  EXPECT_EQ(db.delete_store("nope").error().kind, ErrorKind::NotFound);
}

TEST(DatabaseCatalogTest, SnapshotRestore) {
  Database db("shop", 1);
  ASSERT_TRUE(db.create_store("a", {}));
  auto snapshot = db.snapshot();

  ASSERT_TRUE(db.create_store("b", {}));
  ASSERT_TRUE(db.delete_store("a"));
  db.set_version(2);

  db.restore(std::move(snapshot));
  EXPECT_EQ(db.version(), 1u);
  EXPECT_EQ(db.store_names(), std::vector<std::string>{"a"});
}

// ═══════════════════════════════════════════════════════════════════════════
// Index Consistency
// ═══════════════════════════════════════════════════════════════════════════

class IndexConsistencyTest : public mockidb::test::RegistryTest {
protected:
  void SetUp() override {
    db_ = open_db("shop", 1, [](Transaction &txn) {
      create_store(txn, "items", {.key_path = "id"});
      auto items = txn.store("items").value();
      ASSERT_TRUE(items.create_index("category", "category"));
      ASSERT_TRUE(items.create_index("tags", "tags", {.multi_entry = true}));
      ASSERT_TRUE(items.create_index("sku", "sku", {.unique = true}));
    });
    ASSERT_NE(db_, nullptr);
  }

  /// Rebuild every index from records() and compare with the live entries.
  void expect_indices_match_records(int round) {
    auto txn = begin(db_, {"items"}, TransactionMode::ReadOnly);
    const ObjectStore *os = txn->database().find_store("items");
    ASSERT_NE(os, nullptr);
    for (const std::string name : {"category", "tags", "sku"}) {
      const Index *index = os->index(name);
      ASSERT_NE(index, nullptr);
      Index::Entries rebuilt;
      for (const auto &[primary, value] : os->records()) {
        for (auto &key : extract_index_keys(value, index->schema().key_path,
                                            index->schema().multi_entry))
          rebuilt[std::move(key)].insert(primary);
      }
      EXPECT_TRUE(index->entries() == rebuilt)
          << "index " << name << " drifted in round " << round;
      if (index->schema().unique) {
        for (const auto &[key, primaries] : index->entries())
          EXPECT_EQ(primaries.size(), 1u) << "round " << round;
      }
    }
    drain();
  }

  std::shared_ptr<Connection> db_;
};

TEST_F(IndexConsistencyTest, IndicesMatchRecordsAfterMixedWrites) {
  std::mt19937 rng(1337);
  std::uniform_int_distribution<int> id(1, 24);
  std::uniform_int_distribution<int> choice(0, 9);

  for (int round = 0; round < 80; ++round) {
    auto before = registry_.store_records("shop", "items").value();
    const bool abort_round = round % 5 == 4;

    auto txn = begin(db_, {"items"});
    txn->on_error([](Transaction &, RequestBase &request) {
      request.prevent_default();
    });
    auto items = store(txn, "items");
    for (int i = 0; i < 6; ++i) {
      switch (choice(rng) % 4) {
      case 0:
        items.add(random_item(id(rng), rng));
        break;
      case 1:
        items.put(random_item(id(rng), rng));
        break;
      case 2:
        items.remove(id(rng));
        break;
      default: {
        int lo = id(rng);
        items.remove(KeyRange::bound(lo, lo + 3).value());
      }
      }
    }

    auto walk = items.open_cursor(std::nullopt, round % 2 == 0
                                                    ? CursorDirection::Next
                                                    : CursorDirection::Prev);
    walk->on_success([&](CursorRequest &r) {
      auto cursor = r.result();
      if (!cursor) {
        if (abort_round)
          EXPECT_TRUE(txn->abort().has_value());
        return;
      }
      int c = choice(rng);
      if (c < 3) {
        auto replacement = random_item(0, rng);
        replacement["id"] = *cursor->value()->find("id");
        cursor->update(std::move(replacement));
      } else if (c < 5) {
        cursor->remove();
      }
      ASSERT_TRUE(cursor->continue_().has_value());
    });
    drain();

    if (abort_round) {
      EXPECT_EQ(txn->state(), TransactionState::Aborted);
      EXPECT_TRUE(registry_.store_records("shop", "items").value() == before)
          << "round " << round;
    } else {
      EXPECT_EQ(txn->state(), TransactionState::Committed);
    }
    expect_indices_match_records(round);
  }
}
