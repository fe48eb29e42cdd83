/**
 * @file test_key_path.cpp
 * @brief Unit tests for key path validation, evaluation and key injection.
 */

#include "mockidb/key_path.hpp"

#include <gtest/gtest.h>

using namespace mockidb;

TEST(KeyPathTest, Validation) {
  EXPECT_TRUE(KeyPath().is_valid());
  EXPECT_TRUE(KeyPath("").is_valid());
  EXPECT_TRUE(KeyPath("id").is_valid());
  EXPECT_TRUE(KeyPath("address.city").is_valid());
  EXPECT_TRUE(KeyPath("$meta._rev2").is_valid());
  EXPECT_TRUE(KeyPath::compound({"a", "b.c"}).is_valid());

  EXPECT_FALSE(KeyPath("2fast").is_valid());
  EXPECT_FALSE(KeyPath("a..b").is_valid());
  EXPECT_FALSE(KeyPath("a.").is_valid());
  EXPECT_FALSE(KeyPath("a b").is_valid());
  EXPECT_FALSE(KeyPath::compound({}).is_valid());
  EXPECT_FALSE(KeyPath::compound({"ok", "not ok"}).is_valid());
}

TEST(KeyPathTest, ToString) {
  EXPECT_EQ(KeyPath().to_string(), "null");
  EXPECT_EQ(KeyPath("a.b").to_string(), "a.b");
  EXPECT_EQ(KeyPath::compound({"x", "y"}).to_string(), "[x, y]");
}

TEST(KeyPathTest, EvaluatesNestedMembers) {
  Value v = Value::object(
      {{"id", 4}, {"address", Value::object({{"city", "Oslo"}})}});

  auto id = evaluate_key_path(v, KeyPath("id"));
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(*id, Value(4));

  auto city = extract_key(v, KeyPath("address.city"));
  ASSERT_TRUE(city.has_value());
  EXPECT_EQ(*city, Key("Oslo"));

  EXPECT_FALSE(evaluate_key_path(v, KeyPath("address.zip")).has_value());
  EXPECT_FALSE(evaluate_key_path(v, KeyPath("id.value")).has_value());
}

TEST(KeyPathTest, EmptyPathIsTheValueItself) {
  auto key = extract_key(Value("self"), KeyPath(""));
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(*key, Key("self"));
}

TEST(KeyPathTest, LengthStep) {
  Value v = Value::object({{"name", "abcd"}, {"tags", Value::array({1, 2})}});
  EXPECT_EQ(extract_key(v, KeyPath("name.length")), Key(4));
  EXPECT_EQ(extract_key(v, KeyPath("tags.length")), Key(2));
}

TEST(KeyPathTest, CompoundPathYieldsArrayKey) {
  Value v = Value::object({{"last", "Doe"}, {"first", "Jane"}});
  auto key = extract_key(v, KeyPath::compound({"last", "first"}));
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(*key, Key::array({"Doe", "Jane"}));

  // One missing component and there is no key at all.
  EXPECT_FALSE(
      extract_key(v, KeyPath::compound({"last", "middle"})).has_value());
}

TEST(KeyPathTest, InvalidKeyValueYieldsNoKey) {
  Value v = Value::object({{"flag", true}});
  EXPECT_TRUE(evaluate_key_path(v, KeyPath("flag")).has_value());
  EXPECT_FALSE(extract_key(v, KeyPath("flag")).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Index Key Derivation
// ═══════════════════════════════════════════════════════════════════════════

TEST(IndexKeysTest, SingleEntryUsesWholeValue) {
  Value v = Value::object({{"tags", Value::array({"a", "b"})}});
  auto keys = extract_index_keys(v, KeyPath("tags"), false);
  ASSERT_EQ(keys.size(), 1u);
  EXPECT_EQ(keys[0], Key::array({"a", "b"}));
}

TEST(IndexKeysTest, MultiEntryFansOutAndDeduplicates) {
  Value v = Value::object(
      {{"tags", Value::array({"b", "a", "b", true, nullptr, 3})}});
  auto keys = extract_index_keys(v, KeyPath("tags"), true);
  std::vector<Key> expected = {Key("b"), Key("a"), Key(3)};
  EXPECT_EQ(keys, expected);
}

TEST(IndexKeysTest, MissingOrInvalidValueContributesNothing) {
  Value v = Value::object({{"tags", nullptr}});
  EXPECT_TRUE(extract_index_keys(v, KeyPath("tags"), true).empty());
  EXPECT_TRUE(extract_index_keys(v, KeyPath("other"), false).empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Injection
// ═══════════════════════════════════════════════════════════════════════════

TEST(InjectKeyTest, CreatesIntermediateObjects) {
  Value v = Value::object({{"name", "x"}});
  ASSERT_TRUE(can_inject_key(v, "meta.id"));
  inject_key(v, "meta.id", Key(9));
  EXPECT_EQ(extract_key(v, KeyPath("meta.id")), Key(9));
  EXPECT_EQ(v.find("name")->as_string(), "x");
}

TEST(InjectKeyTest, RefusesNonObjectsAndOccupiedMembers) {
  EXPECT_FALSE(can_inject_key(Value(5), "id"));
  EXPECT_FALSE(can_inject_key(Value::object({{"id", 1}}), "id"));
  EXPECT_FALSE(can_inject_key(Value::object({{"meta", "str"}}), "meta.id"));
  EXPECT_TRUE(can_inject_key(Value::object({{"id", Value()}}), "id"));
}
