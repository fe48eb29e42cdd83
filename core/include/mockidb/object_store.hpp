#pragma once

/**
 * @file object_store.hpp
 * @brief Record table of one object store plus its secondary indices.
 *
 * ObjectStore is the engine-side state: it applies mutations immediately and
 * reports failure through Result. Request deferral, scope and mode checks
 * live one layer up (Transaction / StoreHandle).
 *
 * Write path (store_record):
 *   1. Resolve the key: explicit > key path value > generator
 *   2. Reject an existing key unless overwriting
 *   3. Check every unique index, ignoring entries of the same primary key
 *   4. Retract the old record's index keys, store, insert new index keys
 *   5. Commit the generator advance
 * Nothing is mutated when any step fails.
 *
 * The type is a regular value type; copies serve as transaction snapshots.
 */

#include "mockidb/error.hpp"
#include "mockidb/index.hpp"
#include "mockidb/schema.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mockidb {

class ObjectStore {
public:
  using Records = std::map<Key, Value>;

  ObjectStore(std::string name, StoreOptions options);

  const std::string &name() const noexcept { return name_; }
  const KeyPath &key_path() const noexcept { return options_.key_path; }
  bool auto_increment() const noexcept { return options_.auto_increment; }
  const StoreOptions &options() const noexcept { return options_; }

  const Records &records() const noexcept { return records_; }
  size_t size() const noexcept { return records_.size(); }

  /// Stored value for key, or nullptr.
  const Value *find(const Key &key) const;

  /**
   * @brief Insert (add) or upsert (put) a record.
   * @param value     Record value; a generated key is injected at the key path
   * @param key       Explicit out-of-band key, if any
   * @param overwrite false for add semantics, true for put
   * @return The primary key the record was stored under
   */
  Result<Key> store_record(Value value, std::optional<Key> key, bool overwrite);

  /// Delete every record within range; returns the number removed.
  size_t remove_range(const KeyRange &range);

  /// Delete every record. The key generator is left untouched.
  void clear();

  /// Create an index and backfill it from existing records.
  Result<void> create_index(IndexSchema schema);
  Result<void> delete_index(const std::string &name);

  /// nullptr if no index of that name exists.
  const Index *index(const std::string &name) const;
  bool has_index(const std::string &name) const;
  /// Sorted.
  std::vector<std::string> index_names() const;
  const std::map<std::string, Index> &indices() const noexcept {
    return indices_;
  }

  /// The next key the generator would hand out.
  double key_generator() const noexcept { return next_key_; }

private:
  /// Key resolution without side effects. next_key receives the generator
  /// value to commit if the write succeeds.
  Result<Key> resolve_key(Value &value, std::optional<Key> explicit_key,
                          double &next_key) const;

  void unindex(const Key &primary, const Value &value);

  std::string name_;
  StoreOptions options_;
  Records records_;
  std::map<std::string, Index> indices_;
  double next_key_ = 1.0;
};

} // namespace mockidb
