#include "mockidb/object_store.hpp"

#include <cmath>
#include <format>
#include <limits>

namespace mockidb {

ObjectStore::ObjectStore(std::string name, StoreOptions options)
    : name_(std::move(name)), options_(std::move(options)) {}

const Value *ObjectStore::find(const Key &key) const {
  auto it = records_.find(key);
  return it == records_.end() ? nullptr : &it->second;
}

// ===========================================================================
// Key Resolution
// ===========================================================================

Result<Key> ObjectStore::resolve_key(Value &value,
                                     std::optional<Key> explicit_key,
                                     double &next_key) const {
  next_key = next_key_;

  std::optional<Key> key = std::move(explicit_key);
  const KeyPath &path = options_.key_path;

  if (!key && !path.is_none()) {
    auto evaluated = evaluate_key_path(value, path);
    if (evaluated) {
      key = Key::from_value(*evaluated);
      if (!key)
        return make_error(
            ErrorKind::Data,
            std::format("Evaluating the key path '{}' did not yield a valid "
                        "key",
                        path.to_string()));
    }
  }

  if (key) {
    // Explicit numeric keys push the generator past them.
    if (options_.auto_increment && key->is_number() &&
        key->as_number() >= next_key) {
      // 2^53 + 1 is not representable; any value past the cap will do.
      next_key = key->as_number() >= MAX_GENERATED_KEY
                     ? std::numeric_limits<double>::infinity()
                     : std::floor(key->as_number()) + 1.0;
    }
    return *key;
  }

  if (!options_.auto_increment)
    return make_error(ErrorKind::Data,
                      "No key was provided and the object store has neither a "
                      "resolvable key path nor a key generator");

  if (next_key > MAX_GENERATED_KEY)
    return make_error(ErrorKind::Constraint,
                      "The key generator has reached its maximum value");

  Key generated(next_key);
  if (path.is_string()) {
    if (!can_inject_key(value, path.as_string()))
      return make_error(
          ErrorKind::Data,
          std::format("A generated key cannot be stored at key path '{}'",
                      path.as_string()));
    inject_key(value, path.as_string(), generated);
  }
  next_key += 1.0;
  return generated;
}

// ===========================================================================
// Mutations
// ===========================================================================

Result<Key> ObjectStore::store_record(Value value, std::optional<Key> key,
                                      bool overwrite) {
  double next_key = next_key_;
  auto resolved = resolve_key(value, std::move(key), next_key);
  if (!resolved)
    return std::unexpected(resolved.error());
  const Key &primary = *resolved;

  auto existing = records_.find(primary);
  if (existing != records_.end() && !overwrite)
    return make_error(ErrorKind::Constraint,
                      std::format("Key {} already exists in object store '{}'",
                                  primary.to_string(), name_));

  std::map<std::string, std::vector<Key>> index_keys;
  for (const auto &[index_name, index] : indices_) {
    auto keys = index.derive_keys(value);
    if (auto conflict = index.find_conflict(keys, primary))
      return make_error(
          ErrorKind::Constraint,
          std::format("Unique index '{}' already contains key {}", index_name,
                      conflict->to_string()));
    index_keys.emplace(index_name, std::move(keys));
  }

  if (existing != records_.end()) {
    unindex(primary, existing->second);
    existing->second = std::move(value);
  } else {
    records_.emplace(primary, std::move(value));
  }

  for (auto &[index_name, index] : indices_)
    index.insert(index_keys[index_name], primary);

  next_key_ = next_key;
  return primary;
}

void ObjectStore::unindex(const Key &primary, const Value &value) {
  for (auto &[index_name, index] : indices_)
    index.erase(index.derive_keys(value), primary);
}

size_t ObjectStore::remove_range(const KeyRange &range) {
  size_t removed = 0;
  auto it = range_begin(records_, range);
  while (it != records_.end() && !range.is_above(it->first)) {
    unindex(it->first, it->second);
    it = records_.erase(it);
    ++removed;
  }
  return removed;
}

void ObjectStore::clear() {
  records_.clear();
  for (auto &[index_name, index] : indices_)
    index.clear();
}

// ===========================================================================
// Index Catalog
// ===========================================================================

Result<void> ObjectStore::create_index(IndexSchema schema) {
  if (indices_.contains(schema.name))
    return make_error(ErrorKind::Constraint,
                      std::format("Index '{}' already exists on object store "
                                  "'{}'",
                                  schema.name, name_));
  if (schema.key_path.is_none() || !schema.key_path.is_valid())
    return make_error(ErrorKind::Data,
                      std::format("'{}' is not a valid index key path",
                                  schema.key_path.to_string()));
  if (schema.multi_entry && schema.key_path.is_compound())
    return make_error(ErrorKind::InvalidAccess,
                      "A multiEntry index cannot use a compound key path");

  Index index(std::move(schema));
  for (const auto &[primary, value] : records_) {
    auto keys = index.derive_keys(value);
    if (auto conflict = index.find_conflict(keys, primary))
      return make_error(
          ErrorKind::Constraint,
          std::format("Backfilling unique index '{}' found duplicate key {}",
                      index.name(), conflict->to_string()));
    index.insert(keys, primary);
  }

  std::string index_name = index.name();
  indices_.emplace(std::move(index_name), std::move(index));
  return {};
}

Result<void> ObjectStore::delete_index(const std::string &name) {
  if (indices_.erase(name) == 0)
    return make_error(ErrorKind::NotFound,
                      std::format("No index named '{}' on object store '{}'",
                                  name, name_));
  return {};
}

const Index *ObjectStore::index(const std::string &name) const {
  auto it = indices_.find(name);
  return it == indices_.end() ? nullptr : &it->second;
}

bool ObjectStore::has_index(const std::string &name) const {
  return indices_.contains(name);
}

std::vector<std::string> ObjectStore::index_names() const {
  std::vector<std::string> names;
  names.reserve(indices_.size());
  for (const auto &[index_name, index] : indices_)
    names.push_back(index_name);
  return names;
}

} // namespace mockidb
