#pragma once

/**
 * @file key_path.hpp
 * @brief Key path representation, evaluation and key injection.
 *
 * A key path is one of:
 *   - none: keys are supplied out of band,
 *   - a string: "" (the value itself) or dot-separated identifiers,
 *   - a sequence of strings: a compound path evaluating to an array key.
 *
 * Evaluation is a pure traversal over Value. The "length" step resolves on
 * strings and arrays, as on the emulated platform.
 */

#include "mockidb/key.hpp"
#include "mockidb/value.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mockidb {

class KeyPath {
public:
  KeyPath() = default;
  KeyPath(std::string path) : path_(std::move(path)) {}
  KeyPath(const char *path) : path_(std::string(path)) {}

  /// Compound path. Not a braced constructor: {"a", "b"} would bind to the
  /// string iterator-pair constructor.
  static KeyPath compound(std::vector<std::string> paths);

  bool is_none() const noexcept {
    return std::holds_alternative<std::monostate>(path_);
  }
  bool is_string() const noexcept {
    return std::holds_alternative<std::string>(path_);
  }
  bool is_compound() const noexcept {
    return std::holds_alternative<std::vector<std::string>>(path_);
  }

  const std::string &as_string() const { return std::get<std::string>(path_); }
  const std::vector<std::string> &as_compound() const {
    return std::get<std::vector<std::string>>(path_);
  }

  /// Identifiers separated by dots, or the empty string. A compound path
  /// must be non-empty and every element must be a valid string path.
  bool is_valid() const;

  /// "id", "address.city", "[a, b]" or "null".
  std::string to_string() const;

  bool operator==(const KeyPath &) const = default;

private:
  std::variant<std::monostate, std::string, std::vector<std::string>> path_;
};

/// Walk a string path through a value. nullopt if any step does not resolve.
std::optional<Value> evaluate_key_path(const Value &value,
                                       const std::string &path);

/// Evaluate a (string or compound) key path. Compound paths yield an array.
std::optional<Value> evaluate_key_path(const Value &value, const KeyPath &path);

/// Evaluate and convert to a key; nullopt if missing or not a valid key.
std::optional<Key> extract_key(const Value &value, const KeyPath &path);

/**
 * @brief Index keys a record contributes under an index key path.
 *
 * Without multi_entry the evaluated value must itself be a valid key (zero
 * or one result). With multi_entry and an array value, every valid element
 * is one key; invalid elements are skipped and duplicates collapse.
 */
std::vector<Key> extract_index_keys(const Value &value, const KeyPath &path,
                                    bool multi_entry);

/// True if a generated key could be written at this string path: every
/// existing step is an object and the final member is absent or undefined.
bool can_inject_key(const Value &value, const std::string &path);

/// Write key at the string path, creating intermediate objects.
/// Precondition: can_inject_key(value, path).
void inject_key(Value &value, const std::string &path, const Key &key);

} // namespace mockidb
