#include "mockidb/key_path.hpp"

#include <algorithm>
#include <string_view>

namespace mockidb {

namespace {

bool is_identifier_start(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
         c == '$' || c >= 0x80;
}

bool is_identifier_part(unsigned char c) {
  return is_identifier_start(c) || (c >= '0' && c <= '9');
}

bool is_identifier(std::string_view s) {
  if (s.empty() || !is_identifier_start(static_cast<unsigned char>(s[0])))
    return false;
  return std::all_of(s.begin() + 1, s.end(), [](char c) {
    return is_identifier_part(static_cast<unsigned char>(c));
  });
}

bool is_valid_string_path(std::string_view path) {
  if (path.empty())
    return true;
  size_t start = 0;
  while (true) {
    size_t dot = path.find('.', start);
    if (!is_identifier(path.substr(start, dot - start)))
      return false;
    if (dot == std::string_view::npos)
      return true;
    start = dot + 1;
  }
}

std::vector<std::string_view> split_path(std::string_view path) {
  std::vector<std::string_view> steps;
  if (path.empty())
    return steps;
  size_t start = 0;
  while (true) {
    size_t dot = path.find('.', start);
    steps.push_back(path.substr(start, dot - start));
    if (dot == std::string_view::npos)
      break;
    start = dot + 1;
  }
  return steps;
}

} // namespace

KeyPath KeyPath::compound(std::vector<std::string> paths) {
  KeyPath kp;
  kp.path_ = std::move(paths);
  return kp;
}

bool KeyPath::is_valid() const {
  if (is_none())
    return true;
  if (is_string())
    return is_valid_string_path(as_string());
  const auto &paths = as_compound();
  if (paths.empty())
    return false;
  return std::all_of(paths.begin(), paths.end(), [](const std::string &p) {
    return is_valid_string_path(p);
  });
}

std::string KeyPath::to_string() const {
  if (is_none())
    return "null";
  if (is_string())
    return as_string();
  std::string out = "[";
  const auto &paths = as_compound();
  for (size_t i = 0; i < paths.size(); ++i) {
    if (i > 0)
      out += ", ";
    out += paths[i];
  }
  out += "]";
  return out;
}

// ===========================================================================
// Evaluation
// ===========================================================================

std::optional<Value> evaluate_key_path(const Value &value,
                                       const std::string &path) {
  const Value *current = &value;
  Value length_holder;

  for (std::string_view step : split_path(path)) {
    if (step == "length" && current->is_string()) {
      length_holder = Value(current->as_string().size());
      current = &length_holder;
      continue;
    }
    if (step == "length" && current->is_array()) {
      length_holder = Value(current->as_array().size());
      current = &length_holder;
      continue;
    }
    const Value *next = current->find(step);
    if (!next || next->is_undefined())
      return std::nullopt;
    current = next;
  }
  return *current;
}

std::optional<Value> evaluate_key_path(const Value &value,
                                       const KeyPath &path) {
  if (path.is_none())
    return std::nullopt;
  if (path.is_string())
    return evaluate_key_path(value, path.as_string());

  Value::Array parts;
  for (const auto &p : path.as_compound()) {
    auto part = evaluate_key_path(value, p);
    if (!part)
      return std::nullopt;
    parts.push_back(std::move(*part));
  }
  return Value(std::move(parts));
}

std::optional<Key> extract_key(const Value &value, const KeyPath &path) {
  auto evaluated = evaluate_key_path(value, path);
  if (!evaluated)
    return std::nullopt;
  return Key::from_value(*evaluated);
}

std::vector<Key> extract_index_keys(const Value &value, const KeyPath &path,
                                    bool multi_entry) {
  std::vector<Key> keys;
  auto evaluated = evaluate_key_path(value, path);
  if (!evaluated)
    return keys;

  if (multi_entry && evaluated->is_array()) {
    for (const auto &element : evaluated->as_array()) {
      auto key = Key::from_value(element);
      if (!key)
        continue;
      if (std::find(keys.begin(), keys.end(), *key) == keys.end())
        keys.push_back(std::move(*key));
    }
    return keys;
  }

  if (auto key = Key::from_value(*evaluated))
    keys.push_back(std::move(*key));
  return keys;
}

// ===========================================================================
// Injection
// ===========================================================================

bool can_inject_key(const Value &value, const std::string &path) {
  auto steps = split_path(path);
  if (steps.empty())
    return false;

  const Value *current = &value;
  for (size_t i = 0; i < steps.size(); ++i) {
    if (current->is_undefined())
      return true; // promoted to an object on injection
    if (!current->is_object())
      return false;
    const Value *next = current->find(steps[i]);
    if (!next)
      return true;
    if (i + 1 == steps.size())
      return next->is_undefined();
    current = next;
  }
  return true;
}

void inject_key(Value &value, const std::string &path, const Key &key) {
  auto steps = split_path(path);
  Value *current = &value;
  for (size_t i = 0; i + 1 < steps.size(); ++i)
    current = &(*current)[steps[i]];
  (*current)[steps.back()] = key.to_value();
}

} // namespace mockidb
