#include "mockidb/index.hpp"

namespace mockidb {

std::vector<Key> Index::derive_keys(const Value &value) const {
  return extract_index_keys(value, schema_.key_path, schema_.multi_entry);
}

std::optional<Key> Index::find_conflict(const std::vector<Key> &keys,
                                        const Key &primary) const {
  if (!schema_.unique)
    return std::nullopt;
  for (const auto &key : keys) {
    auto it = entries_.find(key);
    if (it == entries_.end())
      continue;
    for (const auto &existing : it->second) {
      if (existing != primary)
        return key;
    }
  }
  return std::nullopt;
}

void Index::insert(const std::vector<Key> &keys, const Key &primary) {
  for (const auto &key : keys)
    entries_[key].insert(primary);
}

void Index::erase(const std::vector<Key> &keys, const Key &primary) {
  for (const auto &key : keys) {
    auto it = entries_.find(key);
    if (it == entries_.end())
      continue;
    it->second.erase(primary);
    if (it->second.empty())
      entries_.erase(it);
  }
}

size_t Index::size() const noexcept {
  size_t total = 0;
  for (const auto &[key, primaries] : entries_)
    total += primaries.size();
  return total;
}

} // namespace mockidb
