#pragma once

/**
 * @file index.hpp
 * @brief Secondary index: derived ordered mapping index key -> primary keys.
 *
 * The index holds no values. ObjectStore keeps it consistent by erasing a
 * record's old index keys and inserting its new ones within the same write.
 */

#include "mockidb/key.hpp"
#include "mockidb/key_path.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mockidb {

struct IndexSchema {
  std::string name;
  KeyPath key_path;
  bool unique = false;
  bool multi_entry = false;
};

class Index {
public:
  using Entries = std::map<Key, std::set<Key>>;

  explicit Index(IndexSchema schema) : schema_(std::move(schema)) {}

  const IndexSchema &schema() const noexcept { return schema_; }
  const std::string &name() const noexcept { return schema_.name; }

  /// Index keys contributed by a record value.
  std::vector<Key> derive_keys(const Value &value) const;

  /**
   * @brief Unique-constraint check for a prospective write.
   * @param keys    Index keys the record would contribute
   * @param primary Primary key of the record being written
   * @return The first key already mapped to a different primary key, or
   *         nullopt. Always nullopt for non-unique indices.
   */
  std::optional<Key> find_conflict(const std::vector<Key> &keys,
                                   const Key &primary) const;

  void insert(const std::vector<Key> &keys, const Key &primary);
  void erase(const std::vector<Key> &keys, const Key &primary);
  void clear() noexcept { entries_.clear(); }

  const Entries &entries() const noexcept { return entries_; }

  /// Number of (index key, primary key) pairs.
  size_t size() const noexcept;

private:
  IndexSchema schema_;
  Entries entries_;
};

/// First entry of an ordered key map that the range can include.
template <class Map>
typename Map::const_iterator range_begin(const Map &map,
                                         const KeyRange &range) {
  if (!range.lower())
    return map.begin();
  return range.lower_open() ? map.upper_bound(*range.lower())
                            : map.lower_bound(*range.lower());
}

/// Visit entries within range in ascending order until fn returns false.
template <class Map, class Fn>
void scan_range(const Map &map, const KeyRange &range, Fn &&fn) {
  for (auto it = range_begin(map, range);
       it != map.end() && !range.is_above(it->first); ++it) {
    if (!fn(it->first, it->second))
      return;
  }
}

} // namespace mockidb
