#include "mockidb/store_handle.hpp"
#include "mockidb/cursor.hpp"

#include <format>

namespace mockidb {

namespace {

KeyRange or_unbounded(std::optional<KeyRange> range) {
  return range ? std::move(*range) : KeyRange::unbounded();
}

bool capped(size_t size, uint32_t count) { return count > 0 && size >= count; }

Result<const Index *> find_index(const ObjectStore &os,
                                 const std::string &name) {
  if (const Index *index = os.index(name))
    return index;
  return make_error(ErrorKind::NotFound,
                    std::format("No index named '{}' on object store '{}'",
                                name, os.name()));
}

} // namespace

// ===========================================================================
// StoreHandle: introspection
// ===========================================================================

KeyPath StoreHandle::key_path() const {
  const ObjectStore *os = transaction_->database().find_store(name_);
  return os ? os->key_path() : KeyPath();
}

bool StoreHandle::auto_increment() const {
  const ObjectStore *os = transaction_->database().find_store(name_);
  return os && os->auto_increment();
}

std::vector<std::string> StoreHandle::index_names() const {
  const ObjectStore *os = transaction_->database().find_store(name_);
  return os ? os->index_names() : std::vector<std::string>{};
}

// ===========================================================================
// StoreHandle: writes
// ===========================================================================

std::shared_ptr<KeyRequest> StoreHandle::add(Value value,
                                             std::optional<Key> key) {
  return transaction_->execute<Key>("add", name_, true, [&](ObjectStore &os) {
    return os.store_record(std::move(value), std::move(key), false);
  });
}

std::shared_ptr<KeyRequest> StoreHandle::put(Value value,
                                             std::optional<Key> key) {
  return transaction_->execute<Key>("put", name_, true, [&](ObjectStore &os) {
    return os.store_record(std::move(value), std::move(key), true);
  });
}

std::shared_ptr<VoidRequest> StoreHandle::remove(KeyRange range) {
  return transaction_->execute<std::monostate>(
      "delete", name_, true, [&](ObjectStore &os) -> Result<std::monostate> {
        os.remove_range(range);
        return std::monostate{};
      });
}

std::shared_ptr<VoidRequest> StoreHandle::clear() {
  return transaction_->execute<std::monostate>(
      "clear", name_, true, [](ObjectStore &os) -> Result<std::monostate> {
        os.clear();
        return std::monostate{};
      });
}

// ===========================================================================
// StoreHandle: reads
// ===========================================================================

std::shared_ptr<ValueRequest> StoreHandle::get(KeyRange range) {
  return transaction_->execute<std::optional<Value>>(
      "get", name_, false,
      [&](ObjectStore &os) -> Result<std::optional<Value>> {
        std::optional<Value> found;
        scan_range(os.records(), range, [&](const Key &, const Value &v) {
          found = v;
          return false;
        });
        return found;
      });
}

std::shared_ptr<OptionalKeyRequest> StoreHandle::get_key(KeyRange range) {
  return transaction_->execute<std::optional<Key>>(
      "getKey", name_, false,
      [&](ObjectStore &os) -> Result<std::optional<Key>> {
        std::optional<Key> found;
        scan_range(os.records(), range, [&](const Key &k, const Value &) {
          found = k;
          return false;
        });
        return found;
      });
}

std::shared_ptr<ValuesRequest>
StoreHandle::get_all(std::optional<KeyRange> range, uint32_t count) {
  KeyRange r = or_unbounded(std::move(range));
  return transaction_->execute<std::vector<Value>>(
      "getAll", name_, false,
      [&](ObjectStore &os) -> Result<std::vector<Value>> {
        std::vector<Value> values;
        scan_range(os.records(), r, [&](const Key &, const Value &v) {
          values.push_back(v);
          return !capped(values.size(), count);
        });
        return values;
      });
}

std::shared_ptr<KeysRequest>
StoreHandle::get_all_keys(std::optional<KeyRange> range, uint32_t count) {
  KeyRange r = or_unbounded(std::move(range));
  return transaction_->execute<std::vector<Key>>(
      "getAllKeys", name_, false,
      [&](ObjectStore &os) -> Result<std::vector<Key>> {
        std::vector<Key> keys;
        scan_range(os.records(), r, [&](const Key &k, const Value &) {
          keys.push_back(k);
          return !capped(keys.size(), count);
        });
        return keys;
      });
}

std::shared_ptr<CountRequest>
StoreHandle::count(std::optional<KeyRange> range) {
  KeyRange r = or_unbounded(std::move(range));
  return transaction_->execute<uint64_t>(
      "count", name_, false, [&](ObjectStore &os) -> Result<uint64_t> {
        uint64_t n = 0;
        scan_range(os.records(), r, [&](const Key &, const Value &) {
          ++n;
          return true;
        });
        return n;
      });
}

std::shared_ptr<CursorRequest>
StoreHandle::open_cursor(std::optional<KeyRange> range,
                         CursorDirection direction) {
  return Cursor::open(transaction_, name_, std::nullopt,
                      or_unbounded(std::move(range)), direction, false);
}

std::shared_ptr<CursorRequest>
StoreHandle::open_key_cursor(std::optional<KeyRange> range,
                             CursorDirection direction) {
  return Cursor::open(transaction_, name_, std::nullopt,
                      or_unbounded(std::move(range)), direction, true);
}

// ===========================================================================
// StoreHandle: indices
// ===========================================================================

Result<IndexHandle> StoreHandle::index(const std::string &name) const {
  if (transaction_->finished())
    return std::unexpected(transaction_->inactive_error());
  const ObjectStore *os = transaction_->database().find_store(name_);
  if (!os)
    return make_error(ErrorKind::InvalidState,
                      std::format("Object store '{}' has been deleted", name_));
  if (!os->has_index(name))
    return make_error(ErrorKind::NotFound,
                      std::format("No index named '{}' on object store '{}'",
                                  name, name_));
  return IndexHandle(transaction_, name_, name);
}

Result<IndexHandle> StoreHandle::create_index(const std::string &name,
                                              KeyPath key_path,
                                              IndexOptions options) {
  IndexSchema schema{name, std::move(key_path), options.unique,
                     options.multi_entry};
  if (auto created = transaction_->create_index(name_, std::move(schema));
      !created)
    return std::unexpected(created.error());
  return IndexHandle(transaction_, name_, name);
}

Result<void> StoreHandle::delete_index(const std::string &name) {
  return transaction_->delete_index(name_, name);
}

// ===========================================================================
// IndexHandle
// ===========================================================================

const IndexSchema *IndexHandle::schema() const {
  const ObjectStore *os = transaction_->database().find_store(store_);
  const Index *index = os ? os->index(name_) : nullptr;
  return index ? &index->schema() : nullptr;
}

KeyPath IndexHandle::key_path() const {
  const IndexSchema *s = schema();
  return s ? s->key_path : KeyPath();
}

bool IndexHandle::unique() const {
  const IndexSchema *s = schema();
  return s && s->unique;
}

bool IndexHandle::multi_entry() const {
  const IndexSchema *s = schema();
  return s && s->multi_entry;
}

std::shared_ptr<ValueRequest> IndexHandle::get(KeyRange range) {
  return transaction_->execute<std::optional<Value>>(
      "index.get", store_, false,
      [&](ObjectStore &os) -> Result<std::optional<Value>> {
        auto index = find_index(os, name_);
        if (!index)
          return std::unexpected(index.error());
        std::optional<Value> found;
        scan_range((*index)->entries(), range,
                   [&](const Key &, const std::set<Key> &primaries) {
                     if (const Value *v = os.find(*primaries.begin()))
                       found = *v;
                     return false;
                   });
        return found;
      });
}

std::shared_ptr<OptionalKeyRequest> IndexHandle::get_key(KeyRange range) {
  return transaction_->execute<std::optional<Key>>(
      "index.getKey", store_, false,
      [&](ObjectStore &os) -> Result<std::optional<Key>> {
        auto index = find_index(os, name_);
        if (!index)
          return std::unexpected(index.error());
        std::optional<Key> found;
        scan_range((*index)->entries(), range,
                   [&](const Key &, const std::set<Key> &primaries) {
                     found = *primaries.begin();
                     return false;
                   });
        return found;
      });
}

std::shared_ptr<ValuesRequest>
IndexHandle::get_all(std::optional<KeyRange> range, uint32_t count) {
  KeyRange r = or_unbounded(std::move(range));
  return transaction_->execute<std::vector<Value>>(
      "index.getAll", store_, false,
      [&](ObjectStore &os) -> Result<std::vector<Value>> {
        auto index = find_index(os, name_);
        if (!index)
          return std::unexpected(index.error());
        std::vector<Value> values;
        scan_range((*index)->entries(), r,
                   [&](const Key &, const std::set<Key> &primaries) {
                     for (const auto &primary : primaries) {
                       if (capped(values.size(), count))
                         return false;
                       if (const Value *v = os.find(primary))
                         values.push_back(*v);
                     }
                     return !capped(values.size(), count);
                   });
        return values;
      });
}

std::shared_ptr<KeysRequest>
IndexHandle::get_all_keys(std::optional<KeyRange> range, uint32_t count) {
  KeyRange r = or_unbounded(std::move(range));
  return transaction_->execute<std::vector<Key>>(
      "index.getAllKeys", store_, false,
      [&](ObjectStore &os) -> Result<std::vector<Key>> {
        auto index = find_index(os, name_);
        if (!index)
          return std::unexpected(index.error());
        std::vector<Key> keys;
        scan_range((*index)->entries(), r,
                   [&](const Key &, const std::set<Key> &primaries) {
                     for (const auto &primary : primaries) {
                       if (capped(keys.size(), count))
                         return false;
                       keys.push_back(primary);
                     }
                     return !capped(keys.size(), count);
                   });
        return keys;
      });
}

std::shared_ptr<CountRequest>
IndexHandle::count(std::optional<KeyRange> range) {
  KeyRange r = or_unbounded(std::move(range));
  return transaction_->execute<uint64_t>(
      "index.count", store_, false, [&](ObjectStore &os) -> Result<uint64_t> {
        auto index = find_index(os, name_);
        if (!index)
          return std::unexpected(index.error());
        uint64_t n = 0;
        scan_range((*index)->entries(), r,
                   [&](const Key &, const std::set<Key> &primaries) {
                     n += primaries.size();
                     return true;
                   });
        return n;
      });
}

std::shared_ptr<CursorRequest>
IndexHandle::open_cursor(std::optional<KeyRange> range,
                         CursorDirection direction) {
  return Cursor::open(transaction_, store_, name_,
                      or_unbounded(std::move(range)), direction, false);
}

std::shared_ptr<CursorRequest>
IndexHandle::open_key_cursor(std::optional<KeyRange> range,
                             CursorDirection direction) {
  return Cursor::open(transaction_, store_, name_,
                      or_unbounded(std::move(range)), direction, true);
}

} // namespace mockidb
