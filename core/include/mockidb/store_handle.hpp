#pragma once

/**
 * @file store_handle.hpp
 * @brief Transaction-scoped handles to an object store and its indices.
 *
 * Handles are cheap values (transaction + names). Every operation returns a
 * request immediately; failures are reported through the request's error.
 */

#include "mockidb/error.hpp"
#include "mockidb/key.hpp"
#include "mockidb/request.hpp"
#include "mockidb/schema.hpp"
#include "mockidb/transaction.hpp"
#include "mockidb/value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mockidb {

class IndexHandle;

class StoreHandle {
public:
  StoreHandle(std::shared_ptr<Transaction> transaction, std::string name)
      : transaction_(std::move(transaction)), name_(std::move(name)) {}

  const std::string &name() const noexcept { return name_; }
  KeyPath key_path() const;
  bool auto_increment() const;
  /// Sorted.
  std::vector<std::string> index_names() const;
  const std::shared_ptr<Transaction> &transaction() const noexcept {
    return transaction_;
  }

  /// Insert; ConstraintError if the resolved key exists.
  std::shared_ptr<KeyRequest> add(Value value,
                                  std::optional<Key> key = std::nullopt);
  /// Insert or overwrite.
  std::shared_ptr<KeyRequest> put(Value value,
                                  std::optional<Key> key = std::nullopt);

  /// First record within range, or nullopt.
  std::shared_ptr<ValueRequest> get(KeyRange range);
  /// First primary key within range, or nullopt.
  std::shared_ptr<OptionalKeyRequest> get_key(KeyRange range);

  /// @param count Result cap, 0 = unlimited
  std::shared_ptr<ValuesRequest>
  get_all(std::optional<KeyRange> range = std::nullopt, uint32_t count = 0);
  std::shared_ptr<KeysRequest>
  get_all_keys(std::optional<KeyRange> range = std::nullopt,
               uint32_t count = 0);
  std::shared_ptr<CountRequest>
  count(std::optional<KeyRange> range = std::nullopt);

  /// Delete every record within range.
  std::shared_ptr<VoidRequest> remove(KeyRange range);
  std::shared_ptr<VoidRequest> clear();

  std::shared_ptr<CursorRequest>
  open_cursor(std::optional<KeyRange> range = std::nullopt,
              CursorDirection direction = CursorDirection::Next);
  std::shared_ptr<CursorRequest>
  open_key_cursor(std::optional<KeyRange> range = std::nullopt,
                  CursorDirection direction = CursorDirection::Next);

  /// InvalidState if the transaction finished; NotFound for an unknown index.
  Result<IndexHandle> index(const std::string &name) const;

  /// VersionChange only; failures abort the upgrade.
  Result<IndexHandle> create_index(const std::string &name, KeyPath key_path,
                                   IndexOptions options = {});
  Result<void> delete_index(const std::string &name);

private:
  std::shared_ptr<Transaction> transaction_;
  std::string name_;
};

class IndexHandle {
public:
  IndexHandle(std::shared_ptr<Transaction> transaction, std::string store,
              std::string name)
      : transaction_(std::move(transaction)), store_(std::move(store)),
        name_(std::move(name)) {}

  const std::string &name() const noexcept { return name_; }
  const std::string &store_name() const noexcept { return store_; }
  KeyPath key_path() const;
  bool unique() const;
  bool multi_entry() const;

  /// Record of the first primary key under the first index key in range.
  std::shared_ptr<ValueRequest> get(KeyRange range);
  std::shared_ptr<OptionalKeyRequest> get_key(KeyRange range);
  std::shared_ptr<ValuesRequest>
  get_all(std::optional<KeyRange> range = std::nullopt, uint32_t count = 0);
  /// Primary keys, in index order.
  std::shared_ptr<KeysRequest>
  get_all_keys(std::optional<KeyRange> range = std::nullopt,
               uint32_t count = 0);
  std::shared_ptr<CountRequest>
  count(std::optional<KeyRange> range = std::nullopt);

  std::shared_ptr<CursorRequest>
  open_cursor(std::optional<KeyRange> range = std::nullopt,
              CursorDirection direction = CursorDirection::Next);
  std::shared_ptr<CursorRequest>
  open_key_cursor(std::optional<KeyRange> range = std::nullopt,
                  CursorDirection direction = CursorDirection::Next);

private:
  const IndexSchema *schema() const;

  std::shared_ptr<Transaction> transaction_;
  std::string store_;
  std::string name_;
};

} // namespace mockidb
