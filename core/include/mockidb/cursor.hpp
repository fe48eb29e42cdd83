#pragma once

/**
 * @file cursor.hpp
 * @brief Ordered traversal over a store's records or an index's entries.
 *
 * A position is (key, primary key). For store cursors both are the record
 * key; for index cursors key is the index key and entries with equal keys
 * are visited in primary-key order. Positions move strictly monotonically
 * in the cursor's direction; the unique directions visit each distinct key
 * once, at its lowest primary key.
 *
 * The cursor is delivered through the request that opened it. Each
 * continue/advance moves the position immediately and re-arms that request,
 * so its success handlers fire again with the cursor, or with nullptr once
 * the range is exhausted.
 *
 * The cursor refers back to its transaction weakly: the transaction's
 * pending requests own the cursor while an iteration is queued. Once the
 * transaction is gone every iteration fails with InvalidState.
 */

#include "mockidb/error.hpp"
#include "mockidb/key.hpp"
#include "mockidb/request.hpp"
#include "mockidb/schema.hpp"
#include "mockidb/value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mockidb {

class Scheduler;
class Transaction;

class Cursor : public std::enable_shared_from_this<Cursor> {
public:
  /// Position of a cursor: index/record key plus primary key.
  struct Position {
    Key key;
    Key primary_key;
  };

  /**
   * @brief Open a cursor and queue the request that delivers it.
   * @param index    Index name, or nullopt for a store cursor
   * @param key_only Skip loading record values (openKeyCursor)
   */
  static std::shared_ptr<CursorRequest>
  open(const std::shared_ptr<Transaction> &transaction,
       const std::string &store, std::optional<std::string> index,
       KeyRange range, CursorDirection direction, bool key_only);

  Cursor(const Cursor &) = delete;
  Cursor &operator=(const Cursor &) = delete;

  CursorDirection direction() const noexcept { return direction_; }
  const std::string &store_name() const noexcept { return store_; }
  const std::optional<std::string> &index_name() const noexcept {
    return index_;
  }
  bool key_only() const noexcept { return key_only_; }

  /// nullopt once exhausted.
  const std::optional<Key> &key() const noexcept { return key_; }
  const std::optional<Key> &primary_key() const noexcept {
    return primary_key_;
  }
  /// nullopt once exhausted, and always for key cursors.
  const std::optional<Value> &value() const noexcept { return value_; }

  bool exhausted() const noexcept { return exhausted_; }

  /**
   * @brief Skip count positions.
   *
   * DataError for count 0; InvalidState if the transaction is inactive or
   * a previous iteration has not been delivered yet.
   */
  Result<void> advance(uint32_t count);

  /**
   * @brief Move to the next position, or to the first one at or past key.
   *
   * A given key must lie strictly past the current key in the cursor's
   * direction (DataError otherwise).
   */
  Result<void> continue_(std::optional<Key> key = std::nullopt);

  /// Index cursors in next/prev direction only (InvalidAccess otherwise).
  Result<void> continue_primary_key(Key key, Key primary_key);

  /// Overwrite the record under the cursor. Position is unchanged.
  std::shared_ptr<KeyRequest> update(Value value);

  /// Delete the record under the cursor. Position is unchanged.
  std::shared_ptr<VoidRequest> remove();

private:
  Cursor(const std::shared_ptr<Transaction> &transaction, std::string store,
         std::optional<std::string> index, KeyRange range,
         CursorDirection direction, bool key_only);

  /// Common preconditions of advance/continue. Yields the live transaction.
  Result<std::shared_ptr<Transaction>> check_iterable() const;

  /// Take pos as the current position, or become exhausted.
  void adopt(std::optional<Position> pos);

  /// Re-arm the open request, then adopt(). Nothing moves if the request
  /// is gone.
  Result<void> move_to(Transaction &transaction,
                       std::optional<Position> pos);

  /// Failed request for a mutation attempted after the transaction is gone.
  template <class T>
  std::shared_ptr<Request<T>> orphaned(std::string_view operation) const;

  std::optional<Position> current() const;

  /// Apply a seek over the store records or the index entries.
  template <class Seek> std::optional<Position> seek(Seek &&fn) const;

  std::weak_ptr<Transaction> transaction_;
  std::weak_ptr<Scheduler> scheduler_;
  std::string source_;
  std::string store_;
  std::optional<std::string> index_;
  KeyRange range_;
  CursorDirection direction_;
  bool key_only_;

  std::optional<Key> key_;
  std::optional<Key> primary_key_;
  std::optional<Value> value_;
  bool exhausted_ = false;

  std::weak_ptr<CursorRequest> request_;
};

} // namespace mockidb
