#include "mockidb/cursor.hpp"
#include "mockidb/transaction.hpp"

#include <format>
#include <iterator>

namespace mockidb {

namespace {

using Position = Cursor::Position;

// ---------------------------------------------------------------------------
// Primary-key access per entry type. A record entry has exactly one primary
// key (its own key); an index entry has an ordered set of them.
// ---------------------------------------------------------------------------

using RecordEntry = ObjectStore::Records::value_type;
using IndexEntry = Index::Entries::value_type;

const Key &first_primary(const RecordEntry &e) { return e.first; }
const Key &last_primary(const RecordEntry &e) { return e.first; }
std::optional<Key> primary_after(const RecordEntry &, const Key &) {
  return std::nullopt;
}
std::optional<Key> primary_before(const RecordEntry &, const Key &) {
  return std::nullopt;
}
std::optional<Key> primary_at_or_after(const RecordEntry &e, const Key &p) {
  return e.first >= p ? std::optional<Key>(e.first) : std::nullopt;
}
std::optional<Key> primary_at_or_before(const RecordEntry &e, const Key &p) {
  return e.first <= p ? std::optional<Key>(e.first) : std::nullopt;
}

const Key &first_primary(const IndexEntry &e) { return *e.second.begin(); }
const Key &last_primary(const IndexEntry &e) { return *e.second.rbegin(); }
std::optional<Key> primary_after(const IndexEntry &e, const Key &p) {
  auto it = e.second.upper_bound(p);
  return it == e.second.end() ? std::nullopt : std::optional<Key>(*it);
}
std::optional<Key> primary_before(const IndexEntry &e, const Key &p) {
  auto it = e.second.lower_bound(p);
  return it == e.second.begin() ? std::nullopt
                                : std::optional<Key>(*std::prev(it));
}
std::optional<Key> primary_at_or_after(const IndexEntry &e, const Key &p) {
  auto it = e.second.lower_bound(p);
  return it == e.second.end() ? std::nullopt : std::optional<Key>(*it);
}
std::optional<Key> primary_at_or_before(const IndexEntry &e, const Key &p) {
  auto it = e.second.upper_bound(p);
  return it == e.second.begin() ? std::nullopt
                                : std::optional<Key>(*std::prev(it));
}

// ---------------------------------------------------------------------------
// Seeks. Forward seeks start at an iterator; backward seeks take the
// iterator one past their candidate.
// ---------------------------------------------------------------------------

template <class Map>
std::optional<Position> forward_from(const Map &map, const KeyRange &range,
                                     typename Map::const_iterator it) {
  if (it == map.end() || range.is_above(it->first))
    return std::nullopt;
  return Position{it->first, first_primary(*it)};
}

template <class Map>
std::optional<Position> backward_from(const Map &map, const KeyRange &range,
                                      typename Map::const_iterator past,
                                      bool unique) {
  if (past == map.begin())
    return std::nullopt;
  auto it = std::prev(past);
  if (range.is_below(it->first))
    return std::nullopt;
  // prevunique surfaces the lowest primary key of each distinct key.
  return Position{it->first, unique ? first_primary(*it) : last_primary(*it)};
}

template <class Map>
std::optional<Position> first_position(const Map &map, const KeyRange &range,
                                       CursorDirection dir) {
  if (!is_reverse(dir))
    return forward_from(map, range, range_begin(map, range));

  auto past = map.end();
  if (range.upper())
    past = range.upper_open() ? map.lower_bound(*range.upper())
                              : map.upper_bound(*range.upper());
  return backward_from(map, range, past, is_unique(dir));
}

template <class Map>
std::optional<Position> next_position(const Map &map, const KeyRange &range,
                                      CursorDirection dir,
                                      const Position &cur) {
  auto it = map.find(cur.key);
  if (!is_reverse(dir)) {
    if (dir == CursorDirection::Next && it != map.end()) {
      if (auto p = primary_after(*it, cur.primary_key))
        return Position{cur.key, std::move(*p)};
    }
    return forward_from(map, range, map.upper_bound(cur.key));
  }

  if (dir == CursorDirection::Prev && it != map.end()) {
    if (auto p = primary_before(*it, cur.primary_key))
      return Position{cur.key, std::move(*p)};
  }
  return backward_from(map, range, map.lower_bound(cur.key), is_unique(dir));
}

template <class Map>
std::optional<Position> seek_key(const Map &map, const KeyRange &range,
                                 CursorDirection dir, const Key &target) {
  if (!is_reverse(dir))
    return forward_from(map, range, map.lower_bound(target));
  return backward_from(map, range, map.upper_bound(target), is_unique(dir));
}

template <class Map>
std::optional<Position> seek_position(const Map &map, const KeyRange &range,
                                      CursorDirection dir, const Key &key,
                                      const Key &primary) {
  auto it = map.find(key);
  if (!is_reverse(dir)) {
    if (it != map.end() && !range.is_above(key)) {
      if (auto p = primary_at_or_after(*it, primary))
        return Position{key, std::move(*p)};
    }
    return forward_from(map, range, map.upper_bound(key));
  }

  if (it != map.end() && !range.is_below(key)) {
    if (auto p = primary_at_or_before(*it, primary))
      return Position{key, std::move(*p)};
  }
  return backward_from(map, range, map.lower_bound(key), false);
}

} // namespace

// ===========================================================================
// Construction
// ===========================================================================

Cursor::Cursor(const std::shared_ptr<Transaction> &transaction,
               std::string store, std::optional<std::string> index,
               KeyRange range, CursorDirection direction, bool key_only)
    : transaction_(transaction), scheduler_(transaction->scheduler()),
      source_(transaction->source()), store_(std::move(store)),
      index_(std::move(index)), range_(std::move(range)),
      direction_(direction), key_only_(key_only) {}

template <class Seek>
std::optional<Cursor::Position> Cursor::seek(Seek &&fn) const {
  auto transaction = transaction_.lock();
  if (!transaction)
    return std::nullopt;
  const ObjectStore *os = transaction->database().find_store(store_);
  if (!os)
    return std::nullopt;
  if (!index_)
    return fn(os->records());
  const Index *index = os->index(*index_);
  if (!index)
    return std::nullopt;
  return fn(index->entries());
}

template <class T>
std::shared_ptr<Request<T>>
Cursor::orphaned(std::string_view operation) const {
  auto scheduler = scheduler_.lock();
  auto request = std::make_shared<Request<T>>(
      scheduler ? scheduler->next_serial() : 0, std::string(operation));
  request->fail(Error{ErrorKind::InvalidState,
                      "The cursor's transaction has finished"});
  if (scheduler)
    scheduler->deliver(request, source_);
  return request;
}

std::shared_ptr<CursorRequest>
Cursor::open(const std::shared_ptr<Transaction> &transaction,
             const std::string &store, std::optional<std::string> index,
             KeyRange range, CursorDirection direction, bool key_only) {
  std::shared_ptr<Cursor> cursor;
  auto request = transaction->execute<std::shared_ptr<Cursor>>(
      key_only ? "openKeyCursor" : "openCursor", store, false,
      [&](ObjectStore &os) -> Result<std::shared_ptr<Cursor>> {
        if (index && !os.has_index(*index))
          return make_error(ErrorKind::NotFound,
                            std::format("No index named '{}' on '{}'", *index,
                                        store));
        cursor.reset(new Cursor(transaction, store, std::move(index),
                                std::move(range), direction, key_only));
        auto pos = cursor->seek([&](const auto &map) {
          return first_position(map, cursor->range_, direction);
        });
        if (!pos)
          return std::shared_ptr<Cursor>();
        cursor->adopt(std::move(pos));
        return cursor;
      });
  if (cursor)
    cursor->request_ = request;
  return request;
}

// ===========================================================================
// Positioning
// ===========================================================================

std::optional<Cursor::Position> Cursor::current() const {
  if (!key_ || !primary_key_)
    return std::nullopt;
  return Position{*key_, *primary_key_};
}

void Cursor::adopt(std::optional<Position> pos) {
  if (!pos) {
    exhausted_ = true;
    key_.reset();
    primary_key_.reset();
    value_.reset();
    return;
  }

  key_ = std::move(pos->key);
  primary_key_ = std::move(pos->primary_key);
  value_.reset();
  auto transaction = transaction_.lock();
  if (!key_only_ && transaction) {
    const ObjectStore *os = transaction->database().find_store(store_);
    if (const Value *record = os ? os->find(*primary_key_) : nullptr)
      value_ = *record;
  }
}

Result<void> Cursor::move_to(Transaction &transaction,
                             std::optional<Position> pos) {
  auto request = request_.lock();
  if (!request)
    return make_error(ErrorKind::InvalidState,
                      "The request that opened this cursor is gone");
  adopt(std::move(pos));
  request->rearm();
  request->resolve(exhausted_ ? nullptr : shared_from_this());
  return transaction.reissue(request);
}

Result<std::shared_ptr<Transaction>> Cursor::check_iterable() const {
  auto transaction = transaction_.lock();
  if (!transaction)
    return make_error(ErrorKind::InvalidState,
                      "The cursor's transaction has finished");
  if (!transaction->active())
    return std::unexpected(transaction->inactive_error());
  if (auto request = request_.lock(); request && !request->done())
    return make_error(ErrorKind::InvalidState,
                      "The cursor is already being iterated");
  return transaction;
}

Result<void> Cursor::advance(uint32_t count) {
  if (count == 0)
    return make_error(ErrorKind::Data, "advance() count must be positive");
  auto transaction = check_iterable();
  if (!transaction)
    return std::unexpected(transaction.error());
  if (exhausted_)
    return move_to(**transaction, std::nullopt);

  auto pos = current();
  for (uint32_t i = 0; i < count && pos; ++i) {
    pos = seek([&](const auto &map) {
      return next_position(map, range_, direction_, *pos);
    });
  }
  return move_to(**transaction, std::move(pos));
}

Result<void> Cursor::continue_(std::optional<Key> key) {
  auto transaction = check_iterable();
  if (!transaction)
    return std::unexpected(transaction.error());
  if (exhausted_)
    return move_to(**transaction, std::nullopt);

  if (key) {
    int c = compare_keys(*key, *key_);
    if (is_reverse(direction_) ? c >= 0 : c <= 0)
      return make_error(
          ErrorKind::Data,
          std::format("continue() key {} is not past the current key {}",
                      key->to_string(), key_->to_string()));
  }

  auto cur = current();
  auto pos = seek([&](const auto &map) {
    return key ? seek_key(map, range_, direction_, *key)
               : next_position(map, range_, direction_, *cur);
  });
  return move_to(**transaction, std::move(pos));
}

Result<void> Cursor::continue_primary_key(Key key, Key primary_key) {
  auto transaction = check_iterable();
  if (!transaction)
    return std::unexpected(transaction.error());
  if (!index_ || is_unique(direction_))
    return make_error(ErrorKind::InvalidAccess,
                      "continuePrimaryKey() needs an index cursor in next or "
                      "prev direction");
  if (exhausted_)
    return move_to(**transaction, std::nullopt);

  int c = compare_keys(key, *key_);
  int pc = compare_keys(primary_key, *primary_key_);
  bool behind = is_reverse(direction_) ? (c > 0 || (c == 0 && pc >= 0))
                                       : (c < 0 || (c == 0 && pc <= 0));
  if (behind)
    return make_error(ErrorKind::Data,
                      "continuePrimaryKey() target is not past the current "
                      "position");

  auto pos = seek([&](const auto &map) {
    return seek_position(map, range_, direction_, key, primary_key);
  });
  return move_to(**transaction, std::move(pos));
}

// ===========================================================================
// Mutation Through the Cursor
// ===========================================================================

std::shared_ptr<KeyRequest> Cursor::update(Value value) {
  auto transaction = transaction_.lock();
  if (!transaction)
    return orphaned<Key>("cursor.update");
  if (!transaction->active())
    return transaction->reject<Key>("cursor.update",
                                    transaction->inactive_error());
  if (transaction->mode() == TransactionMode::ReadOnly)
    return transaction->reject<Key>(
        "cursor.update",
        Error{ErrorKind::ReadOnly, "update() in a readonly transaction"});
  auto request = request_.lock();
  if (key_only_ || exhausted_ || (request && !request->done()))
    return transaction->reject<Key>(
        "cursor.update", Error{ErrorKind::InvalidState,
                               "The cursor is not positioned on a record"});

  std::optional<Key> explicit_key;
  if (const ObjectStore *os = transaction->database().find_store(store_)) {
    if (os->key_path().is_none()) {
      explicit_key = *primary_key_;
    } else {
      auto inline_key = extract_key(value, os->key_path());
      if (!inline_key || *inline_key != *primary_key_)
        return transaction->reject<Key>(
            "cursor.update",
            Error{ErrorKind::Data, "The value's key does not match the "
                                   "cursor's primary key"});
    }
  }

  return transaction->execute<Key>(
      "cursor.update", store_, true, [&](ObjectStore &os) {
        return os.store_record(std::move(value), std::move(explicit_key),
                               true);
      });
}

std::shared_ptr<VoidRequest> Cursor::remove() {
  auto transaction = transaction_.lock();
  if (!transaction)
    return orphaned<std::monostate>("cursor.delete");
  if (!transaction->active())
    return transaction->reject<std::monostate>(
        "cursor.delete", transaction->inactive_error());
  if (transaction->mode() == TransactionMode::ReadOnly)
    return transaction->reject<std::monostate>(
        "cursor.delete",
        Error{ErrorKind::ReadOnly, "delete() in a readonly transaction"});
  auto request = request_.lock();
  if (key_only_ || exhausted_ || (request && !request->done()))
    return transaction->reject<std::monostate>(
        "cursor.delete", Error{ErrorKind::InvalidState,
                               "The cursor is not positioned on a record"});

  return transaction->execute<std::monostate>(
      "cursor.delete", store_, true,
      [&](ObjectStore &os) -> Result<std::monostate> {
        os.remove_range(KeyRange(*primary_key_));
        return std::monostate{};
      });
}

} // namespace mockidb
