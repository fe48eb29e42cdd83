#pragma once

/**
 * @file transaction.hpp
 * @brief Scope, mode and lifecycle of a group of requests.
 *
 * Lifecycle:
 *
 *   Active ──(no pending requests after a turn / commit())──> Committing
 *   Committing ──(all requests delivered)──> Committed   [complete]
 *   Active | Committing ──(abort() / unacknowledged failure)──> Aborted [abort]
 *
 * Every request is applied on the call and queued for delivery. The
 * transaction tracks undelivered requests in pending_; once the last one
 * has been delivered and nothing new was issued from its handlers, the
 * commit is posted, so complete always fires after every request.
 *
 * Abort restores state: readonly/readwrite transactions snapshot each store
 * on its first write; a versionchange transaction restores the whole
 * catalog snapshot taken when the upgrade started.
 */

#include "mockidb/database.hpp"
#include "mockidb/error.hpp"
#include "mockidb/request.hpp"
#include "mockidb/scheduler.hpp"
#include "mockidb/schema.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mockidb {

class Connection;
class StoreHandle;

class Transaction : public std::enable_shared_from_this<Transaction> {
public:
  using Handler = std::function<void(Transaction &)>;
  using ErrorHandler = std::function<void(Transaction &, RequestBase &)>;

  /**
   * @brief Create a transaction and schedule its first lifecycle check.
   * @param scope Store names; ignored for VersionChange (whole database)
   */
  static std::shared_ptr<Transaction>
  create(std::shared_ptr<Database> database,
         std::shared_ptr<Scheduler> scheduler, std::vector<std::string> scope,
         TransactionMode mode, std::weak_ptr<Connection> connection = {});

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  uint64_t id() const noexcept { return id_; }
  TransactionMode mode() const noexcept { return mode_; }
  TransactionState state() const noexcept { return state_; }
  bool active() const noexcept { return state_ == TransactionState::Active; }
  bool finished() const noexcept {
    return state_ == TransactionState::Committed ||
           state_ == TransactionState::Aborted;
  }

  /// Stores in scope, sorted. For VersionChange: every current store.
  std::vector<std::string> object_store_names() const;

  /// The failure that aborted the transaction, if any.
  const std::optional<Error> &error() const noexcept { return error_; }

  std::shared_ptr<Connection> connection() const { return connection_.lock(); }

  /// Dispatch trace source of this transaction, "txn:<id>".
  const std::string &source() const noexcept { return source_; }

  /**
   * @brief Handle to an in-scope store.
   *
   * InvalidState if the transaction has finished or the store is outside
   * the declared scope; NotFound if it does not exist (any more).
   */
  Result<StoreHandle> store(const std::string &name);

  // -----------------------------------------------------------------------
  // Catalog (VersionChange only; failures abort the upgrade)
  // -----------------------------------------------------------------------

  Result<StoreHandle> create_object_store(const std::string &name,
                                          StoreOptions options = {});
  Result<void> delete_object_store(const std::string &name);
  Result<void> create_index(const std::string &store, IndexSchema schema);
  Result<void> delete_index(const std::string &store, const std::string &name);

  // -----------------------------------------------------------------------
  // Lifecycle
  // -----------------------------------------------------------------------

  /// InvalidState unless Active.
  Result<void> abort();

  /// Stop accepting requests; commit once outstanding ones are delivered.
  /// InvalidState unless Active.
  Result<void> commit();

  Transaction &on_complete(Handler handler);
  Transaction &on_abort(Handler handler);
  /// Fires for every failed request, after the request's own handlers.
  Transaction &on_error(ErrorHandler handler);

  // -----------------------------------------------------------------------
  // Engine side
  // -----------------------------------------------------------------------

  Database &database() noexcept { return *database_; }
  const Database &database() const noexcept { return *database_; }
  const std::shared_ptr<Scheduler> &scheduler() const noexcept {
    return scheduler_;
  }

  /**
   * @brief Apply an operation on a store and queue its request.
   *
   * fn(ObjectStore&) -> Result<T> runs immediately; its outcome becomes the
   * request's. Inactive transactions get an InvalidState request that is
   * delivered without touching this transaction.
   */
  template <class T, class Fn>
  std::shared_ptr<Request<T>> execute(std::string_view operation,
                                      const std::string &store_name,
                                      bool write, Fn &&fn);

  /// Queue a request that fails with error (InvalidState if inactive).
  template <class T>
  std::shared_ptr<Request<T>> reject(std::string_view operation, Error error);

  /// Queue an already settled request again (cursor iteration).
  Result<void> reissue(std::shared_ptr<RequestBase> request);

  /// Abort caused by a failure; no-op once finished.
  void abort_with(Error cause);

  /// Whole-database snapshot restored if a versionchange transaction aborts.
  void set_upgrade_snapshot(Database::Snapshot snapshot);

  /// Called once with true on commit or false on abort.
  void set_finish_observer(std::function<void(bool)> observer);

  Error inactive_error() const;

private:
  Transaction(std::shared_ptr<Database> database,
              std::shared_ptr<Scheduler> scheduler,
              std::vector<std::string> scope, TransactionMode mode,
              std::weak_ptr<Connection> connection);

  bool in_scope(const std::string &name) const;
  std::optional<Error> check_request(const std::string &store_name,
                                     bool write) const;
  void snapshot_store(const std::string &name);
  Result<void> fail_upgrade(Error error);

  void issue(std::shared_ptr<RequestBase> request);
  void deliver(const std::shared_ptr<RequestBase> &request);
  void maybe_commit();
  void finish_commit();
  void finish_abort();
  void release_handlers();

  uint64_t id_;
  std::string source_;
  TransactionMode mode_;
  TransactionState state_ = TransactionState::Active;
  std::vector<std::string> scope_;
  std::shared_ptr<Database> database_;
  std::shared_ptr<Scheduler> scheduler_;
  std::weak_ptr<Connection> connection_;

  std::vector<std::shared_ptr<RequestBase>> pending_;
  bool commit_posted_ = false;
  std::optional<Error> error_;

  std::map<std::string, ObjectStore> store_snapshots_;
  std::optional<Database::Snapshot> upgrade_snapshot_;

  std::vector<Handler> complete_handlers_;
  std::vector<Handler> abort_handlers_;
  std::vector<ErrorHandler> error_handlers_;
  std::function<void(bool)> finish_observer_;
};

// ===========================================================================
// Template Implementation
// ===========================================================================

template <class T, class Fn>
std::shared_ptr<Request<T>>
Transaction::execute(std::string_view operation, const std::string &store_name,
                     bool write, Fn &&fn) {
  auto request = std::make_shared<Request<T>>(
      scheduler_->next_serial(), std::string(operation), weak_from_this());

  if (!active()) {
    request->fail(inactive_error());
    scheduler_->deliver(request, source_);
    return request;
  }

  if (auto failure = check_request(store_name, write)) {
    request->fail(std::move(*failure));
    issue(request);
    return request;
  }

  if (write)
    snapshot_store(store_name);
  request->settle(fn(*database_->find_store(store_name)));
  issue(request);
  return request;
}

template <class T>
std::shared_ptr<Request<T>> Transaction::reject(std::string_view operation,
                                                Error error) {
  auto request = std::make_shared<Request<T>>(
      scheduler_->next_serial(), std::string(operation), weak_from_this());
  if (!active()) {
    request->fail(inactive_error());
    scheduler_->deliver(request, source_);
    return request;
  }
  request->fail(std::move(error));
  issue(request);
  return request;
}

} // namespace mockidb
