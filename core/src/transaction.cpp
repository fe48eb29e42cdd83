#include "mockidb/transaction.hpp"
#include "mockidb/connection.hpp"
#include "mockidb/store_handle.hpp"

#include <algorithm>
#include <format>

namespace mockidb {

std::shared_ptr<Transaction>
Transaction::create(std::shared_ptr<Database> database,
                    std::shared_ptr<Scheduler> scheduler,
                    std::vector<std::string> scope, TransactionMode mode,
                    std::weak_ptr<Connection> connection) {
  std::shared_ptr<Transaction> txn(
      new Transaction(std::move(database), std::move(scheduler),
                      std::move(scope), mode, std::move(connection)));

  // A transaction nobody issues a request against commits on its own.
  txn->scheduler_->post([txn] { txn->maybe_commit(); });
  return txn;
}

Transaction::Transaction(std::shared_ptr<Database> database,
                         std::shared_ptr<Scheduler> scheduler,
                         std::vector<std::string> scope, TransactionMode mode,
                         std::weak_ptr<Connection> connection)
    : id_(scheduler->next_serial()), source_(std::format("txn:{}", id_)),
      mode_(mode), scope_(std::move(scope)), database_(std::move(database)),
      scheduler_(std::move(scheduler)), connection_(std::move(connection)) {
  std::sort(scope_.begin(), scope_.end());
  scope_.erase(std::unique(scope_.begin(), scope_.end()), scope_.end());
}

std::vector<std::string> Transaction::object_store_names() const {
  if (mode_ == TransactionMode::VersionChange)
    return database_->store_names();
  return scope_;
}

bool Transaction::in_scope(const std::string &name) const {
  if (mode_ == TransactionMode::VersionChange)
    return true;
  return std::binary_search(scope_.begin(), scope_.end(), name);
}

Error Transaction::inactive_error() const {
  return Error{ErrorKind::InvalidState,
               std::format("Transaction {} is {}", id_, state_name(state_))};
}

Result<StoreHandle> Transaction::store(const std::string &name) {
  if (finished())
    return std::unexpected(inactive_error());
  if (!in_scope(name))
    return make_error(ErrorKind::InvalidState,
                      std::format("Object store '{}' is not in the scope of "
                                  "transaction {}",
                                  name, id_));
  if (!database_->find_store(name))
    return make_error(ErrorKind::NotFound,
                      std::format("No object store named '{}'", name));
  return StoreHandle(shared_from_this(), name);
}

// ===========================================================================
// Catalog
// ===========================================================================

Result<void> Transaction::fail_upgrade(Error error) {
  abort_with(error);
  return std::unexpected(std::move(error));
}

Result<StoreHandle> Transaction::create_object_store(const std::string &name,
                                                     StoreOptions options) {
  if (mode_ != TransactionMode::VersionChange || !active())
    return make_error(ErrorKind::InvalidState,
                      "Object stores can only be created in an active "
                      "versionchange transaction");
  auto created = database_->create_store(name, std::move(options));
  if (!created) {
    auto failed = fail_upgrade(created.error());
    return std::unexpected(failed.error());
  }
  return StoreHandle(shared_from_this(), name);
}

Result<void> Transaction::delete_object_store(const std::string &name) {
  if (mode_ != TransactionMode::VersionChange || !active())
    return make_error(ErrorKind::InvalidState,
                      "Object stores can only be deleted in an active "
                      "versionchange transaction");
  if (auto deleted = database_->delete_store(name); !deleted)
    return fail_upgrade(deleted.error());
  return {};
}

Result<void> Transaction::create_index(const std::string &store,
                                       IndexSchema schema) {
  if (mode_ != TransactionMode::VersionChange || !active())
    return make_error(ErrorKind::InvalidState,
                      "Indexes can only be created in an active "
                      "versionchange transaction");
  ObjectStore *os = database_->find_store(store);
  if (!os)
    return fail_upgrade(Error{
        ErrorKind::NotFound, std::format("No object store named '{}'", store)});
  if (auto created = os->create_index(std::move(schema)); !created)
    return fail_upgrade(created.error());
  return {};
}

Result<void> Transaction::delete_index(const std::string &store,
                                       const std::string &name) {
  if (mode_ != TransactionMode::VersionChange || !active())
    return make_error(ErrorKind::InvalidState,
                      "Indexes can only be deleted in an active "
                      "versionchange transaction");
  ObjectStore *os = database_->find_store(store);
  if (!os)
    return fail_upgrade(Error{
        ErrorKind::NotFound, std::format("No object store named '{}'", store)});
  if (auto deleted = os->delete_index(name); !deleted)
    return fail_upgrade(deleted.error());
  return {};
}

// ===========================================================================
// Request Issue & Delivery
// ===========================================================================

std::optional<Error> Transaction::check_request(const std::string &store_name,
                                                bool write) const {
  if (!in_scope(store_name))
    return Error{ErrorKind::InvalidState,
                 std::format("Object store '{}' is not in the scope of "
                             "transaction {}",
                             store_name, id_)};
  if (write && mode_ == TransactionMode::ReadOnly)
    return Error{ErrorKind::ReadOnly,
                 std::format("Transaction {} is readonly", id_)};
  if (!database_->find_store(store_name))
    return Error{ErrorKind::NotFound,
                 std::format("Object store '{}' has been deleted", store_name)};
  return std::nullopt;
}

void Transaction::snapshot_store(const std::string &name) {
  // The upgrade snapshot already covers every store.
  if (mode_ == TransactionMode::VersionChange ||
      store_snapshots_.contains(name))
    return;
  if (const ObjectStore *os = database_->find_store(name))
    store_snapshots_.emplace(name, *os);
}

void Transaction::issue(std::shared_ptr<RequestBase> request) {
  pending_.push_back(request);
  scheduler_->post([self = shared_from_this(), request = std::move(request)] {
    self->deliver(request);
  });
}

Result<void> Transaction::reissue(std::shared_ptr<RequestBase> request) {
  if (!active())
    return std::unexpected(inactive_error());
  issue(std::move(request));
  return {};
}

void Transaction::deliver(const std::shared_ptr<RequestBase> &request) {
  auto it = std::find(pending_.begin(), pending_.end(), request);
  if (it == pending_.end())
    return;
  pending_.erase(it);

  const bool failed = request->failed();
  try {
    scheduler_->dispatch(*request, source_);
    if (failed) {
      auto handlers = error_handlers_;
      for (auto &handler : handlers)
        handler(*this, *request);
    }
  } catch (...) {
    abort_with(Error{ErrorKind::Abort,
                     std::format("A handler of '{}' threw an exception",
                                 request->operation())});
    throw;
  }

  if (failed && !finished() && !request->default_prevented() &&
      request->outcome_error()->kind != ErrorKind::Abort) {
    abort_with(*request->outcome_error());
  }

  maybe_commit();
}

// ===========================================================================
// Lifecycle
// ===========================================================================

void Transaction::maybe_commit() {
  if (!pending_.empty() || commit_posted_ || finished())
    return;
  state_ = TransactionState::Committing;
  commit_posted_ = true;
  scheduler_->post([self = shared_from_this()] { self->finish_commit(); });
}

Result<void> Transaction::commit() {
  if (!active())
    return std::unexpected(inactive_error());
  state_ = TransactionState::Committing;
  maybe_commit();
  return {};
}

Result<void> Transaction::abort() {
  if (!active())
    return std::unexpected(inactive_error());
  abort_with(Error{ErrorKind::Abort, "The transaction was aborted"});
  return {};
}

void Transaction::abort_with(Error cause) {
  if (finished())
    return;
  state_ = TransactionState::Aborted;
  error_ = std::move(cause);

  if (upgrade_snapshot_) {
    database_->restore(std::move(*upgrade_snapshot_));
    upgrade_snapshot_.reset();
  }
  for (auto &[name, snapshot] : store_snapshots_) {
    if (ObjectStore *os = database_->find_store(name))
      *os = std::move(snapshot);
  }
  store_snapshots_.clear();

  // Their delivery tasks are already queued and run before finish_abort.
  for (auto &request : pending_)
    request->fail(Error{ErrorKind::Abort,
                        std::format("Transaction {} was aborted", id_)});

  scheduler_->post([self = shared_from_this()] { self->finish_abort(); });
}

void Transaction::finish_commit() {
  if (state_ != TransactionState::Committing)
    return;
  state_ = TransactionState::Committed;
  store_snapshots_.clear();
  upgrade_snapshot_.reset();

  if (finish_observer_)
    finish_observer_(true);
  scheduler_->record(source_, TraceKind::TransactionComplete,
                     std::string(mode_name(mode_)));
  auto handlers = std::move(complete_handlers_);
  release_handlers();
  for (auto &handler : handlers)
    handler(*this);
}

void Transaction::finish_abort() {
  if (finish_observer_)
    finish_observer_(false);
  scheduler_->record(source_, TraceKind::TransactionAbort,
                     error_ ? std::string(error_->name()) : "AbortError");
  auto handlers = std::move(abort_handlers_);
  release_handlers();
  for (auto &handler : handlers)
    handler(*this);
}

void Transaction::release_handlers() {
  complete_handlers_.clear();
  abort_handlers_.clear();
  error_handlers_.clear();
  finish_observer_ = nullptr;
}

Transaction &Transaction::on_complete(Handler handler) {
  complete_handlers_.push_back(std::move(handler));
  return *this;
}

Transaction &Transaction::on_abort(Handler handler) {
  abort_handlers_.push_back(std::move(handler));
  return *this;
}

Transaction &Transaction::on_error(ErrorHandler handler) {
  error_handlers_.push_back(std::move(handler));
  return *this;
}

void Transaction::set_upgrade_snapshot(Database::Snapshot snapshot) {
  upgrade_snapshot_ = std::move(snapshot);
}

void Transaction::set_finish_observer(std::function<void(bool)> observer) {
  finish_observer_ = std::move(observer);
}

} // namespace mockidb
