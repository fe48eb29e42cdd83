#include "mockidb/connection.hpp"
#include "mockidb/store_handle.hpp"
#include "mockidb/transaction.hpp"

#include <algorithm>
#include <format>

namespace mockidb {

Connection::Connection(std::shared_ptr<Database> database,
                       std::shared_ptr<Scheduler> scheduler)
    : id_(scheduler->next_serial()),
      source_(std::format("db:{}#{}", database->name(), id_)),
      database_(std::move(database)), scheduler_(std::move(scheduler)) {}

std::vector<std::string> Connection::object_store_names() const {
  return database_->store_names();
}

std::shared_ptr<Transaction> Connection::running_upgrade() const {
  auto txn = upgrade_.lock();
  return txn && !txn->finished() ? txn : nullptr;
}

Result<std::shared_ptr<Transaction>>
Connection::transaction(std::vector<std::string> store_names,
                        TransactionMode mode) {
  if (closed_)
    return make_error(ErrorKind::InvalidState,
                      std::format("Connection to '{}' is closed", name()));
  if (running_upgrade())
    return make_error(ErrorKind::InvalidState,
                      "A versionchange transaction is running");
  if (mode == TransactionMode::VersionChange)
    return make_error(ErrorKind::InvalidAccess,
                      "versionchange transactions are only created by open()");
  if (store_names.empty())
    return make_error(ErrorKind::InvalidAccess,
                      "A transaction needs at least one object store");
  for (const auto &store : store_names) {
    if (!database_->find_store(store))
      return make_error(ErrorKind::NotFound,
                        std::format("No object store named '{}' in '{}'",
                                    store, name()));
  }
  return Transaction::create(database_, scheduler_, std::move(store_names),
                             mode, weak_from_this());
}

Result<StoreHandle> Connection::create_object_store(const std::string &name,
                                                    StoreOptions options) {
  auto txn = running_upgrade();
  if (!txn)
    return make_error(ErrorKind::InvalidState,
                      "Object stores can only be created during an upgrade");
  return txn->create_object_store(name, std::move(options));
}

Result<void> Connection::delete_object_store(const std::string &name) {
  auto txn = running_upgrade();
  if (!txn)
    return make_error(ErrorKind::InvalidState,
                      "Object stores can only be deleted during an upgrade");
  return txn->delete_object_store(name);
}

Connection &Connection::on_version_change(VersionChangeHandler handler) {
  version_change_handlers_.push_back(std::move(handler));
  return *this;
}

Connection &Connection::on_close(CloseHandler handler) {
  close_handlers_.push_back(std::move(handler));
  return *this;
}

void Connection::notify_version_change(const VersionChangeEvent &event) {
  if (closed_)
    return;
  scheduler_->record(
      source_, TraceKind::VersionChange,
      event.new_version
          ? std::format("{} -> {}", event.old_version, *event.new_version)
          : std::format("{} -> deleted", event.old_version));
  auto handlers = version_change_handlers_;
  for (auto &handler : handlers)
    handler(*this, event);
}

void Connection::force_close() {
  if (closed_)
    return;
  closed_ = true;
  scheduler_->record(source_, TraceKind::ConnectionClose, name());
  auto handlers = std::move(close_handlers_);
  version_change_handlers_.clear();
  for (auto &handler : handlers)
    handler(*this);
}

} // namespace mockidb
