#pragma once

#include "mockidb/database.hpp"
#include "mockidb/error.hpp"
#include "mockidb/scheduler.hpp"
#include "mockidb/schema.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mockidb {

class StoreHandle;
class Transaction;

/// new_version is nullopt when the database is being deleted.
struct VersionChangeEvent {
  uint64_t old_version = 0;
  std::optional<uint64_t> new_version;
};

/**
 * @brief An open handle to a database, delivered by a successful open.
 *
 * Closing is immediate: no new transactions may start, running ones finish
 * normally.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
  using VersionChangeHandler =
      std::function<void(Connection &, const VersionChangeEvent &)>;
  using CloseHandler = std::function<void(Connection &)>;

  Connection(std::shared_ptr<Database> database,
             std::shared_ptr<Scheduler> scheduler);

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  uint64_t id() const noexcept { return id_; }
  const std::string &name() const noexcept { return database_->name(); }
  uint64_t version() const noexcept { return database_->version(); }
  /// Sorted.
  std::vector<std::string> object_store_names() const;
  bool closed() const noexcept { return closed_; }

  /**
   * @brief Start a readonly or readwrite transaction.
   *
   * InvalidState if closed or while an upgrade runs on this connection;
   * InvalidAccess for an empty scope or VersionChange mode; NotFound for
   * an unknown store.
   */
  Result<std::shared_ptr<Transaction>>
  transaction(std::vector<std::string> store_names,
              TransactionMode mode = TransactionMode::ReadOnly);

  /// Forwarded to the running upgrade transaction (InvalidState otherwise).
  Result<StoreHandle> create_object_store(const std::string &name,
                                          StoreOptions options = {});
  Result<void> delete_object_store(const std::string &name);

  void close() noexcept { closed_ = true; }

  Connection &on_version_change(VersionChangeHandler handler);
  Connection &on_close(CloseHandler handler);

  // -----------------------------------------------------------------------
  // Engine side
  // -----------------------------------------------------------------------

  void set_upgrade_transaction(std::weak_ptr<Transaction> transaction) {
    upgrade_ = std::move(transaction);
  }

  /// Trace and fire versionchange handlers. Skipped once closed.
  void notify_version_change(const VersionChangeEvent &event);

  /// Close because the database went away; fires close handlers.
  void force_close();

  /// Dispatch trace source, "db:<name>#<id>".
  const std::string &source() const noexcept { return source_; }

private:
  std::shared_ptr<Transaction> running_upgrade() const;

  uint64_t id_;
  std::string source_;
  std::shared_ptr<Database> database_;
  std::shared_ptr<Scheduler> scheduler_;
  std::weak_ptr<Transaction> upgrade_;
  bool closed_ = false;
  std::vector<VersionChangeHandler> version_change_handlers_;
  std::vector<CloseHandler> close_handlers_;
};

} // namespace mockidb
