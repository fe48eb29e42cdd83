#pragma once

/**
 * @file registry.hpp
 * @brief Catalog of named databases; owns the scheduler.
 *
 * A Registry is an explicitly constructed instance (no process-wide
 * singleton). Everything reachable from it is single-threaded.
 *
 * open() flow:
 *   1. On the call: version gate (VersionError / DataError) and creation of
 *      a missing database at version 0
 *   2. Next turn, if an upgrade is needed: versionchange to other
 *      connections, then upgradeneeded with a versionchange transaction
 *   3. Upgrade commits -> open succeeds with a Connection
 *      Upgrade aborts  -> catalog restored, open fails with AbortError
 *
 * The seeding/introspection calls at the bottom bypass transactions and
 * give no ordering guarantees.
 */

#include "mockidb/connection.hpp"
#include "mockidb/database.hpp"
#include "mockidb/error.hpp"
#include "mockidb/object_store.hpp"
#include "mockidb/request.hpp"
#include "mockidb/scheduler.hpp"
#include "mockidb/schema.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mockidb {

class Transaction;

struct DatabaseInfo {
  std::string name;
  uint64_t version = 0;

  bool operator==(const DatabaseInfo &) const = default;
};

using DatabasesRequest = Request<std::vector<DatabaseInfo>>;

struct UpgradeEvent {
  std::shared_ptr<Connection> connection;
  std::shared_ptr<Transaction> transaction;
  uint64_t old_version = 0;
  uint64_t new_version = 0;
};

class OpenRequest : public Request<std::shared_ptr<Connection>> {
public:
  using UpgradeHandler = std::function<void(const UpgradeEvent &)>;

  OpenRequest(uint64_t id, std::string operation)
      : Request(id, std::move(operation)) {}

  OpenRequest &on_upgrade_needed(UpgradeHandler handler) {
    upgrade_handlers_.push_back(std::move(handler));
    return *this;
  }

  void notify_upgrade_needed(const UpgradeEvent &event) {
    auto handlers = upgrade_handlers_;
    for (auto &handler : handlers)
      handler(event);
  }

private:
  std::vector<UpgradeHandler> upgrade_handlers_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Fixture Schema
// ═══════════════════════════════════════════════════════════════════════════

struct IndexSpec {
  std::string name;
  KeyPath key_path;
  IndexOptions options;
};

struct SeedRecord {
  Value value;
  /// Out-of-band key; otherwise resolved like add().
  std::optional<Key> key;
};

struct StoreSchema {
  std::string name;
  StoreOptions options;
  std::vector<IndexSpec> indexes;
  std::vector<SeedRecord> records;
};

struct DatabaseSchema {
  std::string name;
  uint64_t version = 1;
  std::vector<StoreSchema> stores;
};

struct DatabaseDump {
  uint64_t version = 0;
  std::map<std::string, ObjectStore::Records> stores;
};

// ═══════════════════════════════════════════════════════════════════════════
// Registry
// ═══════════════════════════════════════════════════════════════════════════

class Registry {
public:
  explicit Registry(RegistryOptions options = {});
  ~Registry();

  Registry(const Registry &) = delete;
  Registry &operator=(const Registry &) = delete;

  /// Current version, or 1 for a new database.
  std::shared_ptr<OpenRequest> open(const std::string &name);

  /// VersionError below the stored version; DataError for version 0;
  /// InvalidState if another upgrade of the database is running.
  std::shared_ptr<OpenRequest> open(const std::string &name, uint64_t version);

  /// open() with the upgrade handler attached up front.
  std::shared_ptr<OpenRequest> open(const std::string &name, uint64_t version,
                                    OpenRequest::UpgradeHandler on_upgrade);

  /**
   * @brief Remove a database now; notify and close its connections, then
   *        succeed, in a later turn. Succeeds for unknown names too.
   */
  std::shared_ptr<VoidRequest> delete_database(const std::string &name);

  /// Name/version pairs, sorted by name.
  std::shared_ptr<DatabasesRequest> databases();

  /// -1, 0 or 1 under the key order; DataError if either is not a key.
  Result<int> cmp(const Value &a, const Value &b) const;

  // -----------------------------------------------------------------------
  // Fixtures & Introspection
  // -----------------------------------------------------------------------

  /**
   * @brief Replace (or create) a database from a schema with records.
   *
   * Records go through add() key resolution and index rules; any failure
   * rejects the whole seed and leaves the registry unchanged. Connections
   * to a replaced database are closed.
   */
  Result<void> seed(const DatabaseSchema &schema);

  Result<ObjectStore::Records> store_records(const std::string &database,
                                            const std::string &store) const;
  Result<std::map<std::string, ObjectStore::Records>>
  database_records(const std::string &database) const;
  std::map<std::string, DatabaseDump> all_databases() const;

  bool has_database(const std::string &name) const;

  /// Drop every database and close every connection.
  void clear_all();

  Scheduler &scheduler() noexcept { return *scheduler_; }
  DispatchTrace &trace() noexcept { return scheduler_->trace(); }

  bool run_one() { return scheduler_->run_one(); }
  size_t run_until_idle() { return scheduler_->run_until_idle(); }

private:
  struct Catalog {
    std::map<std::string, std::shared_ptr<Database>> databases;
  };

  std::shared_ptr<OpenRequest> open_impl(const std::string &name,
                                         std::optional<uint64_t> version,
                                         OpenRequest::UpgradeHandler handler);

  void run_upgrade(const std::shared_ptr<OpenRequest> &request,
                   const std::shared_ptr<Database> &db, uint64_t version,
                   bool created);

  /// Static: runs from the transaction's observer, which may outlive this.
  static void finish_upgrade(const std::weak_ptr<Catalog> &catalog,
                             Scheduler &scheduler,
                             const std::shared_ptr<OpenRequest> &request,
                             const std::shared_ptr<Database> &db,
                             const std::shared_ptr<Connection> &connection,
                             bool created, bool committed);

  std::shared_ptr<Connection> connect(const std::shared_ptr<Database> &db);

  std::shared_ptr<Database> find(const std::string &name) const;

  RegistryOptions options_;
  std::shared_ptr<Scheduler> scheduler_;
  std::shared_ptr<Catalog> catalog_;
};

} // namespace mockidb
