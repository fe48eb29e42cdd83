#pragma once

/**
 * @file database.hpp
 * @brief One named database: version, store catalog, open connections.
 */

#include "mockidb/error.hpp"
#include "mockidb/object_store.hpp"
#include "mockidb/schema.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mockidb {

class Connection;

class Database {
public:
  /// Catalog and version as of some point; restored when an upgrade aborts.
  struct Snapshot {
    uint64_t version = 0;
    std::map<std::string, ObjectStore> stores;
  };

  explicit Database(std::string name, uint64_t version = 0)
      : name_(std::move(name)), version_(version) {}

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  const std::string &name() const noexcept { return name_; }
  uint64_t version() const noexcept { return version_; }
  void set_version(uint64_t version) noexcept { version_ = version; }

  // -----------------------------------------------------------------------
  // Store Catalog
  // -----------------------------------------------------------------------

  /**
   * @brief Add an empty object store.
   *
   * Errors: Data for a malformed key path; InvalidAccess for auto-increment
   * combined with an empty-string or compound key path; Constraint for a
   * duplicate name.
   */
  Result<ObjectStore *> create_store(const std::string &name,
                                     StoreOptions options);

  /// NotFound if no such store.
  Result<void> delete_store(const std::string &name);

  ObjectStore *find_store(const std::string &name);
  const ObjectStore *find_store(const std::string &name) const;

  /// Sorted.
  std::vector<std::string> store_names() const;

  const std::map<std::string, ObjectStore> &stores() const noexcept {
    return stores_;
  }

  Snapshot snapshot() const { return Snapshot{version_, stores_}; }
  void restore(Snapshot snapshot);

  // -----------------------------------------------------------------------
  // Connections & Lifecycle
  // -----------------------------------------------------------------------

  void attach(const std::shared_ptr<Connection> &connection);

  /// Live connections that have not been closed.
  std::vector<std::shared_ptr<Connection>> open_connections() const;

  /// Set while a versionchange transaction is running.
  bool upgrading() const noexcept { return upgrading_; }
  void set_upgrading(bool upgrading) noexcept { upgrading_ = upgrading; }

  /// Set once the database has been removed from its registry.
  bool deleted() const noexcept { return deleted_; }
  void mark_deleted() noexcept { deleted_ = true; }

private:
  std::string name_;
  uint64_t version_;
  std::map<std::string, ObjectStore> stores_;
  std::vector<std::weak_ptr<Connection>> connections_;
  bool upgrading_ = false;
  bool deleted_ = false;
};

} // namespace mockidb
