#include "mockidb/registry.hpp"
#include "mockidb/transaction.hpp"

#include <algorithm>
#include <format>

namespace mockidb {

namespace {

std::string open_source(const std::string &name) {
  return std::format("open:{}", name);
}

} // namespace

Registry::Registry(RegistryOptions options)
    : options_(options), scheduler_(std::make_shared<Scheduler>(options_)),
      catalog_(std::make_shared<Catalog>()) {}

Registry::~Registry() {
  // Queued tasks hold transactions that hold the scheduler.
  scheduler_->clear();
}

std::shared_ptr<Database> Registry::find(const std::string &name) const {
  auto it = catalog_->databases.find(name);
  return it == catalog_->databases.end() ? nullptr : it->second;
}

bool Registry::has_database(const std::string &name) const {
  return catalog_->databases.contains(name);
}

std::shared_ptr<Connection>
Registry::connect(const std::shared_ptr<Database> &db) {
  auto connection = std::make_shared<Connection>(db, scheduler_);
  db->attach(connection);
  return connection;
}

// ===========================================================================
// Open & Upgrade
// ===========================================================================

std::shared_ptr<OpenRequest> Registry::open(const std::string &name) {
  return open_impl(name, std::nullopt, nullptr);
}

std::shared_ptr<OpenRequest> Registry::open(const std::string &name,
                                            uint64_t version) {
  return open_impl(name, version, nullptr);
}

std::shared_ptr<OpenRequest>
Registry::open(const std::string &name, uint64_t version,
               OpenRequest::UpgradeHandler on_upgrade) {
  return open_impl(name, version, std::move(on_upgrade));
}

std::shared_ptr<OpenRequest>
Registry::open_impl(const std::string &name, std::optional<uint64_t> version,
                    OpenRequest::UpgradeHandler handler) {
  auto request =
      std::make_shared<OpenRequest>(scheduler_->next_serial(), "open");
  if (handler)
    request->on_upgrade_needed(std::move(handler));
  std::string source = open_source(name);

  if (version && *version == 0) {
    request->fail(Error{ErrorKind::Data, "The version must be positive"});
    scheduler_->deliver(request, std::move(source));
    return request;
  }

  auto db = find(name);
  bool created = false;
  if (!db) {
    db = std::make_shared<Database>(name, 0);
    catalog_->databases.emplace(name, db);
    created = true;
  }

  uint64_t target = version.value_or(std::max<uint64_t>(db->version(), 1));

  if (target < db->version()) {
    request->fail(Error{
        ErrorKind::Version,
        std::format("Requested version {} is lower than the stored version {}",
                    target, db->version())});
    scheduler_->deliver(request, std::move(source));
    return request;
  }

  if (target == db->version()) {
    scheduler_->post([this, request, db, source = std::move(source)] {
      if (db->deleted())
        request->fail(Error{ErrorKind::Abort,
                            "The database was deleted before the open "
                            "completed"});
      else
        request->resolve(connect(db));
      scheduler_->dispatch(*request, source);
    });
    return request;
  }

  if (db->upgrading()) {
    request->fail(Error{ErrorKind::InvalidState,
                        std::format("An upgrade of '{}' is already running",
                                    name)});
    scheduler_->deliver(request, std::move(source));
    return request;
  }

  db->set_upgrading(true);
  scheduler_->post([this, request, db, target, created] {
    run_upgrade(request, db, target, created);
  });
  return request;
}

void Registry::run_upgrade(const std::shared_ptr<OpenRequest> &request,
                           const std::shared_ptr<Database> &db,
                           uint64_t version, bool created) {
  std::string source = open_source(db->name());
  if (db->deleted()) {
    db->set_upgrading(false);
    request->fail(Error{ErrorKind::Abort,
                        "The database was deleted before the upgrade ran"});
    scheduler_->dispatch(*request, source);
    return;
  }

  uint64_t old_version = db->version();
  for (auto &other : db->open_connections())
    other->notify_version_change(VersionChangeEvent{old_version, version});

  auto snapshot = db->snapshot();
  auto connection = connect(db);
  auto txn = Transaction::create(db, scheduler_, {},
                                 TransactionMode::VersionChange, connection);
  txn->set_upgrade_snapshot(std::move(snapshot));
  connection->set_upgrade_transaction(txn);
  request->set_transaction(txn);
  db->set_version(version);

  txn->set_finish_observer(
      [catalog = std::weak_ptr<Catalog>(catalog_), scheduler = scheduler_,
       request, db, connection, created](bool committed) {
        finish_upgrade(catalog, *scheduler, request, db, connection, created,
                       committed);
      });

  scheduler_->record(source, TraceKind::UpgradeNeeded,
                     std::format("{} -> {}", old_version, version));
  try {
    request->notify_upgrade_needed(
        UpgradeEvent{connection, txn, old_version, version});
  } catch (...) {
    txn->abort_with(Error{ErrorKind::Abort,
                          "The upgradeneeded handler threw an exception"});
    throw;
  }
}

void Registry::finish_upgrade(const std::weak_ptr<Catalog> &catalog,
                              Scheduler &scheduler,
                              const std::shared_ptr<OpenRequest> &request,
                              const std::shared_ptr<Database> &db,
                              const std::shared_ptr<Connection> &connection,
                              bool created, bool committed) {
  db->set_upgrading(false);
  std::string source = open_source(db->name());

  if (committed) {
    request->resolve(connection);
    scheduler.deliver(request, std::move(source));
    return;
  }

  // The transaction already restored the catalog and version.
  connection->close();
  if (auto cat = catalog.lock(); cat && created) {
    auto it = cat->databases.find(db->name());
    if (it != cat->databases.end() && it->second == db) {
      cat->databases.erase(it);
      db->mark_deleted();
    }
  }
  request->fail(
      Error{ErrorKind::Abort, "The upgrade transaction was aborted"});
  scheduler.deliver(request, std::move(source));
}

// ===========================================================================
// Delete & List
// ===========================================================================

std::shared_ptr<VoidRequest>
Registry::delete_database(const std::string &name) {
  auto request = std::make_shared<VoidRequest>(scheduler_->next_serial(),
                                               "deleteDatabase");
  std::vector<std::shared_ptr<Connection>> connections;
  uint64_t old_version = 0;

  if (auto it = catalog_->databases.find(name);
      it != catalog_->databases.end()) {
    connections = it->second->open_connections();
    old_version = it->second->version();
    it->second->mark_deleted();
    catalog_->databases.erase(it);
  }

  request->resolve(std::monostate{});
  scheduler_->post([scheduler = scheduler_.get(), request,
                    connections = std::move(connections), old_version,
                    source = std::format("delete:{}", name)] {
    for (auto &connection : connections) {
      connection->notify_version_change(
          VersionChangeEvent{old_version, std::nullopt});
      connection->force_close();
    }
    scheduler->dispatch(*request, source);
  });
  return request;
}

std::shared_ptr<DatabasesRequest> Registry::databases() {
  auto request = std::make_shared<DatabasesRequest>(scheduler_->next_serial(),
                                                    "databases");
  std::vector<DatabaseInfo> infos;
  for (const auto &[name, db] : catalog_->databases) {
    // Version 0 means the first upgrade has not committed yet.
    if (db->version() > 0)
      infos.push_back(DatabaseInfo{name, db->version()});
  }
  request->resolve(std::move(infos));
  scheduler_->deliver(request, "registry");
  return request;
}

Result<int> Registry::cmp(const Value &a, const Value &b) const {
  auto ka = Key::from_value(a);
  auto kb = Key::from_value(b);
  if (!ka || !kb)
    return make_error(ErrorKind::Data,
                      std::format("{} is not a valid key",
                                  ka ? b.to_string() : a.to_string()));
  int c = compare_keys(*ka, *kb);
  return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

// ===========================================================================
// Fixtures & Introspection
// ===========================================================================

Result<void> Registry::seed(const DatabaseSchema &schema) {
  if (schema.version == 0)
    return make_error(ErrorKind::Data, "The version must be positive");

  auto db = std::make_shared<Database>(schema.name, schema.version);
  for (const auto &store : schema.stores) {
    auto created = db->create_store(store.name, store.options);
    if (!created)
      return std::unexpected(created.error());
    ObjectStore *os = *created;

    for (const auto &spec : store.indexes) {
      auto index = os->create_index(IndexSchema{spec.name, spec.key_path,
                                                spec.options.unique,
                                                spec.options.multi_entry});
      if (!index)
        return std::unexpected(index.error());
    }
    for (const auto &record : store.records) {
      auto stored = os->store_record(record.value, record.key, false);
      if (!stored)
        return std::unexpected(stored.error());
    }
  }

  if (auto existing = find(schema.name)) {
    for (auto &connection : existing->open_connections())
      connection->force_close();
    existing->mark_deleted();
  }
  catalog_->databases[schema.name] = std::move(db);
  return {};
}

Result<ObjectStore::Records>
Registry::store_records(const std::string &database,
                        const std::string &store) const {
  auto db = find(database);
  if (!db)
    return make_error(ErrorKind::NotFound,
                      std::format("No database named '{}'", database));
  const ObjectStore *os = db->find_store(store);
  if (!os)
    return make_error(ErrorKind::NotFound,
                      std::format("No object store named '{}' in '{}'", store,
                                  database));
  return os->records();
}

Result<std::map<std::string, ObjectStore::Records>>
Registry::database_records(const std::string &database) const {
  auto db = find(database);
  if (!db)
    return make_error(ErrorKind::NotFound,
                      std::format("No database named '{}'", database));
  std::map<std::string, ObjectStore::Records> result;
  for (const auto &[name, store] : db->stores())
    result.emplace(name, store.records());
  return result;
}

std::map<std::string, DatabaseDump> Registry::all_databases() const {
  std::map<std::string, DatabaseDump> result;
  for (const auto &[name, db] : catalog_->databases) {
    DatabaseDump dump;
    dump.version = db->version();
    for (const auto &[store_name, store] : db->stores())
      dump.stores.emplace(store_name, store.records());
    result.emplace(name, std::move(dump));
  }
  return result;
}

void Registry::clear_all() {
  auto databases = std::move(catalog_->databases);
  catalog_->databases.clear();
  for (auto &[name, db] : databases) {
    for (auto &connection : db->open_connections())
      connection->force_close();
    db->mark_deleted();
  }
}

} // namespace mockidb
