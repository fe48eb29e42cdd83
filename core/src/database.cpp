#include "mockidb/database.hpp"
#include "mockidb/connection.hpp"

#include <algorithm>
#include <format>

namespace mockidb {

Result<ObjectStore *> Database::create_store(const std::string &name,
                                             StoreOptions options) {
  const KeyPath &path = options.key_path;
  if (!path.is_valid())
    return make_error(ErrorKind::Data,
                      std::format("'{}' is not a valid key path",
                                  path.to_string()));
  if (options.auto_increment &&
      ((path.is_string() && path.as_string().empty()) || path.is_compound()))
    return make_error(ErrorKind::InvalidAccess,
                      "autoIncrement requires no key path or a non-empty "
                      "string key path");
  if (stores_.contains(name))
    return make_error(ErrorKind::Constraint,
                      std::format("Object store '{}' already exists in '{}'",
                                  name, name_));

  auto [it, inserted] =
      stores_.emplace(name, ObjectStore(name, std::move(options)));
  return &it->second;
}

Result<void> Database::delete_store(const std::string &name) {
  if (stores_.erase(name) == 0)
    return make_error(ErrorKind::NotFound,
                      std::format("No object store named '{}' in '{}'", name,
                                  name_));
  return {};
}

ObjectStore *Database::find_store(const std::string &name) {
  auto it = stores_.find(name);
  return it == stores_.end() ? nullptr : &it->second;
}

const ObjectStore *Database::find_store(const std::string &name) const {
  auto it = stores_.find(name);
  return it == stores_.end() ? nullptr : &it->second;
}

std::vector<std::string> Database::store_names() const {
  std::vector<std::string> names;
  names.reserve(stores_.size());
  for (const auto &[store_name, store] : stores_)
    names.push_back(store_name);
  return names;
}

void Database::restore(Snapshot snapshot) {
  version_ = snapshot.version;
  stores_ = std::move(snapshot.stores);
}

void Database::attach(const std::shared_ptr<Connection> &connection) {
  std::erase_if(connections_,
                [](const std::weak_ptr<Connection> &c) { return c.expired(); });
  connections_.push_back(connection);
}

std::vector<std::shared_ptr<Connection>> Database::open_connections() const {
  std::vector<std::shared_ptr<Connection>> result;
  for (const auto &weak : connections_) {
    if (auto connection = weak.lock(); connection && !connection->closed())
      result.push_back(std::move(connection));
  }
  return result;
}

} // namespace mockidb
