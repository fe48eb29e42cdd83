#include "mockidb/presets.hpp"

namespace mockidb::presets {

DatabaseSchema key_value_store(std::string name) {
  DatabaseSchema schema{.name = std::move(name), .version = 1};
  schema.stores.push_back(
      StoreSchema{.name = "data", .options = {.key_path = "key"}});
  return schema;
}

DatabaseSchema users_database(std::string name) {
  DatabaseSchema schema{.name = std::move(name), .version = 1};
  schema.stores.push_back(StoreSchema{
      .name = "users",
      .options = {.key_path = "id", .auto_increment = true},
      .indexes = {{"email", "email", {.unique = true}},
                  {"username", "username", {.unique = true}}}});
  schema.stores.push_back(StoreSchema{
      .name = "sessions",
      .options = {.key_path = "id", .auto_increment = true},
      .indexes = {{"userId", "userId", {}}, {"expiresAt", "expiresAt", {}}}});
  return schema;
}

DatabaseSchema todo_database(std::string name) {
  DatabaseSchema schema{.name = std::move(name), .version = 1};
  schema.stores.push_back(StoreSchema{
      .name = "todos",
      .options = {.key_path = "id", .auto_increment = true},
      .indexes = {{"completed", "completed", {}},
                  {"createdAt", "createdAt", {}},
                  {"priority", "priority", {}}}});
  schema.stores.push_back(StoreSchema{
      .name = "categories",
      .options = {.key_path = "id", .auto_increment = true}});
  return schema;
}

DatabaseSchema cache_database(std::string name) {
  DatabaseSchema schema{.name = std::move(name), .version = 1};
  schema.stores.push_back(StoreSchema{
      .name = "requests",
      .options = {.key_path = "url"},
      .indexes = {{"timestamp", "timestamp", {}}, {"method", "method", {}}}});
  schema.stores.push_back(
      StoreSchema{.name = "responses",
                  .options = {.key_path = "url"},
                  .indexes = {{"expiresAt", "expiresAt", {}}}});
  return schema;
}

} // namespace mockidb::presets
