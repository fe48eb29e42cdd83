/**
 * @file mockidb_node.cpp
 * @brief Node.js bridge: drives a mockidb Registry from JavaScript tests.
 *
 * DESIGN INVARIANTS:
 *   1. One Registry per MockIndexedDB instance. Nothing is shared between
 *      instances, so parallel test files never see each other's databases.
 *   2. Synchronous surface: exec() issues a batch of operations in one
 *      transaction and drains the scheduler before returning, so callers
 *      observe the completed outcome without a libuv round trip.
 *   3. No C++ exceptions cross FFI: engine failures become JS Errors whose
 *      `name` is the DOMException name ("ConstraintError", ...).
 */

#include "mockidb/mockidb.hpp"
#include <napi.h>

#include <cmath>
#include <exception>
#include <string>
#include <vector>

using mockidb::Error;
using mockidb::ErrorKind;
using mockidb::Key;
using mockidb::KeyPath;
using mockidb::KeyRange;
using mockidb::Result;
using mockidb::Value;

// ═══════════════════════════════════════════════════════════════════════════════
// Engine Error → JS Error
// ═══════════════════════════════════════════════════════════════════════════════

static Napi::Error make_js_error(Napi::Env env, const Error &err,
                                 const std::string &context) {
  std::string msg = std::string(err.name()) + ": " + context + " failed: " +
                    err.message;
  Napi::Error js = Napi::Error::New(env, msg);
  js.Set("name", Napi::String::New(env, std::string(err.name())));
  return js;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Macro: Check a Result and throw a JS Error on failure
// Uses do-while(0) idiom for safe use in if/else without braces.
// ═══════════════════════════════════════════════════════════════════════════════

#define MOCKIDB_CHECK(env, result, context)                                    \
  do {                                                                         \
    if (!(result)) {                                                           \
      make_js_error((env), (result).error(), (context))                        \
          .ThrowAsJavaScriptException();                                       \
      return (env).Undefined();                                                \
    }                                                                          \
  } while (0)

// Variant for argument shape errors (TypeError, returns Napi::Value)
#define MOCKIDB_REQUIRE(env, cond, message)                                    \
  do {                                                                         \
    if (!(cond)) {                                                             \
      Napi::TypeError::New((env), (message)).ThrowAsJavaScriptException();     \
      return (env).Undefined();                                                \
    }                                                                          \
  } while (0)

// ═══════════════════════════════════════════════════════════════════════════════
// JS ↔ Value Conversion
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

Result<Value> from_js(const Napi::Value &js) {
  if (js.IsUndefined())
    return Value(mockidb::Undefined{});
  if (js.IsNull())
    return Value(nullptr);
  if (js.IsBoolean())
    return Value(js.As<Napi::Boolean>().Value());
  if (js.IsNumber())
    return Value(js.As<Napi::Number>().DoubleValue());
  if (js.IsString())
    return Value(js.As<Napi::String>().Utf8Value());
  if (js.IsDate())
    return Value(mockidb::Date{js.As<Napi::Date>().ValueOf()});

  // Buffer and every other typed array view are raw bytes.
  if (js.IsTypedArray()) {
    auto view = js.As<Napi::TypedArray>();
    const auto *base =
        static_cast<const uint8_t *>(view.ArrayBuffer().Data()) +
        view.ByteOffset();
    return Value(mockidb::Binary(base, base + view.ByteLength()));
  }
  if (js.IsArrayBuffer()) {
    auto buffer = js.As<Napi::ArrayBuffer>();
    const auto *base = static_cast<const uint8_t *>(buffer.Data());
    return Value(mockidb::Binary(base, base + buffer.ByteLength()));
  }

  if (js.IsArray()) {
    auto arr = js.As<Napi::Array>();
    Value::Array items;
    items.reserve(arr.Length());
    for (uint32_t i = 0; i < arr.Length(); ++i) {
      auto item = from_js(arr.Get(i));
      if (!item)
        return item;
      items.push_back(std::move(*item));
    }
    return Value(std::move(items));
  }

  if (js.IsObject() && !js.IsFunction()) {
    auto obj = js.As<Napi::Object>();
    Napi::Array names = obj.GetPropertyNames();
    Value::Object members;
    for (uint32_t i = 0; i < names.Length(); ++i) {
      std::string name = names.Get(i).ToString().Utf8Value();
      auto member = from_js(obj.Get(name));
      if (!member)
        return member;
      members.emplace(std::move(name), std::move(*member));
    }
    return Value(std::move(members));
  }

  return mockidb::make_error(ErrorKind::Data,
                             "Functions, symbols and BigInts cannot be cloned");
}

Napi::Value to_js(Napi::Env env, const Value &value) {
  using Type = Value::Type;
  switch (value.type()) {
  case Type::Undefined:
    return env.Undefined();
  case Type::Null:
    return env.Null();
  case Type::Bool:
    return Napi::Boolean::New(env, value.as_bool());
  case Type::Number:
    return Napi::Number::New(env, value.as_number());
  case Type::String:
    return Napi::String::New(env, value.as_string());
  case Type::Date:
    return Napi::Date::New(env, value.as_date().epoch_ms);
  case Type::Binary: {
    const auto &bytes = value.as_binary();
    return Napi::Buffer<uint8_t>::Copy(env, bytes.data(), bytes.size());
  }
  case Type::Array: {
    const auto &items = value.as_array();
    Napi::Array arr = Napi::Array::New(env, items.size());
    for (size_t i = 0; i < items.size(); ++i)
      arr.Set(static_cast<uint32_t>(i), to_js(env, items[i]));
    return arr;
  }
  case Type::Object: {
    Napi::Object obj = Napi::Object::New(env);
    for (const auto &[name, member] : value.as_object())
      obj.Set(name, to_js(env, member));
    return obj;
  }
  }
  return env.Undefined();
}

Result<Key> key_from_js(const Napi::Value &js) {
  auto value = from_js(js);
  if (!value)
    return std::unexpected(value.error());
  auto key = Key::from_value(*value);
  if (!key)
    return mockidb::make_error(ErrorKind::Data, value->to_string() +
                                                    " is not a valid key");
  return *key;
}

/// A plain key means only(key); {lower, upper, lowerOpen, upperOpen} a bound.
Result<KeyRange> range_from_js(const Napi::Value &js) {
  bool is_bound = js.IsObject() && !js.IsArray() && !js.IsDate() &&
                  !js.IsTypedArray() && !js.IsArrayBuffer() &&
                  (js.As<Napi::Object>().Has("lower") ||
                   js.As<Napi::Object>().Has("upper"));
  if (!is_bound) {
    auto key = key_from_js(js);
    if (!key)
      return std::unexpected(key.error());
    return KeyRange::only(std::move(*key));
  }

  auto obj = js.As<Napi::Object>();
  auto flag = [&](const char *name) {
    return obj.Has(name) && obj.Get(name).ToBoolean().Value();
  };
  bool has_lower = obj.Has("lower") && !obj.Get("lower").IsUndefined();
  bool has_upper = obj.Has("upper") && !obj.Get("upper").IsUndefined();

  std::optional<Key> lower, upper;
  if (has_lower) {
    auto key = key_from_js(obj.Get("lower"));
    if (!key)
      return std::unexpected(key.error());
    lower = std::move(*key);
  }
  if (has_upper) {
    auto key = key_from_js(obj.Get("upper"));
    if (!key)
      return std::unexpected(key.error());
    upper = std::move(*key);
  }

  if (!lower && !upper)
    return KeyRange::unbounded();
  if (lower && upper)
    return KeyRange::bound(std::move(*lower), std::move(*upper),
                           flag("lowerOpen"), flag("upperOpen"));
  if (lower)
    return KeyRange::lower_bound(std::move(*lower), flag("lowerOpen"));
  return KeyRange::upper_bound(std::move(*upper), flag("upperOpen"));
}

Result<KeyPath> key_path_from_js(const Napi::Value &js) {
  if (js.IsUndefined() || js.IsNull())
    return KeyPath{};
  if (js.IsString())
    return KeyPath(js.As<Napi::String>().Utf8Value());
  if (js.IsArray()) {
    auto arr = js.As<Napi::Array>();
    std::vector<std::string> paths;
    for (uint32_t i = 0; i < arr.Length(); ++i) {
      Napi::Value item = arr.Get(i);
      if (!item.IsString())
        return mockidb::make_error(ErrorKind::InvalidAccess,
                                   "Compound key paths hold strings only");
      paths.push_back(item.As<Napi::String>().Utf8Value());
    }
    return KeyPath::compound(std::move(paths));
  }
  return mockidb::make_error(ErrorKind::InvalidAccess,
                             "A key path is a string or an array of strings");
}

bool flag_of(const Napi::Object &obj, const char *name) {
  return obj.Has(name) && obj.Get(name).ToBoolean().Value();
}

/// { name, version?, stores: [{ name, keyPath?, autoIncrement?,
///   indexes?: [{ name, keyPath, options?: { unique, multiEntry } }],
///   data?: [{ key?, value }] }] }
Result<mockidb::DatabaseSchema> schema_from_js(const Napi::Object &js) {
  auto bad = [](const std::string &what) {
    return mockidb::make_error(ErrorKind::Data, "Invalid schema: " + what);
  };

  if (!js.Get("name").IsString())
    return bad("name must be a string");
  mockidb::DatabaseSchema schema{
      .name = js.Get("name").As<Napi::String>().Utf8Value()};
  if (Napi::Value version = js.Get("version"); !version.IsUndefined()) {
    double v = version.IsNumber() ? version.As<Napi::Number>().DoubleValue() : 0;
    if (!(v >= 1) || v != std::floor(v) || v > mockidb::MAX_GENERATED_KEY)
      return bad("version must be a positive integer");
    schema.version = static_cast<uint64_t>(v);
  }

  Napi::Value stores = js.Get("stores");
  if (!stores.IsArray())
    return bad("stores must be an array");

  auto store_list = stores.As<Napi::Array>();
  for (uint32_t s = 0; s < store_list.Length(); ++s) {
    Napi::Value entry = store_list.Get(s);
    if (!entry.IsObject() || !entry.As<Napi::Object>().Get("name").IsString())
      return bad("every store needs a name");
    auto obj = entry.As<Napi::Object>();

    mockidb::StoreSchema store{.name =
                                   obj.Get("name").As<Napi::String>().Utf8Value()};
    auto key_path = key_path_from_js(obj.Get("keyPath"));
    if (!key_path)
      return std::unexpected(key_path.error());
    store.options.key_path = std::move(*key_path);
    store.options.auto_increment = flag_of(obj, "autoIncrement");

    if (Napi::Value indexes = obj.Get("indexes"); indexes.IsArray()) {
      auto list = indexes.As<Napi::Array>();
      for (uint32_t i = 0; i < list.Length(); ++i) {
        Napi::Value spec_js = list.Get(i);
        if (!spec_js.IsObject() ||
            !spec_js.As<Napi::Object>().Get("name").IsString())
          return bad("every index needs a name");
        auto spec = spec_js.As<Napi::Object>();
        auto index_path = key_path_from_js(spec.Get("keyPath"));
        if (!index_path)
          return std::unexpected(index_path.error());
        mockidb::IndexOptions options;
        if (Napi::Value opts = spec.Get("options"); opts.IsObject()) {
          options.unique = flag_of(opts.As<Napi::Object>(), "unique");
          options.multi_entry = flag_of(opts.As<Napi::Object>(), "multiEntry");
        }
        store.indexes.push_back(
            {spec.Get("name").As<Napi::String>().Utf8Value(),
             std::move(*index_path), options});
      }
    }

    if (Napi::Value data = obj.Get("data"); data.IsArray()) {
      auto list = data.As<Napi::Array>();
      for (uint32_t i = 0; i < list.Length(); ++i) {
        Napi::Value item_js = list.Get(i);
        if (!item_js.IsObject())
          return bad("every data item must be an object {key?, value}");
        auto item = item_js.As<Napi::Object>();
        auto value = from_js(item.Get("value"));
        if (!value)
          return std::unexpected(value.error());
        mockidb::SeedRecord record{.value = std::move(*value)};
        if (Napi::Value key = item.Get("key"); !key.IsUndefined()) {
          auto parsed = key_from_js(key);
          if (!parsed)
            return std::unexpected(parsed.error());
          record.key = std::move(*parsed);
        }
        store.records.push_back(std::move(record));
      }
    }
    schema.stores.push_back(std::move(store));
  }
  return schema;
}

/// Records become a JS Map keyed by the record key.
Napi::Value records_to_js(Napi::Env env,
                          const mockidb::ObjectStore::Records &records) {
  Napi::Object map =
      env.Global().Get("Map").As<Napi::Function>().New({});
  Napi::Function set = map.Get("set").As<Napi::Function>();
  for (const auto &[key, value] : records)
    set.Call(map, {to_js(env, key.to_value()), to_js(env, value)});
  return map;
}

// ─────────────────────────────────────────────────────────────────────────────
// Per-operation outcome collected while the scheduler drains
// ─────────────────────────────────────────────────────────────────────────────

struct Outcome {
  bool done = false;
  bool ok = false;
  Value result;
  std::optional<Error> error;
};

Value result_value(const Key &key) { return key.to_value(); }
Value result_value(const std::optional<Key> &key) {
  return key ? key->to_value() : Value();
}
Value result_value(const std::optional<Value> &value) {
  return value.value_or(Value());
}
Value result_value(const std::vector<Value> &values) {
  return Value(Value::Array(values.begin(), values.end()));
}
Value result_value(const std::vector<Key> &keys) {
  Value::Array items;
  items.reserve(keys.size());
  for (const auto &key : keys)
    items.push_back(key.to_value());
  return Value(std::move(items));
}
Value result_value(uint64_t n) { return Value(n); }
Value result_value(std::monostate) { return Value(); }

template <class T>
void track(const std::shared_ptr<mockidb::Request<T>> &request,
           Outcome &outcome) {
  request->on_success([&outcome](mockidb::Request<T> &r) {
    outcome.done = true;
    outcome.ok = true;
    outcome.result = result_value(r.result());
  });
  request->on_error([&outcome](mockidb::Request<T> &r) {
    outcome.done = true;
    outcome.error = r.error();
  });
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// MockIndexedDB: Napi::ObjectWrap Class
// ═══════════════════════════════════════════════════════════════════════════════

class MockIndexedDB : public Napi::ObjectWrap<MockIndexedDB> {
public:
  static Napi::Object Init(Napi::Env env, Napi::Object exports) {
    Napi::Function func = DefineClass(
        env, "MockIndexedDB",
        {
            InstanceMethod<&MockIndexedDB::SeedDatabase>("seedDatabase"),
            InstanceMethod<&MockIndexedDB::GetStore>("getStore"),
            InstanceMethod<&MockIndexedDB::GetDatabase>("getDatabase"),
            InstanceMethod<&MockIndexedDB::GetAllDatabases>("getAllDatabases"),
            InstanceMethod<&MockIndexedDB::ClearAllDatabases>(
                "clearAllDatabases"),
            InstanceMethod<&MockIndexedDB::Databases>("databases"),
            InstanceMethod<&MockIndexedDB::DeleteDatabase>("deleteDatabase"),
            InstanceMethod<&MockIndexedDB::Cmp>("cmp"),
            InstanceMethod<&MockIndexedDB::Exec>("exec"),
            InstanceMethod<&MockIndexedDB::TraceHistory>("traceHistory"),
        });

    Napi::FunctionReference *constructor = new Napi::FunctionReference();
    *constructor = Napi::Persistent(func);
    env.SetInstanceData(constructor);

    exports.Set("MockIndexedDB", func);
    return exports;
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Constructor: MockIndexedDB(options?: { enableTrace?, maxTurns? })
  // ─────────────────────────────────────────────────────────────────────────

  MockIndexedDB(const Napi::CallbackInfo &info)
      : Napi::ObjectWrap<MockIndexedDB>(info),
        registry_(options_from(info)) {}

private:
  static mockidb::RegistryOptions options_from(const Napi::CallbackInfo &info) {
    mockidb::RegistryOptions options;
    if (info.Length() > 0 && info[0].IsObject()) {
      auto obj = info[0].As<Napi::Object>();
      if (obj.Has("enableTrace"))
        options.enable_trace = obj.Get("enableTrace").ToBoolean().Value();
      if (obj.Get("maxTurns").IsNumber())
        options.max_turns_per_drain =
            obj.Get("maxTurns").As<Napi::Number>().Uint32Value();
    }
    return options;
  }

  /// run_until_idle(), with the runaway-drain exception turned into a JS Error.
  bool Drain(Napi::Env env) {
    try {
      registry_.run_until_idle();
      return true;
    } catch (const std::exception &e) {
      registry_.scheduler().clear();
      Napi::Error::New(env, std::string("mockidb: ") + e.what())
          .ThrowAsJavaScriptException();
      return false;
    }
  }

  // ═══════════════════════════════════════════════════════════════════════
  // seedDatabase(schema) → undefined
  // ═══════════════════════════════════════════════════════════════════════

  Napi::Value SeedDatabase(const Napi::CallbackInfo &info) {
    Napi::Env env = info.Env();
    MOCKIDB_REQUIRE(env, info.Length() >= 1 && info[0].IsObject(),
                    "seedDatabase requires a schema object: "
                    "{ name, version?, stores }");

    auto schema = schema_from_js(info[0].As<Napi::Object>());
    MOCKIDB_CHECK(env, schema, "seedDatabase");
    auto seeded = registry_.seed(*schema);
    MOCKIDB_CHECK(env, seeded, "seedDatabase");
    return env.Undefined();
  }

  // ═══════════════════════════════════════════════════════════════════════
  // getStore(db, store) → Map<key, value> | undefined
  // ═══════════════════════════════════════════════════════════════════════

  Napi::Value GetStore(const Napi::CallbackInfo &info) {
    Napi::Env env = info.Env();
    MOCKIDB_REQUIRE(env,
                    info.Length() >= 2 && info[0].IsString() &&
                        info[1].IsString(),
                    "getStore requires 2 arguments: (db: string, store: string)");

    auto records = registry_.store_records(info[0].As<Napi::String>(),
                                           info[1].As<Napi::String>());
    if (!records)
      return env.Undefined();
    return records_to_js(env, *records);
  }

  // ═══════════════════════════════════════════════════════════════════════
  // getDatabase(db) → Map<store, Map<key, value>> | undefined
  // ═══════════════════════════════════════════════════════════════════════

  Napi::Value GetDatabase(const Napi::CallbackInfo &info) {
    Napi::Env env = info.Env();
    MOCKIDB_REQUIRE(env, info.Length() >= 1 && info[0].IsString(),
                    "getDatabase requires 1 argument: (db: string)");

    auto stores = registry_.database_records(info[0].As<Napi::String>());
    if (!stores)
      return env.Undefined();
    Napi::Object map = env.Global().Get("Map").As<Napi::Function>().New({});
    Napi::Function set = map.Get("set").As<Napi::Function>();
    for (const auto &[name, records] : *stores)
      set.Call(map, {Napi::String::New(env, name), records_to_js(env, records)});
    return map;
  }

  // ═══════════════════════════════════════════════════════════════════════
  // getAllDatabases() → Map<db, { version, stores: Map<store, Map> }>
  // ═══════════════════════════════════════════════════════════════════════

  Napi::Value GetAllDatabases(const Napi::CallbackInfo &info) {
    Napi::Env env = info.Env();
    Napi::Function map_ctor = env.Global().Get("Map").As<Napi::Function>();
    Napi::Object result = map_ctor.New({});
    Napi::Function set = result.Get("set").As<Napi::Function>();

    for (const auto &[name, dump] : registry_.all_databases()) {
      Napi::Object stores = map_ctor.New({});
      Napi::Function set_store = stores.Get("set").As<Napi::Function>();
      for (const auto &[store, records] : dump.stores)
        set_store.Call(stores, {Napi::String::New(env, store),
                                records_to_js(env, records)});

      Napi::Object entry = Napi::Object::New(env);
      entry.Set("version",
                Napi::Number::New(env, static_cast<double>(dump.version)));
      entry.Set("stores", stores);
      set.Call(result, {Napi::String::New(env, name), entry});
    }
    return result;
  }

  Napi::Value ClearAllDatabases(const Napi::CallbackInfo &info) {
    registry_.clear_all();
    return info.Env().Undefined();
  }

  // ═══════════════════════════════════════════════════════════════════════
  // databases() → Array<{ name, version }>
  // ═══════════════════════════════════════════════════════════════════════

  Napi::Value Databases(const Napi::CallbackInfo &info) {
    Napi::Env env = info.Env();
    auto request = registry_.databases();
    if (!Drain(env))
      return env.Undefined();

    const auto &infos = request->result();
    Napi::Array list = Napi::Array::New(env, infos.size());
    for (size_t i = 0; i < infos.size(); ++i) {
      Napi::Object obj = Napi::Object::New(env);
      obj.Set("name", Napi::String::New(env, infos[i].name));
      obj.Set("version",
              Napi::Number::New(env, static_cast<double>(infos[i].version)));
      list.Set(static_cast<uint32_t>(i), obj);
    }
    return list;
  }

  Napi::Value DeleteDatabase(const Napi::CallbackInfo &info) {
    Napi::Env env = info.Env();
    MOCKIDB_REQUIRE(env, info.Length() >= 1 && info[0].IsString(),
                    "deleteDatabase requires 1 argument: (name: string)");
    registry_.delete_database(info[0].As<Napi::String>());
    Drain(env);
    return env.Undefined();
  }

  // ═══════════════════════════════════════════════════════════════════════
  // cmp(a, b) → -1 | 0 | 1
  // ═══════════════════════════════════════════════════════════════════════

  Napi::Value Cmp(const Napi::CallbackInfo &info) {
    Napi::Env env = info.Env();
    MOCKIDB_REQUIRE(env, info.Length() >= 2, "cmp requires 2 arguments");

    auto a = from_js(info[0]);
    MOCKIDB_CHECK(env, a, "cmp");
    auto b = from_js(info[1]);
    MOCKIDB_CHECK(env, b, "cmp");
    auto order = registry_.cmp(*a, *b);
    MOCKIDB_CHECK(env, order, "cmp");
    return Napi::Number::New(env, *order);
  }

  // ═══════════════════════════════════════════════════════════════════════
  // exec(db, storeNames, mode, ops)
  //   ops: Array<{ op, store, index?, value?, key?, range?, count? }>
  //   → { results: Array<{ ok, result?, error? }>, outcome, error? }
  //
  // All ops are issued synchronously against one transaction, then the
  // scheduler is drained. A failing op aborts the transaction unless the
  // op sets `preventDefault: true`.
  // ═══════════════════════════════════════════════════════════════════════

  Napi::Value Exec(const Napi::CallbackInfo &info) {
    Napi::Env env = info.Env();
    MOCKIDB_REQUIRE(env,
                    info.Length() >= 4 && info[0].IsString() &&
                        info[1].IsArray() && info[2].IsString() &&
                        info[3].IsArray(),
                    "exec requires 4 arguments: (db: string, storeNames: "
                    "string[], mode: 'readonly' | 'readwrite', ops: object[])");

    std::string db_name = info[0].As<Napi::String>();
    std::vector<std::string> scope;
    auto names = info[1].As<Napi::Array>();
    for (uint32_t i = 0; i < names.Length(); ++i)
      scope.push_back(names.Get(i).ToString().Utf8Value());

    auto mode = mockidb::parse_mode(info[2].As<Napi::String>().Utf8Value());
    MOCKIDB_REQUIRE(env,
                    mode && *mode != mockidb::TransactionMode::VersionChange,
                    "mode must be 'readonly' or 'readwrite'");

    // Checked up front: once an op is issued its handlers point into
    // outcomes, so a bad op may only be found before the first issue.
    auto ops = info[3].As<Napi::Array>();
    for (uint32_t i = 0; i < ops.Length(); ++i)
      MOCKIDB_REQUIRE(env, ops.Get(i).IsObject(), "every op must be an object");

    MOCKIDB_REQUIRE(env, registry_.has_database(db_name),
                    "exec: no database named '" + db_name + "'");
    auto open = registry_.open(db_name);
    if (!Drain(env))
      return env.Undefined();
    if (auto err = open->error()) {
      make_js_error(env, *err, "open").ThrowAsJavaScriptException();
      return env.Undefined();
    }
    auto connection = open->result();

    auto txn = connection->transaction(scope, *mode);
    if (!txn)
      connection->close();
    MOCKIDB_CHECK(env, txn, "transaction");

    std::vector<Outcome> outcomes(ops.Length());
    for (uint32_t i = 0; i < ops.Length(); ++i) {
      auto issued = Issue(*txn, ops.Get(i).As<Napi::Object>(), outcomes[i]);
      if (!issued) {
        // Nothing from this batch may land.
        auto aborted = (*txn)->abort();
        Drain(env);
        connection->close();
        make_js_error(env, aborted ? issued.error() : aborted.error(), "exec")
            .ThrowAsJavaScriptException();
        return env.Undefined();
      }
    }

    bool drained = Drain(env);
    connection->close();
    if (!drained)
      return env.Undefined();

    Napi::Array results = Napi::Array::New(env, outcomes.size());
    for (size_t i = 0; i < outcomes.size(); ++i) {
      const Outcome &outcome = outcomes[i];
      Napi::Object obj = Napi::Object::New(env);
      obj.Set("ok", Napi::Boolean::New(env, outcome.ok));
      if (outcome.ok) {
        obj.Set("result", to_js(env, outcome.result));
      } else if (outcome.error) {
        obj.Set("error", ErrorObject(env, *outcome.error));
      }
      results.Set(static_cast<uint32_t>(i), obj);
    }

    Napi::Object summary = Napi::Object::New(env);
    summary.Set("results", results);
    bool committed =
        (*txn)->state() == mockidb::TransactionState::Committed;
    summary.Set("outcome",
                Napi::String::New(env, committed ? "complete" : "abort"));
    if (auto err = (*txn)->error())
      summary.Set("error", ErrorObject(env, *err));
    return summary;
  }

  static Napi::Object ErrorObject(Napi::Env env, const Error &err) {
    Napi::Object obj = Napi::Object::New(env);
    obj.Set("name", Napi::String::New(env, std::string(err.name())));
    obj.Set("message", Napi::String::New(env, err.message));
    return obj;
  }

  /// Issue one op. Argument errors are returned, engine errors land in
  /// the outcome once delivered.
  Result<void> Issue(const std::shared_ptr<mockidb::Transaction> &txn,
                     const Napi::Object &op, Outcome &outcome) {
    if (!op.Get("op").IsString() || !op.Get("store").IsString())
      return mockidb::make_error(ErrorKind::InvalidAccess,
                                 "every op needs string 'op' and 'store'");
    std::string name = op.Get("op").As<Napi::String>();
    auto store = txn->store(op.Get("store").As<Napi::String>());
    if (!store)
      return std::unexpected(store.error());

    std::optional<KeyRange> range;
    if (Napi::Value js = op.Has("range") ? op.Get("range") : op.Get("key");
        !js.IsUndefined()) {
      auto parsed = range_from_js(js);
      if (!parsed)
        return std::unexpected(parsed.error());
      range = std::move(*parsed);
    }
    uint32_t count =
        op.Get("count").IsNumber() ? op.Get("count").As<Napi::Number>().Uint32Value()
                                   : 0;

    if (name == "add" || name == "put") {
      auto value = from_js(op.Get("value"));
      if (!value)
        return std::unexpected(value.error());
      std::optional<Key> key;
      if (Napi::Value js = op.Get("key"); !js.IsUndefined()) {
        auto parsed = key_from_js(js);
        if (!parsed)
          return std::unexpected(parsed.error());
        key = std::move(*parsed);
      }
      Attach(name == "add" ? store->add(std::move(*value), std::move(key))
                           : store->put(std::move(*value), std::move(key)),
             op, outcome);
      return {};
    }
    if (name == "delete" || name == "clear") {
      if (name == "clear") {
        Attach(store->clear(), op, outcome);
        return {};
      }
      if (!range)
        return mockidb::make_error(ErrorKind::Data, "delete needs a key");
      Attach(store->remove(std::move(*range)), op, outcome);
      return {};
    }

    // Reads go through the index when one is named.
    if (Napi::Value index_name = op.Get("index"); index_name.IsString()) {
      auto index = store->index(index_name.As<Napi::String>());
      if (!index)
        return std::unexpected(index.error());
      return IssueRead(*index, name, std::move(range), count, op, outcome);
    }
    return IssueRead(*store, name, std::move(range), count, op, outcome);
  }

  template <class Source>
  Result<void> IssueRead(Source &source, const std::string &name,
                         std::optional<KeyRange> range, uint32_t count,
                         const Napi::Object &op, Outcome &outcome) {
    if (name == "getAll") {
      Attach(source.get_all(std::move(range), count), op, outcome);
    } else if (name == "getAllKeys") {
      Attach(source.get_all_keys(std::move(range), count), op, outcome);
    } else if (name == "count") {
      Attach(source.count(std::move(range)), op, outcome);
    } else if (name == "get" || name == "getKey") {
      if (!range)
        return mockidb::make_error(ErrorKind::Data, name + " needs a key");
      if (name == "get")
        Attach(source.get(std::move(*range)), op, outcome);
      else
        Attach(source.get_key(std::move(*range)), op, outcome);
    } else {
      return mockidb::make_error(ErrorKind::InvalidAccess,
                                 "unknown op '" + name + "'");
    }
    return {};
  }

  template <class T>
  static void Attach(const std::shared_ptr<mockidb::Request<T>> &request,
                     const Napi::Object &op, Outcome &outcome) {
    track(request, outcome);
    if (flag_of(op, "preventDefault"))
      request->on_error([](mockidb::Request<T> &r) { r.prevent_default(); });
  }

  // ═══════════════════════════════════════════════════════════════════════
  // traceHistory(source: string, limit?: number)
  //   → Array<{ id, prevId, turn, kind, text }>
  // ═══════════════════════════════════════════════════════════════════════

  Napi::Value TraceHistory(const Napi::CallbackInfo &info) {
    Napi::Env env = info.Env();
    MOCKIDB_REQUIRE(env, info.Length() >= 1 && info[0].IsString(),
                    "traceHistory requires (source: string, limit?: number)");
    size_t limit = 0;
    if (info.Length() > 1 && info[1].IsNumber())
      limit = info[1].As<Napi::Number>().Uint32Value();

    auto events =
        registry_.trace().get_history(info[0].As<Napi::String>(), limit);
    Napi::Array list = Napi::Array::New(env, events.size());
    for (size_t i = 0; i < events.size(); ++i) {
      const auto &evt = events[i];
      Napi::Object obj = Napi::Object::New(env);
      obj.Set("id", Napi::Number::New(env, static_cast<double>(evt.id)));
      obj.Set("prevId",
              Napi::Number::New(env, static_cast<double>(evt.prev_id)));
      obj.Set("turn", Napi::Number::New(env, static_cast<double>(evt.turn)));
      obj.Set("kind", Napi::String::New(
                          env, std::string(mockidb::trace_kind_name(evt.kind))));
      obj.Set("text", Napi::String::New(env, evt.text));
      list.Set(static_cast<uint32_t>(i), obj);
    }
    return list;
  }

  mockidb::Registry registry_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Module Registration
// ═══════════════════════════════════════════════════════════════════════════════

static Napi::Value EngineInfo(const Napi::CallbackInfo &info) {
  auto env = info.Env();
  auto engine = mockidb::core::get_engine_info();
  auto obj = Napi::Object::New(env);
  obj.Set("version", Napi::String::New(env, engine.version));
  obj.Set("maxGeneratedKey", Napi::Number::New(env, engine.max_generated_key));
  obj.Set("defaultMaxTurns",
          Napi::Number::New(env, static_cast<double>(engine.default_max_turns)));
  obj.Set("defaultTraceCapacity",
          Napi::Number::New(
              env, static_cast<double>(engine.default_trace_capacity)));
  obj.Set("traceEnabledByDefault",
          Napi::Boolean::New(env, engine.trace_enabled_by_default));
  obj.Set("summary", Napi::String::New(env, engine.to_string()));
  return obj;
}

static Napi::Object InitModule(Napi::Env env, Napi::Object exports) {
  MockIndexedDB::Init(env, exports);
  exports.Set("version",
              Napi::String::New(env, std::string(mockidb::core::version())));
  exports.Set("engineInfo", Napi::Function::New(env, EngineInfo, "engineInfo"));
  return exports;
}

NODE_API_MODULE(mockidb_node, InitModule)
