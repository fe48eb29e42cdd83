#pragma once

/**
 * @file value.hpp
 * @brief Structured values stored in object stores.
 *
 * A Value is a closed variant over the shapes a structured-clone payload can
 * take: undefined, null, bool, number, string, date, binary, array and
 * object. Key path evaluation and multi-entry fan-out are plain traversals
 * over this variant (see key_path.hpp).
 *
 * Values are copied on every write, so the record table never aliases a
 * caller's object.
 */

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace mockidb {

/// Point in time, stored as milliseconds since the Unix epoch.
struct Date {
  double epoch_ms = 0.0;

  bool operator==(const Date &) const = default;
};

/// Raw byte payload (ArrayBuffer / typed array contents).
using Binary = std::vector<uint8_t>;

/// Marker for the absent value.
struct Undefined {
  bool operator==(const Undefined &) const = default;
};

class Value {
public:
  using Array = std::vector<Value>;
  using Object = std::map<std::string, Value, std::less<>>;

  enum class Type : uint8_t {
    Undefined,
    Null,
    Bool,
    Number,
    String,
    Date,
    Binary,
    Array,
    Object
  };

  Value() = default;
  Value(Undefined) {}
  Value(std::nullptr_t) : data_(nullptr) {}
  Value(bool b) : data_(b) {}

  template <class T>
    requires(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
  Value(T n) : data_(static_cast<double>(n)) {}

  Value(std::string s) : data_(std::move(s)) {}
  Value(std::string_view s) : data_(std::string(s)) {}
  Value(const char *s) : data_(std::string(s)) {}
  Value(Date d) : data_(d) {}
  Value(Binary b) : data_(std::move(b)) {}
  Value(Array a) : data_(std::move(a)) {}
  Value(Object o) : data_(std::move(o)) {}

  /// Build an array value from a braced list.
  static Value array(std::initializer_list<Value> items);

  /// Build an object value from a braced list of (member, value) pairs.
  static Value
  object(std::initializer_list<std::pair<const std::string, Value>> members);

  Type type() const noexcept { return static_cast<Type>(data_.index()); }

  bool is_undefined() const noexcept { return type() == Type::Undefined; }
  bool is_null() const noexcept { return type() == Type::Null; }
  bool is_bool() const noexcept { return type() == Type::Bool; }
  bool is_number() const noexcept { return type() == Type::Number; }
  bool is_string() const noexcept { return type() == Type::String; }
  bool is_date() const noexcept { return type() == Type::Date; }
  bool is_binary() const noexcept { return type() == Type::Binary; }
  bool is_array() const noexcept { return type() == Type::Array; }
  bool is_object() const noexcept { return type() == Type::Object; }

  // Accessors throw std::bad_variant_access on a type mismatch.
  bool as_bool() const { return std::get<bool>(data_); }
  double as_number() const { return std::get<double>(data_); }
  const std::string &as_string() const { return std::get<std::string>(data_); }
  Date as_date() const { return std::get<Date>(data_); }
  const Binary &as_binary() const { return std::get<Binary>(data_); }
  const Array &as_array() const { return std::get<Array>(data_); }
  Array &as_array() { return std::get<Array>(data_); }
  const Object &as_object() const { return std::get<Object>(data_); }
  Object &as_object() { return std::get<Object>(data_); }

  /// Member lookup on an object value. nullptr if absent or not an object.
  const Value *find(std::string_view member) const;
  Value *find(std::string_view member);

  /**
   * @brief Member access that creates the member if needed.
   *
   * An undefined value is promoted to an empty object first. Throws
   * std::bad_variant_access if the value is some other non-object type.
   */
  Value &operator[](std::string_view member);

  /// JSON-like rendering for diagnostics and test failure output.
  std::string to_string() const;

  bool operator==(const Value &) const = default;

private:
  std::variant<Undefined, std::nullptr_t, bool, double, std::string, Date,
               Binary, Array, Object>
      data_;
};

/// gtest pretty-printer hook.
void PrintTo(const Value &value, std::ostream *os);

} // namespace mockidb
