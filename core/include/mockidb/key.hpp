#pragma once

/**
 * @file key.hpp
 * @brief Primary/index keys, their total order, and key ranges.
 *
 * Valid keys and their ordering across types:
 *
 *   number  <  date  <  string  <  binary  <  array
 *
 * Within a type: numbers numerically (NaN is never a key), dates by epoch
 * milliseconds, strings by byte, binary lexicographically by byte, arrays
 * element-wise and then by length. Any other Value shape (bool, null,
 * undefined, object) is not a key.
 */

#include "mockidb/error.hpp"
#include "mockidb/value.hpp"

#include <compare>
#include <concepts>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace mockidb {

class Key {
public:
  using Array = std::vector<Key>;

  /// Declaration order is the cross-type sort order.
  enum class Type : uint8_t { Number, Date, String, Binary, Array };

  /// Throws std::invalid_argument for NaN.
  template <class T>
    requires(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
  Key(T n) : Key(static_cast<double>(n), 0) {}

  Key(std::string s) : data_(std::move(s)) {}
  Key(std::string_view s) : data_(std::string(s)) {}
  Key(const char *s) : data_(std::string(s)) {}
  /// Throws std::invalid_argument for an invalid (NaN) date.
  Key(Date d);
  Key(Binary b) : data_(std::move(b)) {}
  Key(Array a) : data_(std::move(a)) {}

  static Key array(std::initializer_list<Key> items) { return Key(Array(items)); }

  /// Convert a structured value to a key; nullopt if it is not a valid key.
  static std::optional<Key> from_value(const Value &value);

  Value to_value() const;

  Type type() const noexcept { return static_cast<Type>(data_.index()); }
  bool is_number() const noexcept { return type() == Type::Number; }
  bool is_date() const noexcept { return type() == Type::Date; }
  bool is_string() const noexcept { return type() == Type::String; }
  bool is_binary() const noexcept { return type() == Type::Binary; }
  bool is_array() const noexcept { return type() == Type::Array; }

  double as_number() const { return std::get<double>(data_); }
  Date as_date() const { return std::get<Date>(data_); }
  const std::string &as_string() const { return std::get<std::string>(data_); }
  const Binary &as_binary() const { return std::get<Binary>(data_); }
  const Array &as_array() const { return std::get<Array>(data_); }

  std::string to_string() const;

  std::strong_ordering operator<=>(const Key &other) const;
  bool operator==(const Key &other) const;

private:
  Key(double n, int);

  std::variant<double, Date, std::string, Binary, Array> data_;
};

/// Three-way key comparison: negative, zero or positive.
int compare_keys(const Key &a, const Key &b) noexcept;

void PrintTo(const Key &key, std::ostream *os);

/**
 * @brief A single key or a lower/upper bound pair with open/closed flags.
 *
 * Either bound may be absent (unbounded). Any key-convertible argument
 * converts implicitly to an "only" range, so store.get(1) and
 * store.get(KeyRange::bound(1, 5).value()) go through the same overload.
 */
class KeyRange {
public:
  template <class T>
    requires std::constructible_from<Key, T>
  KeyRange(T &&key)
      : lower_(Key(std::forward<T>(key))), upper_(lower_), lower_open_(false),
        upper_open_(false) {}

  static KeyRange only(Key key) { return KeyRange(std::move(key)); }

  /// DataError if lower > upper, or lower == upper with either side open.
  static Result<KeyRange> bound(Key lower, Key upper, bool lower_open = false,
                                bool upper_open = false);

  static KeyRange lower_bound(Key lower, bool open = false);
  static KeyRange upper_bound(Key upper, bool open = false);

  /// Matches every key.
  static KeyRange unbounded() { return KeyRange(); }

  const std::optional<Key> &lower() const noexcept { return lower_; }
  const std::optional<Key> &upper() const noexcept { return upper_; }
  bool lower_open() const noexcept { return lower_open_; }
  bool upper_open() const noexcept { return upper_open_; }

  bool includes(const Key &key) const;
  /// True when key sorts before every key in the range.
  bool is_below(const Key &key) const;
  /// True when key sorts after every key in the range.
  bool is_above(const Key &key) const;

  std::string to_string() const;

private:
  KeyRange() = default;

  std::optional<Key> lower_;
  std::optional<Key> upper_;
  bool lower_open_ = false;
  bool upper_open_ = false;
};

} // namespace mockidb
