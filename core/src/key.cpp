#include "mockidb/key.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <ostream>
#include <stdexcept>

namespace mockidb {

// ===========================================================================
// Construction
// ===========================================================================

Key::Key(double n, int) : data_(n) {
  if (std::isnan(n))
    throw std::invalid_argument("NaN is not a valid key");
}

Key::Key(Date d) : data_(d) {
  if (std::isnan(d.epoch_ms))
    throw std::invalid_argument("An invalid date is not a valid key");
}

std::optional<Key> Key::from_value(const Value &value) {
  switch (value.type()) {
  case Value::Type::Number:
    if (std::isnan(value.as_number()))
      return std::nullopt;
    return Key(value.as_number());
  case Value::Type::Date:
    if (std::isnan(value.as_date().epoch_ms))
      return std::nullopt;
    return Key(value.as_date());
  case Value::Type::String:
    return Key(value.as_string());
  case Value::Type::Binary:
    return Key(value.as_binary());
  case Value::Type::Array: {
    Array items;
    items.reserve(value.as_array().size());
    for (const auto &item : value.as_array()) {
      auto key = from_value(item);
      if (!key)
        return std::nullopt;
      items.push_back(std::move(*key));
    }
    return Key(std::move(items));
  }
  default:
    return std::nullopt;
  }
}

Value Key::to_value() const {
  switch (type()) {
  case Type::Number:
    return Value(as_number());
  case Type::Date:
    return Value(as_date());
  case Type::String:
    return Value(as_string());
  case Type::Binary:
    return Value(as_binary());
  case Type::Array: {
    Value::Array items;
    items.reserve(as_array().size());
    for (const auto &item : as_array())
      items.push_back(item.to_value());
    return Value(std::move(items));
  }
  }
  return Value();
}

std::string Key::to_string() const { return to_value().to_string(); }

// ===========================================================================
// Ordering
// ===========================================================================

int compare_keys(const Key &a, const Key &b) noexcept {
  if (a.type() != b.type())
    return a.type() < b.type() ? -1 : 1;

  switch (a.type()) {
  case Key::Type::Number: {
    double x = a.as_number(), y = b.as_number();
    return x < y ? -1 : (x > y ? 1 : 0);
  }
  case Key::Type::Date: {
    double x = a.as_date().epoch_ms, y = b.as_date().epoch_ms;
    return x < y ? -1 : (x > y ? 1 : 0);
  }
  case Key::Type::String: {
    int c = a.as_string().compare(b.as_string());
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
  }
  case Key::Type::Binary: {
    const auto &x = a.as_binary();
    const auto &y = b.as_binary();
    if (std::lexicographical_compare(x.begin(), x.end(), y.begin(), y.end()))
      return -1;
    if (std::lexicographical_compare(y.begin(), y.end(), x.begin(), x.end()))
      return 1;
    return 0;
  }
  case Key::Type::Array: {
    const auto &x = a.as_array();
    const auto &y = b.as_array();
    size_t n = std::min(x.size(), y.size());
    for (size_t i = 0; i < n; ++i) {
      int c = compare_keys(x[i], y[i]);
      if (c != 0)
        return c;
    }
    return x.size() < y.size() ? -1 : (x.size() > y.size() ? 1 : 0);
  }
  }
  return 0;
}

std::strong_ordering Key::operator<=>(const Key &other) const {
  int c = compare_keys(*this, other);
  if (c < 0)
    return std::strong_ordering::less;
  if (c > 0)
    return std::strong_ordering::greater;
  return std::strong_ordering::equal;
}

bool Key::operator==(const Key &other) const {
  return compare_keys(*this, other) == 0;
}

void PrintTo(const Key &key, std::ostream *os) { *os << key.to_string(); }

// ===========================================================================
// KeyRange
// ===========================================================================

Result<KeyRange> KeyRange::bound(Key lower, Key upper, bool lower_open,
                                 bool upper_open) {
  int c = compare_keys(lower, upper);
  if (c > 0)
    return make_error(ErrorKind::Data,
                      "The lower key is greater than the upper key");
  if (c == 0 && (lower_open || upper_open))
    return make_error(ErrorKind::Data,
                      "Equal bounds cannot be open on either side");

  KeyRange range;
  range.lower_ = std::move(lower);
  range.upper_ = std::move(upper);
  range.lower_open_ = lower_open;
  range.upper_open_ = upper_open;
  return range;
}

KeyRange KeyRange::lower_bound(Key lower, bool open) {
  KeyRange range;
  range.lower_ = std::move(lower);
  range.lower_open_ = open;
  return range;
}

KeyRange KeyRange::upper_bound(Key upper, bool open) {
  KeyRange range;
  range.upper_ = std::move(upper);
  range.upper_open_ = open;
  return range;
}

bool KeyRange::is_below(const Key &key) const {
  if (!lower_)
    return false;
  int c = compare_keys(key, *lower_);
  return c < 0 || (c == 0 && lower_open_);
}

bool KeyRange::is_above(const Key &key) const {
  if (!upper_)
    return false;
  int c = compare_keys(key, *upper_);
  return c > 0 || (c == 0 && upper_open_);
}

bool KeyRange::includes(const Key &key) const {
  return !is_below(key) && !is_above(key);
}

std::string KeyRange::to_string() const {
  return std::format("{}{}, {}{}", lower_open_ ? '(' : '[',
                     lower_ ? lower_->to_string() : "-inf",
                     upper_ ? upper_->to_string() : "+inf",
                     upper_open_ ? ')' : ']');
}

} // namespace mockidb
