#include "mockidb/value.hpp"

#include <cmath>
#include <cstdio>
#include <format>
#include <ostream>

namespace mockidb {

namespace {

void append_quoted(std::string &out, std::string_view s) {
  out += '"';
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out += c;
    }
  }
  out += '"';
}

void append_number(std::string &out, double n) {
  if (std::isnan(n)) {
    out += "NaN";
  } else if (std::isinf(n)) {
    out += n > 0 ? "Infinity" : "-Infinity";
  } else {
    out += std::format("{}", n);
  }
}

void render(std::string &out, const Value &v) {
  switch (v.type()) {
  case Value::Type::Undefined:
    out += "undefined";
    break;
  case Value::Type::Null:
    out += "null";
    break;
  case Value::Type::Bool:
    out += v.as_bool() ? "true" : "false";
    break;
  case Value::Type::Number:
    append_number(out, v.as_number());
    break;
  case Value::Type::String:
    append_quoted(out, v.as_string());
    break;
  case Value::Type::Date:
    out += "Date(";
    append_number(out, v.as_date().epoch_ms);
    out += ')';
    break;
  case Value::Type::Binary: {
    out += "Binary[";
    bool first = true;
    for (uint8_t b : v.as_binary()) {
      if (!first)
        out += ' ';
      out += std::format("{:02x}", b);
      first = false;
    }
    out += ']';
    break;
  }
  case Value::Type::Array: {
    out += '[';
    bool first = true;
    for (const auto &item : v.as_array()) {
      if (!first)
        out += ',';
      render(out, item);
      first = false;
    }
    out += ']';
    break;
  }
  case Value::Type::Object: {
    out += '{';
    bool first = true;
    for (const auto &[name, member] : v.as_object()) {
      if (!first)
        out += ',';
      append_quoted(out, name);
      out += ':';
      render(out, member);
      first = false;
    }
    out += '}';
    break;
  }
  }
}

} // namespace

Value Value::array(std::initializer_list<Value> items) {
  return Value(Array(items));
}

Value Value::object(
    std::initializer_list<std::pair<const std::string, Value>> members) {
  return Value(Object(members));
}

const Value *Value::find(std::string_view member) const {
  if (!is_object())
    return nullptr;
  const auto &obj = as_object();
  auto it = obj.find(member);
  return it == obj.end() ? nullptr : &it->second;
}

Value *Value::find(std::string_view member) {
  if (!is_object())
    return nullptr;
  auto &obj = as_object();
  auto it = obj.find(member);
  return it == obj.end() ? nullptr : &it->second;
}

Value &Value::operator[](std::string_view member) {
  if (is_undefined())
    data_ = Object{};
  auto &obj = as_object();
  auto it = obj.find(member);
  if (it == obj.end())
    it = obj.emplace(std::string(member), Value{}).first;
  return it->second;
}

std::string Value::to_string() const {
  std::string out;
  render(out, *this);
  return out;
}

void PrintTo(const Value &value, std::ostream *os) { *os << value.to_string(); }

} // namespace mockidb
