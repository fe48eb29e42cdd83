#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace mockidb {

/**
 * @brief Failure kinds surfaced through request error state and Result.
 *
 * Each kind maps onto the DOMException name the emulated platform reports
 * (see error_name()).
 */
enum class ErrorKind : uint8_t {
  NotFound,      ///< Missing database, store, index or key
  Constraint,    ///< Duplicate primary key on add, unique index collision
  Data,          ///< No key resolvable, invalid key, bad range or argument
  InvalidState,  ///< Finished transaction, out-of-scope store, closed handle
  ReadOnly,      ///< Write issued in a readonly transaction
  InvalidAccess, ///< Invalid option combination (key path + autoIncrement)
  Version,       ///< Open requested a version lower than the stored one
  Abort          ///< Request belonged to a transaction that was aborted
};

/// DOMException-style name, e.g. "ConstraintError".
std::string_view error_name(ErrorKind kind) noexcept;

struct Error {
  ErrorKind kind;
  std::string message;

  std::string_view name() const noexcept { return error_name(kind); }

  /// "ConstraintError: Key already exists in the object store"
  std::string to_string() const;

  bool operator==(const Error &) const = default;
};

template <class T> using Result = std::expected<T, Error>;

inline std::unexpected<Error> make_error(ErrorKind kind, std::string message) {
  return std::unexpected(Error{kind, std::move(message)});
}

} // namespace mockidb
