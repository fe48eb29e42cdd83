#include "mockidb/error.hpp"

namespace mockidb {

std::string_view error_name(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::NotFound:
    return "NotFoundError";
  case ErrorKind::Constraint:
    return "ConstraintError";
  case ErrorKind::Data:
    return "DataError";
  case ErrorKind::InvalidState:
    return "InvalidStateError";
  case ErrorKind::ReadOnly:
    return "ReadOnlyError";
  case ErrorKind::InvalidAccess:
    return "InvalidAccessError";
  case ErrorKind::Version:
    return "VersionError";
  case ErrorKind::Abort:
    return "AbortError";
  }
  return "UnknownError";
}

std::string Error::to_string() const {
  std::string out(name());
  if (!message.empty()) {
    out += ": ";
    out += message;
  }
  return out;
}

} // namespace mockidb
