#include "mockidb/schema.hpp"

namespace mockidb {

std::string_view mode_name(TransactionMode mode) noexcept {
  switch (mode) {
  case TransactionMode::ReadOnly:
    return "readonly";
  case TransactionMode::ReadWrite:
    return "readwrite";
  case TransactionMode::VersionChange:
    return "versionchange";
  }
  return "unknown";
}

std::optional<TransactionMode> parse_mode(std::string_view name) noexcept {
  if (name == "readonly")
    return TransactionMode::ReadOnly;
  if (name == "readwrite")
    return TransactionMode::ReadWrite;
  if (name == "versionchange")
    return TransactionMode::VersionChange;
  return std::nullopt;
}

std::string_view state_name(TransactionState state) noexcept {
  switch (state) {
  case TransactionState::Active:
    return "active";
  case TransactionState::Committing:
    return "committing";
  case TransactionState::Committed:
    return "committed";
  case TransactionState::Aborted:
    return "aborted";
  }
  return "unknown";
}

std::string_view direction_name(CursorDirection direction) noexcept {
  switch (direction) {
  case CursorDirection::Next:
    return "next";
  case CursorDirection::NextUnique:
    return "nextunique";
  case CursorDirection::Prev:
    return "prev";
  case CursorDirection::PrevUnique:
    return "prevunique";
  }
  return "unknown";
}

std::optional<CursorDirection> parse_direction(std::string_view name) noexcept {
  if (name == "next")
    return CursorDirection::Next;
  if (name == "nextunique")
    return CursorDirection::NextUnique;
  if (name == "prev")
    return CursorDirection::Prev;
  if (name == "prevunique")
    return CursorDirection::PrevUnique;
  return std::nullopt;
}

} // namespace mockidb
