#pragma once

#include "mockidb/key_path.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace mockidb {

// ═══════════════════════════════════════════════════════════════════════════
// Limits & Defaults
// ═══════════════════════════════════════════════════════════════════════════

/// Largest key a generator may hand out (2^53). Past it, writes that need a
/// generated key fail with ConstraintError.
constexpr double MAX_GENERATED_KEY = 9007199254740992.0;

/// Default cap on turns executed by a single run_until_idle() call.
constexpr size_t DEFAULT_MAX_TURNS = 100000;

/// Default retained event count of the dispatch trace (0 = unbounded).
constexpr size_t DEFAULT_TRACE_CAPACITY = 65536;

// ═══════════════════════════════════════════════════════════════════════════
// Enumerations
// ═══════════════════════════════════════════════════════════════════════════

enum class TransactionMode : uint8_t { ReadOnly, ReadWrite, VersionChange };

/// active -> committing -> committed | aborted (active may abort directly).
enum class TransactionState : uint8_t { Active, Committing, Committed, Aborted };

enum class CursorDirection : uint8_t { Next, NextUnique, Prev, PrevUnique };

enum class ReadyState : uint8_t { Pending, Done };

/// "readonly", "readwrite", "versionchange"
std::string_view mode_name(TransactionMode mode) noexcept;
std::optional<TransactionMode> parse_mode(std::string_view name) noexcept;

std::string_view state_name(TransactionState state) noexcept;

/// "next", "nextunique", "prev", "prevunique"
std::string_view direction_name(CursorDirection direction) noexcept;
std::optional<CursorDirection> parse_direction(std::string_view name) noexcept;

constexpr bool is_reverse(CursorDirection d) noexcept {
  return d == CursorDirection::Prev || d == CursorDirection::PrevUnique;
}

constexpr bool is_unique(CursorDirection d) noexcept {
  return d == CursorDirection::NextUnique || d == CursorDirection::PrevUnique;
}

// ═══════════════════════════════════════════════════════════════════════════
// Option Structs
// ═══════════════════════════════════════════════════════════════════════════

struct StoreOptions {
  KeyPath key_path;
  bool auto_increment = false;
};

struct IndexOptions {
  bool unique = false;
  bool multi_entry = false;
};

struct RegistryOptions {
  /// run_until_idle() throws std::runtime_error past this many turns.
  size_t max_turns_per_drain = DEFAULT_MAX_TURNS;
  bool enable_trace = true;
  /// Retained trace events (0 = unbounded).
  size_t trace_capacity = DEFAULT_TRACE_CAPACITY;
};

} // namespace mockidb
