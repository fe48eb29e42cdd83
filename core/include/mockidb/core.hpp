#pragma once

/**
 * @file core.hpp
 * @brief Library version and the engine's compiled-in limits.
 */

#include <cstddef>
#include <string>
#include <string_view>

namespace mockidb::core {

/// Defaults a Registry starts from, plus the key generator ceiling.
struct EngineInfo {
  std::string version;
  double max_generated_key = 0;
  size_t default_max_turns = 0;
  size_t default_trace_capacity = 0;
  bool trace_enabled_by_default = true;

  /// One line, e.g. "mockidb 0.3.0 (keys <= 2^53, 100000 turns/drain, ...)".
  std::string to_string() const;
};

std::string_view version() noexcept;

EngineInfo get_engine_info();

} // namespace mockidb::core
