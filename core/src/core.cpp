#include "mockidb/core.hpp"
#include "mockidb/schema.hpp"

#include <format>

namespace mockidb::core {

std::string_view version() noexcept { return "0.3.0"; }

EngineInfo get_engine_info() {
  RegistryOptions defaults;
  return EngineInfo{.version = std::string(version()),
                    .max_generated_key = MAX_GENERATED_KEY,
                    .default_max_turns = defaults.max_turns_per_drain,
                    .default_trace_capacity = defaults.trace_capacity,
                    .trace_enabled_by_default = defaults.enable_trace};
}

std::string EngineInfo::to_string() const {
  std::string trace =
      default_trace_capacity == 0
          ? std::string("unbounded trace")
          : std::format("trace keeps {} events", default_trace_capacity);
  return std::format("mockidb {} (keys <= {:.0f}, {} turns/drain, {}, trace {})",
                     version, max_generated_key, default_max_turns, trace,
                     trace_enabled_by_default ? "on" : "off");
}

} // namespace mockidb::core
