#pragma once

/**
 * @file trace.hpp
 * @brief Dispatch Trace: append-only log of delivered notifications.
 *
 * Every notification the scheduler delivers (request success/error,
 * transaction complete/abort, upgrade-needed, versionchange, close) is
 * appended as a TraceEvent with a monotonically increasing id.
 *
 * Per-source isolation is kept in source_tails_: a map of
 * source -> last event id. Each event stores the id of the previous event of
 * the same source (prev_id), so the history of one transaction or one open
 * request is a backward walk of that chain.
 *
 * Ids are contiguous, so resolving an id is an offset into the deque. When
 * the capacity is exceeded the oldest events are evicted and chains that
 * reach past them simply end.
 */

#include "mockidb/schema.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mockidb {

enum class TraceKind : uint8_t {
  RequestSuccess,
  RequestError,
  TransactionComplete,
  TransactionAbort,
  UpgradeNeeded,
  VersionChange,
  ConnectionClose
};

std::string_view trace_kind_name(TraceKind kind) noexcept;

struct TraceEvent {
  uint64_t id = 0;
  uint64_t prev_id = 0; ///< Previous event of the same source (0 = none)
  uint64_t turn = 0;    ///< Scheduler turn the notification fired in
  TraceKind kind = TraceKind::RequestSuccess;
  std::string source; ///< e.g. "txn:3", "open:shop", "db:shop#2"
  std::string text;   ///< Operation or error name
};

class DispatchTrace {
public:
  /**
   * @param capacity Maximum retained events (0 = unbounded)
   * @param enabled  When false, append_event() records nothing
   */
  explicit DispatchTrace(size_t capacity = DEFAULT_TRACE_CAPACITY,
                         bool enabled = true);

  DispatchTrace(const DispatchTrace &) = delete;
  DispatchTrace &operator=(const DispatchTrace &) = delete;

  /**
   * @brief Append an event for a source, linking it to the source's tail.
   * @return The new event id, or 0 when tracing is disabled
   */
  uint64_t append_event(std::string_view source, TraceKind kind,
                        std::string text, uint64_t turn);

  /**
   * @brief Walk a source's prev_id chain backwards.
   * @return Up to limit events, newest first
   */
  std::vector<TraceEvent> get_history(std::string_view source,
                                      size_t limit = 100) const;

  /// Retained events, oldest first.
  const std::deque<TraceEvent> &events() const noexcept { return events_; }

  size_t size() const noexcept { return events_.size(); }

  bool has_source(std::string_view source) const;

  /// Forget a source's tail pointer. Its events stay in the log.
  bool drop_source(std::string_view source);

  void clear();

  bool enabled() const noexcept { return enabled_; }
  void set_enabled(bool enabled) noexcept { enabled_ = enabled; }

private:
  /// O(1) id -> event, nullptr if evicted or never assigned.
  const TraceEvent *resolve_event(uint64_t event_id) const;

  std::deque<TraceEvent> events_;
  std::unordered_map<std::string, uint64_t> source_tails_;
  uint64_t next_event_id_ = 1;
  size_t capacity_;
  bool enabled_;
};

} // namespace mockidb
