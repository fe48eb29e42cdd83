#include "mockidb/trace.hpp"

#include <algorithm>

namespace mockidb {

std::string_view trace_kind_name(TraceKind kind) noexcept {
  switch (kind) {
  case TraceKind::RequestSuccess:
    return "success";
  case TraceKind::RequestError:
    return "error";
  case TraceKind::TransactionComplete:
    return "complete";
  case TraceKind::TransactionAbort:
    return "abort";
  case TraceKind::UpgradeNeeded:
    return "upgradeneeded";
  case TraceKind::VersionChange:
    return "versionchange";
  case TraceKind::ConnectionClose:
    return "close";
  }
  return "unknown";
}

DispatchTrace::DispatchTrace(size_t capacity, bool enabled)
    : capacity_(capacity), enabled_(enabled) {}

// ===========================================================================
// Append
// ===========================================================================

uint64_t DispatchTrace::append_event(std::string_view source, TraceKind kind,
                                     std::string text, uint64_t turn) {
  if (!enabled_)
    return 0;

  std::string key(source);
  uint64_t prev_id = 0;
  if (auto it = source_tails_.find(key); it != source_tails_.end())
    prev_id = it->second;

  TraceEvent ev;
  ev.id = next_event_id_++;
  ev.prev_id = prev_id;
  ev.turn = turn;
  ev.kind = kind;
  ev.source = key;
  ev.text = std::move(text);

  source_tails_[std::move(key)] = ev.id;
  events_.push_back(std::move(ev));

  if (capacity_ > 0 && events_.size() > capacity_)
    events_.pop_front();

  return events_.back().id;
}

// ===========================================================================
// History
// ===========================================================================

const TraceEvent *DispatchTrace::resolve_event(uint64_t event_id) const {
  if (event_id == 0 || events_.empty())
    return nullptr;
  uint64_t first = events_.front().id;
  if (event_id < first || event_id - first >= events_.size())
    return nullptr;
  return &events_[event_id - first];
}

std::vector<TraceEvent> DispatchTrace::get_history(std::string_view source,
                                                   size_t limit) const {
  auto it = source_tails_.find(std::string(source));
  if (it == source_tails_.end())
    return {};

  std::vector<TraceEvent> result;
  result.reserve(std::min(limit, size_t{256}));

  uint64_t current_id = it->second;
  while (current_id != 0 && result.size() < limit) {
    const TraceEvent *ev = resolve_event(current_id);
    if (!ev)
      break;
    result.push_back(*ev);
    current_id = ev->prev_id;
  }
  return result;
}

bool DispatchTrace::has_source(std::string_view source) const {
  return source_tails_.contains(std::string(source));
}

bool DispatchTrace::drop_source(std::string_view source) {
  return source_tails_.erase(std::string(source)) > 0;
}

void DispatchTrace::clear() {
  events_.clear();
  source_tails_.clear();
}

} // namespace mockidb
