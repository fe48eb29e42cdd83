#include "mockidb/scheduler.hpp"
#include "mockidb/request.hpp"

#include <format>
#include <stdexcept>

namespace mockidb {

Scheduler::Scheduler(const RegistryOptions &options)
    : max_turns_(options.max_turns_per_drain),
      trace_(options.trace_capacity, options.enable_trace) {}

void Scheduler::post(Task task) { tasks_.push_back(std::move(task)); }

bool Scheduler::run_one() {
  if (tasks_.empty())
    return false;
  Task task = std::move(tasks_.front());
  tasks_.pop_front();
  ++turn_;
  task();
  return true;
}

size_t Scheduler::run_until_idle() {
  size_t turns = 0;
  while (!tasks_.empty()) {
    if (turns >= max_turns_)
      throw std::runtime_error(std::format(
          "Scheduler still had {} queued tasks after {} turns; a handler is "
          "probably re-issuing work forever",
          tasks_.size(), turns));
    run_one();
    ++turns;
  }
  return turns;
}

void Scheduler::clear() {
  // Swapped out first: task destructors must not see a half-cleared queue.
  std::deque<Task> dropped;
  dropped.swap(tasks_);
}

// ===========================================================================
// Request Delivery
// ===========================================================================

void Scheduler::dispatch(RequestBase &request, std::string_view source) {
  request.mark_done();
  if (request.failed()) {
    record(source, TraceKind::RequestError,
           std::format("{} {}", request.operation(),
                       request.outcome_error()->name()));
  } else {
    record(source, TraceKind::RequestSuccess, request.operation());
  }
  request.notify();
}

void Scheduler::deliver(std::shared_ptr<RequestBase> request,
                        std::string source) {
  post([this, request = std::move(request), source = std::move(source)] {
    dispatch(*request, source);
  });
}

void Scheduler::record(std::string_view source, TraceKind kind,
                       std::string text) {
  trace_.append_event(source, kind, std::move(text), turn_);
}

} // namespace mockidb
