#pragma once

/**
 * @file scheduler.hpp
 * @brief Single-threaded turn queue for deferred notifications.
 *
 * Mutations apply synchronously on the call; notifications are posted here
 * and fire only when the harness drains the queue. One task = one turn.
 * Tasks run in FIFO order, which is what gives requests of one transaction
 * their issuance-order delivery.
 */

#include "mockidb/schema.hpp"
#include "mockidb/trace.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace mockidb {

class RequestBase;

class Scheduler {
public:
  using Task = std::function<void()>;

  explicit Scheduler(const RegistryOptions &options = {});

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  void post(Task task);

  /// Run the oldest task. Returns false if the queue was empty.
  bool run_one();

  /**
   * @brief Run tasks until the queue is empty.
   * @return Number of turns executed
   * @throws std::runtime_error if the queue is still non-empty after
   *         max_turns_per_drain turns
   */
  size_t run_until_idle();

  bool idle() const noexcept { return tasks_.empty(); }
  size_t pending() const noexcept { return tasks_.size(); }

  /// Turns executed so far.
  uint64_t turn() const noexcept { return turn_; }

  /// Drop every queued task without running it.
  void clear();

  /// Ids for requests, transactions and connections.
  uint64_t next_serial() noexcept { return next_serial_++; }

  /// Mark a request done, trace it and fire its handlers, in this turn.
  void dispatch(RequestBase &request, std::string_view source);

  /// dispatch() in a later turn.
  void deliver(std::shared_ptr<RequestBase> request, std::string source);

  void record(std::string_view source, TraceKind kind, std::string text);

  DispatchTrace &trace() noexcept { return trace_; }
  const DispatchTrace &trace() const noexcept { return trace_; }

private:
  std::deque<Task> tasks_;
  uint64_t turn_ = 0;
  uint64_t next_serial_ = 1;
  size_t max_turns_;
  DispatchTrace trace_;
};

} // namespace mockidb
