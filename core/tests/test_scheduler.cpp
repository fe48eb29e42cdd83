/**
 * @file test_scheduler.cpp
 * @brief Unit tests for the turn queue and the dispatch trace.
 */

#include "mockidb/request.hpp"
#include "mockidb/scheduler.hpp"
#include "mockidb/trace.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mockidb;

// ═══════════════════════════════════════════════════════════════════════════
// Scheduler
// ═══════════════════════════════════════════════════════════════════════════

TEST(SchedulerTest, RunsTasksInFifoOrderOnePerTurn) {
  Scheduler scheduler;
  std::vector<int> order;
  scheduler.post([&] { order.push_back(1); });
  scheduler.post([&] {
    order.push_back(2);
    scheduler.post([&] { order.push_back(4); });
  });
  scheduler.post([&] { order.push_back(3); });

  EXPECT_EQ(scheduler.pending(), 3u);
  EXPECT_TRUE(scheduler.run_one());
  EXPECT_EQ(scheduler.turn(), 1u);
  EXPECT_EQ(scheduler.run_until_idle(), 3u);
  EXPECT_TRUE(scheduler.idle());
  EXPECT_FALSE(scheduler.run_one());
  EXPECT_EQ(order, (std::vector<int>{1, 2, 3, 4}));
}

TEST(SchedulerTest, RunawayDrainThrows) {
  RegistryOptions options;
  options.max_turns_per_drain = 50;
  Scheduler scheduler(options);

  std::function<void()> forever = [&] { scheduler.post(forever); };
  scheduler.post(forever);
  EXPECT_THROW(scheduler.run_until_idle(), std::runtime_error);
  scheduler.clear();
  EXPECT_TRUE(scheduler.idle());
}

TEST(SchedulerTest, DeliverDefersUntilDrained) {
  Scheduler scheduler;
  auto request = std::make_shared<CountRequest>(scheduler.next_serial(),
                                                "count");
  bool fired = false;
  request->on_success([&](CountRequest &r) {
    fired = true;
    EXPECT_EQ(r.result(), 42u);
  });
  request->resolve(42);
  scheduler.deliver(request, "test");

  EXPECT_EQ(request->ready_state(), ReadyState::Pending);
  EXPECT_THROW(request->result(), std::logic_error);
  EXPECT_FALSE(fired);

  scheduler.run_until_idle();
  EXPECT_TRUE(request->done());
  EXPECT_TRUE(fired);
}

TEST(SchedulerTest, FailedRequestFiresErrorHandlers) {
  Scheduler scheduler;
  auto request =
      std::make_shared<VoidRequest>(scheduler.next_serial(), "delete");
  int errors = 0;
  request->on_success([](VoidRequest &) { FAIL() << "unexpected success"; });
  request->on_error([&](VoidRequest &r) {
    ++errors;
    ASSERT_TRUE(r.error().has_value());
    EXPECT_EQ(r.error()->kind, ErrorKind::ReadOnly);
  });
  request->fail(Error{ErrorKind::ReadOnly, "readonly"});

  EXPECT_FALSE(request->error().has_value()); // not delivered yet
  scheduler.deliver(request, "txn:1");
  scheduler.run_until_idle();
  EXPECT_EQ(errors, 1);
  EXPECT_THROW(request->result(), std::logic_error);

  auto history = scheduler.trace().get_history("txn:1");
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].kind, TraceKind::RequestError);
  EXPECT_EQ(history[0].text, "delete ReadOnlyError");
}

// ═══════════════════════════════════════════════════════════════════════════
// Dispatch Trace
// ═══════════════════════════════════════════════════════════════════════════

TEST(DispatchTraceTest, PerSourceHistoryNewestFirst) {
  DispatchTrace trace;
  trace.append_event("txn:1", TraceKind::RequestSuccess, "add", 1);
  trace.append_event("txn:2", TraceKind::RequestSuccess, "get", 1);
  trace.append_event("txn:1", TraceKind::RequestSuccess, "put", 2);
  trace.append_event("txn:1", TraceKind::TransactionComplete, "readwrite", 3);

  auto history = trace.get_history("txn:1");
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].text, "readwrite");
  EXPECT_EQ(history[1].text, "put");
  EXPECT_EQ(history[2].text, "add");
  EXPECT_EQ(history[0].prev_id, history[1].id);
  EXPECT_EQ(history[2].prev_id, 0u);

  EXPECT_EQ(trace.get_history("txn:1", 1).size(), 1u);
  EXPECT_EQ(trace.get_history("txn:2").size(), 1u);
  EXPECT_TRUE(trace.get_history("txn:9").empty());
}

TEST(DispatchTraceTest, CapacityEvictsOldestEvents) {
  DispatchTrace trace(3);
  for (int i = 0; i < 5; ++i)
    trace.append_event("s", TraceKind::RequestSuccess, std::to_string(i), 0);

  EXPECT_EQ(trace.size(), 3u);
  auto history = trace.get_history("s");
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history.front().text, "4");
  EXPECT_EQ(history.back().text, "2");
}

TEST(DispatchTraceTest, DisabledRecordsNothing) {
  DispatchTrace trace(0, false);
  EXPECT_EQ(trace.append_event("s", TraceKind::RequestSuccess, "x", 0), 0u);
  EXPECT_EQ(trace.size(), 0u);
  EXPECT_FALSE(trace.has_source("s"));

  trace.set_enabled(true);
  EXPECT_EQ(trace.append_event("s", TraceKind::RequestSuccess, "x", 0), 1u);
}

TEST(DispatchTraceTest, DropSourceAndClear) {
  DispatchTrace trace;
  trace.append_event("a", TraceKind::ConnectionClose, "db", 0);
  trace.append_event("b", TraceKind::VersionChange, "1 -> 2", 0);

  EXPECT_TRUE(trace.drop_source("a"));
  EXPECT_FALSE(trace.drop_source("a"));
  EXPECT_TRUE(trace.get_history("a").empty());
  EXPECT_EQ(trace.size(), 2u);

  trace.clear();
  EXPECT_EQ(trace.size(), 0u);
  EXPECT_FALSE(trace.has_source("b"));
}

TEST(DispatchTraceTest, KindNames) {
  EXPECT_EQ(trace_kind_name(TraceKind::UpgradeNeeded), "upgradeneeded");
  EXPECT_EQ(trace_kind_name(TraceKind::TransactionAbort), "abort");
}
