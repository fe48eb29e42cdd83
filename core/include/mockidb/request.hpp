#pragma once

/**
 * @file request.hpp
 * @brief Deferred-completion handles.
 *
 * A request is created synchronously with its outcome already decided (the
 * mutation or read has happened), but it stays Pending until the scheduler
 * delivers it in a later turn. Only then does ready_state() flip to Done,
 * result()/error() become readable, and the success or error handlers fire.
 */

#include "mockidb/error.hpp"
#include "mockidb/key.hpp"
#include "mockidb/schema.hpp"
#include "mockidb/value.hpp"

#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace mockidb {

class Cursor;
class Transaction;

class RequestBase {
public:
  RequestBase(uint64_t id, std::string operation,
              std::weak_ptr<Transaction> transaction = {})
      : id_(id), operation_(std::move(operation)),
        transaction_(std::move(transaction)) {}

  virtual ~RequestBase() = default;

  RequestBase(const RequestBase &) = delete;
  RequestBase &operator=(const RequestBase &) = delete;

  uint64_t id() const noexcept { return id_; }

  /// "add", "get", "openCursor", "open", ...
  const std::string &operation() const noexcept { return operation_; }

  ReadyState ready_state() const noexcept { return ready_; }
  bool done() const noexcept { return ready_ == ReadyState::Done; }

  /// The delivered failure. Empty while pending and on success.
  std::optional<Error> error() const {
    return done() ? outcome_error_ : std::nullopt;
  }

  /// nullptr for requests outside a transaction (open, deleteDatabase).
  std::shared_ptr<Transaction> transaction() const {
    return transaction_.lock();
  }

  /// Acknowledge a failure from an error handler so that it does not abort
  /// the owning transaction.
  void prevent_default() noexcept { default_prevented_ = true; }
  bool default_prevented() const noexcept { return default_prevented_; }

  // -----------------------------------------------------------------------
  // Engine side
  // -----------------------------------------------------------------------

  /// Outcome decided at issue time, visible before delivery.
  bool failed() const noexcept { return outcome_error_.has_value(); }
  const std::optional<Error> &outcome_error() const noexcept {
    return outcome_error_;
  }

  void fail(Error error) {
    outcome_error_ = std::move(error);
    discard_result();
  }

  /// Back to Pending for another delivery (cursor iteration).
  void rearm() {
    ready_ = ReadyState::Pending;
    default_prevented_ = false;
    outcome_error_.reset();
    discard_result();
  }

  void mark_done() noexcept { ready_ = ReadyState::Done; }

  void set_transaction(std::weak_ptr<Transaction> transaction) {
    transaction_ = std::move(transaction);
  }

  /// Fire the success or error handlers, according to the outcome.
  virtual void notify() = 0;

protected:
  virtual void discard_result() = 0;

  std::optional<Error> outcome_error_;

private:
  uint64_t id_;
  std::string operation_;
  std::weak_ptr<Transaction> transaction_;
  ReadyState ready_ = ReadyState::Pending;
  bool default_prevented_ = false;
};

template <class T> class Request : public RequestBase {
public:
  using Handler = std::function<void(Request &)>;

  using RequestBase::RequestBase;

  /// Throws std::logic_error while pending or after a failure.
  const T &result() const {
    if (!done())
      throw std::logic_error(
          std::format("{} request is still pending", operation()));
    if (outcome_error_)
      throw std::logic_error(std::format("{} request failed: {}", operation(),
                                         outcome_error_->to_string()));
    return *result_;
  }

  Request &on_success(Handler handler) {
    success_handlers_.push_back(std::move(handler));
    return *this;
  }

  Request &on_error(Handler handler) {
    error_handlers_.push_back(std::move(handler));
    return *this;
  }

  void resolve(T value) {
    outcome_error_.reset();
    result_ = std::move(value);
  }

  void settle(Result<T> outcome) {
    if (outcome)
      resolve(std::move(*outcome));
    else
      fail(std::move(outcome.error()));
  }

  void notify() override {
    // Copied: a handler may attach further handlers.
    auto handlers = outcome_error_ ? error_handlers_ : success_handlers_;
    for (auto &handler : handlers)
      handler(*this);
  }

protected:
  void discard_result() override { result_.reset(); }

private:
  std::optional<T> result_;
  std::vector<Handler> success_handlers_;
  std::vector<Handler> error_handlers_;
};

using KeyRequest = Request<Key>;
using OptionalKeyRequest = Request<std::optional<Key>>;
using ValueRequest = Request<std::optional<Value>>;
using ValuesRequest = Request<std::vector<Value>>;
using KeysRequest = Request<std::vector<Key>>;
using CountRequest = Request<uint64_t>;
using VoidRequest = Request<std::monostate>;
using CursorRequest = Request<std::shared_ptr<Cursor>>;

} // namespace mockidb
