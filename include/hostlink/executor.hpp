#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "host_loop.hpp"
#include "log.hpp"

namespace hostlink {

/// Marshals handler calls from session threads onto the host loop and waits
/// for them with a bound.
class main_thread_executor {
public:
  using json = nlohmann::json;
  using handler_fn = std::function<json()>;

  main_thread_executor(host_loop &loop, std::chrono::milliseconds timeout)
      : loop_(loop), timeout_(timeout),
        stats_(std::make_shared<invocation_stats>()) {
    if (timeout_.count() <= 0)
      throw std::invalid_argument("invocation timeout must be positive");
  }

  json invoke(const handler_fn &fn) { return invoke(fn, timeout_); }

  /// Run `fn` on the host thread and return its result, or throw
  /// bridge_error with the handler's code, `timeout` or `host_stopped`.
  json invoke(const handler_fn &fn, std::chrono::milliseconds timeout) {
    if (!fn)
      throw std::invalid_argument("handler is required");
    if (loop_.stopped())
      throw bridge_error(error_code::host_stopped, "host loop is stopped");

    if (loop_.on_host_thread()) {
      auto outcome = run_handler(fn);
      if (outcome.has_error)
        throw bridge_error(outcome.code, outcome.message);
      return std::move(outcome.result);
    }

    auto call = std::make_shared<pending_invocation>();
    auto stats = stats_;

    // the queued closure is the guard's only owner
    loop_.post([call, guard = std::make_shared<abandon_guard>(call), stats,
                fn]() {
      {
        std::lock_guard<std::mutex> lock(call->mu);
        if (call->cancelled) {
          stats->dropped.fetch_add(1);
          logger()->debug("dropping cancelled invocation");
          return;
        }
        call->started = true;
      }

      auto outcome = run_handler(fn);

      std::lock_guard<std::mutex> lock(call->mu);
      if (call->cancelled) {
        stats->discarded.fetch_add(1);
        logger()->warn("discarding result of timed-out invocation");
        return;
      }
      call->has_error = outcome.has_error;
      call->code = outcome.code;
      call->message = std::move(outcome.message);
      call->result = std::move(outcome.result);
      call->done = true;
      call->cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(call->mu);
    bool done =
        call->cv.wait_for(lock, timeout, [&call]() { return call->done; });
    if (!done) {
      call->cancelled = true;
      lock.unlock();
      logger()->warn("invocation timed out after {} ms", timeout.count());
      throw bridge_error(error_code::timeout,
                         "Command execution timeout after " +
                             std::to_string(timeout.count()) + " ms");
    }
    if (call->has_error)
      throw bridge_error(call->code, call->message);
    return std::move(call->result);
  }

  std::chrono::milliseconds timeout() const { return timeout_; }

  /// Timed-out invocations dropped before they started.
  std::size_t dropped() const { return stats_->dropped.load(); }

  /// Timed-out invocations that ran anyway and whose result was thrown away.
  std::size_t discarded() const { return stats_->discarded.load(); }

private:
  struct pending_invocation {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    bool cancelled = false;
    bool started = false;
    bool has_error = false;
    error_code code = error_code::host_exception;
    std::string message;
    json result;
  };

  struct invocation_stats {
    std::atomic<std::size_t> dropped{0};
    std::atomic<std::size_t> discarded{0};
  };

  /// Fails the invocation with host_stopped if its queued closure is
  /// destroyed without ever running.
  struct abandon_guard {
    explicit abandon_guard(std::shared_ptr<pending_invocation> c)
        : call(std::move(c)) {}

    ~abandon_guard() {
      std::lock_guard<std::mutex> lock(call->mu);
      if (call->started || call->done || call->cancelled)
        return;
      call->has_error = true;
      call->code = error_code::host_stopped;
      call->message = "host loop stopped before the command ran";
      call->done = true;
      call->cv.notify_all();
    }

    std::shared_ptr<pending_invocation> call;
  };

  struct outcome {
    bool has_error = false;
    error_code code = error_code::host_exception;
    std::string message;
    json result;
  };

  static outcome run_handler(const handler_fn &fn) {
    outcome out;
    try {
      out.result = fn();
    } catch (const bridge_error &e) {
      out.has_error = true;
      out.code = e.code();
      out.message = e.what();
    } catch (const std::exception &e) {
      out.has_error = true;
      out.code = error_code::host_exception;
      out.message = e.what();
    } catch (...) {
      out.has_error = true;
      out.code = error_code::host_exception;
      out.message = "unknown exception";
    }
    return out;
  }

  host_loop &loop_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<invocation_stats> stats_;
};

} // namespace hostlink
