#include "../include/hostlink/hostlink.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

bool throws_code(const std::function<void()> &fn, hostlink::error_code code) {
  try {
    fn();
  } catch (const hostlink::bridge_error &e) {
    return e.code() == code;
  }
  return false;
}

/// Drives a host_loop on its own thread until stopped.
class loop_driver {
public:
  explicit loop_driver(hostlink::host_loop &loop)
      : thread_([&loop]() { loop.run(5ms); }) {}
  ~loop_driver() {
    if (thread_.joinable())
      thread_.join();
  }

private:
  std::thread thread_;
};

} // namespace

int main() {
  using hostlink::error_code;
  using hostlink::json;
  int passed = 0;

  // --- command_registry ---
  {
    hostlink::command_registry registry;
    registry.add("ping", [](const json &) { return json("pong"); });
    registry.add("Echo", [](const json &p) { return p; });
    assert(registry.size() == 2);
    ++passed;
    assert(registry.contains("ping") && !registry.contains("Ping"));
    ++passed;
    assert(registry.dispatch("ping", json::object()) == "pong");
    ++passed;
    assert(registry.dispatch("Echo", {{"a", 1}})["a"] == 1);
    ++passed;
    assert((registry.names() == std::vector<std::string>{"Echo", "ping"}));
    ++passed;

    try {
      registry.dispatch("Frobnicate", json::object());
      assert(false);
    } catch (const hostlink::bridge_error &e) {
      assert(e.code() == error_code::unknown_command);
      assert(std::string(e.what()) == "Unknown command: Frobnicate");
      ++passed;
    }

    bool rejected = false;
    try {
      registry.add("ping", [](const json &) { return json(); });
    } catch (const std::invalid_argument &) {
      rejected = true;
    }
    assert(rejected);
    ++passed;
  }

  // --- host_loop ordering and frames ---
  {
    hostlink::host_loop loop;
    std::vector<int> order;
    loop.post([&order]() { order.push_back(1); });
    loop.post([&order, &loop]() {
      order.push_back(2);
      // posted during a frame: runs on the next one
      loop.post([&order]() { order.push_back(4); });
    });
    loop.post([]() { throw std::runtime_error("boom"); });
    loop.post([&order]() { order.push_back(3); });
    assert(loop.queued() == 4);
    ++passed;
    assert(loop.run_frame() == 4);
    ++passed;
    assert((order == std::vector<int>{1, 2, 3}));
    ++passed;
    assert(loop.on_host_thread());
    ++passed;
    assert(loop.run_frame() == 1);
    ++passed;
    assert(order.back() == 4);
    ++passed;
    assert(loop.frame() == 2);
    ++passed;

    loop.stop();
    assert(throws_code([&loop]() { loop.post([]() {}); },
                       error_code::host_stopped));
    ++passed;
  }

  // --- executor: result, errors, inline on host thread ---
  {
    hostlink::host_loop loop;
    hostlink::main_thread_executor executor(loop, 1000ms);
    std::thread::id host_id;
    std::thread::id handler_id;
    {
      loop_driver driver(loop);
      loop.post([&host_id]() { host_id = std::this_thread::get_id(); });

      auto result = executor.invoke([&handler_id]() {
        handler_id = std::this_thread::get_id();
        return json{{"n", 42}};
      });
      assert(result["n"] == 42);
      ++passed;
      assert(handler_id == host_id);
      ++passed;
      assert(handler_id != std::this_thread::get_id());
      ++passed;

      assert(throws_code(
          [&executor]() {
            executor.invoke([]() -> json {
              throw hostlink::bridge_error(error_code::entity_not_found,
                                           "Entity not found: Ghost");
            });
          },
          error_code::entity_not_found));
      ++passed;

      try {
        executor.invoke([]() -> json { throw std::logic_error("kaboom"); });
        assert(false);
      } catch (const hostlink::bridge_error &e) {
        assert(e.code() == error_code::host_exception);
        assert(std::string(e.what()) == "kaboom");
        ++passed;
      }

      // a nested invoke from the host thread runs inline
      auto nested = executor.invoke([&executor]() {
        return executor.invoke([]() { return json("inner"); });
      });
      assert(nested == "inner");
      ++passed;

      loop.stop();
    }
    assert(throws_code(
        [&executor]() { executor.invoke([]() { return json(); }); },
        error_code::host_stopped));
    ++passed;
  }

  // --- executor: bounded wait, late result discarded ---
  {
    hostlink::host_loop loop;
    hostlink::main_thread_executor executor(loop, 100ms);
    std::atomic<bool> ran{false};
    {
      loop_driver driver(loop);
      auto start = std::chrono::steady_clock::now();
      try {
        executor.invoke([&ran]() {
          std::this_thread::sleep_for(300ms);
          ran = true;
          return json("late");
        });
        assert(false);
      } catch (const hostlink::bridge_error &e) {
        auto waited = std::chrono::steady_clock::now() - start;
        assert(e.code() == error_code::timeout);
        assert(std::string(e.what()) ==
               "Command execution timeout after 100 ms");
        assert(waited <= 150ms);
        ++passed;
      }

      // the next invocation is only served after the slow one finishes
      assert(executor.invoke([]() { return json(1); }, 2000ms) == 1);
      ++passed;
      assert(ran.load());
      ++passed;
      assert(executor.discarded() == 1);
      ++passed;
      loop.stop();
    }
  }

  // --- executor: timed out before it started is dropped ---
  {
    hostlink::host_loop loop;
    hostlink::main_thread_executor executor(loop, 50ms);
    std::atomic<bool> ran{false};
    assert(throws_code(
        [&]() {
          executor.invoke([&ran]() {
            ran = true;
            return json();
          });
        },
        error_code::timeout));
    ++passed;
    loop.run_frame();
    assert(!ran.load());
    ++passed;
    assert(executor.dropped() == 1);
    ++passed;
  }

  // --- executor: loop stopped while a call is queued ---
  {
    hostlink::host_loop loop;
    hostlink::main_thread_executor executor(loop, 5000ms);
    std::thread stopper([&loop]() {
      while (loop.queued() == 0)
        std::this_thread::sleep_for(1ms);
      loop.stop();
    });
    auto start = std::chrono::steady_clock::now();
    assert(throws_code(
        [&executor]() { executor.invoke([]() { return json(); }); },
        error_code::host_stopped));
    ++passed;
    assert(std::chrono::steady_clock::now() - start < 5000ms);
    ++passed;
    stopper.join();
  }

  {
    hostlink::host_loop loop;
    bool rejected = false;
    try {
      hostlink::main_thread_executor executor(loop, 0ms);
    } catch (const std::invalid_argument &) {
      rejected = true;
    }
    assert(rejected);
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
