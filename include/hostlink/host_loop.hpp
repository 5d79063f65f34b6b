#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "errors.hpp"
#include "log.hpp"

namespace hostlink {

/// The host's single mutation-safe execution context.
///
/// Whoever calls run_frame()/tick()/run() becomes the host thread. Callbacks
/// posted from any thread run there, in post order, once per frame; a
/// callback posted while a frame is running waits for the next frame.
class host_loop {
public:
  using callback = std::function<void()>;

  host_loop() = default;
  host_loop(const host_loop &) = delete;
  host_loop &operator=(const host_loop &) = delete;

  ~host_loop() { stop(); }

  void post(callback fn) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopped_)
        throw bridge_error(error_code::host_stopped, "host loop is stopped");
      queue_.push_back(std::move(fn));
    }
    cv_.notify_all();
  }

  /// Run every callback queued before this call. Returns how many ran.
  std::size_t run_frame() {
    host_thread_.store(std::this_thread::get_id());
    std::deque<callback> batch;
    {
      std::lock_guard<std::mutex> lock(mu_);
      batch.swap(queue_);
    }
    for (auto &fn : batch) {
      try {
        fn();
      } catch (const std::exception &e) {
        logger()->error("host callback threw: {}", e.what());
      }
    }
    frame_.fetch_add(1);
    return batch.size();
  }

  /// Wait up to `max_wait` for work (or stop), then run one frame.
  std::size_t tick(std::chrono::milliseconds max_wait) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, max_wait,
                   [this]() { return !queue_.empty() || stopped_; });
      if (stopped_)
        return 0;
    }
    return run_frame();
  }

  /// Drive frames on the calling thread until stop().
  void run(std::chrono::milliseconds frame_interval =
               std::chrono::milliseconds(16)) {
    while (!stopped()) {
      tick(frame_interval);
    }
  }

  /// Stop accepting work and drop whatever is still queued.
  void stop() {
    std::deque<callback> dropped;
    {
      std::lock_guard<std::mutex> lock(mu_);
      stopped_ = true;
      dropped.swap(queue_);
    }
    cv_.notify_all();
    // released outside the lock
    dropped.clear();
  }

  bool stopped() const {
    std::lock_guard<std::mutex> lock(mu_);
    return stopped_;
  }

  bool on_host_thread() const {
    return host_thread_.load() == std::this_thread::get_id();
  }

  std::uint64_t frame() const { return frame_.load(); }

  std::size_t queued() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<callback> queue_;
  bool stopped_ = false;
  std::atomic<std::thread::id> host_thread_{};
  std::atomic<std::uint64_t> frame_{0};
};

} // namespace hostlink
