#pragma once

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>

#include <nlohmann/json.hpp>

#include "codec.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "log.hpp"
#include "registry.hpp"
#include "transport.hpp"

namespace hostlink {

/// Loopback line-protocol listener. One thread accepts; every connection
/// gets its own session thread running read/decode/invoke/encode/write.
class bridge_server {
public:
  bridge_server(main_thread_executor &executor,
                std::shared_ptr<const command_registry> registry,
                bridge_options options = {})
      : executor_(executor), registry_(std::move(registry)),
        options_(std::move(options)) {
    if (!registry_)
      throw std::invalid_argument("command registry is required");
  }

  bridge_server(const bridge_server &) = delete;
  bridge_server &operator=(const bridge_server &) = delete;

  ~bridge_server() {
    stop();
    std::list<std::shared_ptr<session>> sessions;
    {
      std::lock_guard<std::mutex> lock(sessions_mu_);
      sessions.swap(sessions_);
    }
    for (auto &s : sessions) {
      s->shutdown_read();
      if (s->thread.joinable())
        s->thread.join();
    }
  }

  void start() {
    if (running_.load())
      return;
    auto ep = parse_listen_uri(options_.listen_uri);
    listener_ = listen(ep);
    running_.store(true);
    accept_thread_ = std::thread([this]() { accept_loop(); });
    logger()->info("bridge listening on tcp://{}:{}", listener_.host,
                   listener_.port);
  }

  /// Stop accepting. Open sessions keep running until their peer leaves.
  void stop() {
    if (!running_.exchange(false))
      return;
    shutdown_listener(listener_);
    if (accept_thread_.joinable())
      accept_thread_.join();
    close_listener(listener_);
    logger()->info("bridge stopped listening");
  }

  bool running() const { return running_.load(); }

  int port() const { return listener_.port; }

  std::size_t session_count() const { return active_sessions_.load(); }

  /// Session threads not yet joined, finished or not.
  std::size_t session_threads() const {
    std::lock_guard<std::mutex> lock(sessions_mu_);
    return sessions_.size();
  }

  /// Process one request line into exactly one response line. Never throws.
  std::string handle_line(const std::string &line) const {
    request req;
    try {
      req = decode_request(line);
    } catch (const bridge_error &e) {
      logger()->warn("decode error: {}", e.what());
      return encode_error(nullptr, e);
    }

    try {
      if (!registry_->contains(req.command))
        throw bridge_error(error_code::unknown_command,
                           "Unknown command: " + req.command);
      logger()->debug("dispatching {}", req.command);
      auto registry = registry_;
      auto result = executor_.invoke([registry, req]() {
        return registry->dispatch(req.command, req.params);
      });
      return encode_result(req.id, result);
    } catch (const bridge_error &e) {
      logger()->warn("{} failed ({}): {}", req.command, to_string(e.code()),
                     e.what());
      return encode_error(req.id, e);
    } catch (const std::exception &e) {
      logger()->warn("{} failed: {}", req.command, e.what());
      return encode_error(req.id, error_code::host_exception, e.what());
    }
  }

private:
  struct session {
    explicit session(connection c) : conn(c) {}

    void shutdown_read() {
      std::lock_guard<std::mutex> lock(mu);
      if (conn.fd >= 0)
        ::shutdown(conn.fd, SHUT_RD);
    }

    void close() {
      std::lock_guard<std::mutex> lock(mu);
      close_connection(conn);
    }

    std::mutex mu;
    connection conn;
    std::thread thread;
    std::atomic<bool> finished{false};
  };

  void accept_loop() {
    while (running_.load()) {
      reap_finished();
      if (!wait_acceptable(listener_, kReapIntervalMs))
        continue;
      connection conn;
      try {
        conn = accept(listener_);
      } catch (const std::runtime_error &e) {
        if (!running_.load())
          break;
        logger()->warn("{}", e.what());
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        continue;
      }

      auto s = std::make_shared<session>(conn);
      active_sessions_.fetch_add(1);
      std::lock_guard<std::mutex> lock(sessions_mu_);
      s->thread = std::thread([this, s]() { run_session(*s); });
      sessions_.push_back(s);
    }
  }

  void run_session(session &s) {
    logger()->debug("session opened (fd {})", s.conn.fd);
    line_reader reader(s.conn, options_.max_line_bytes);
    std::string line;
    bool open = true;
    while (open) {
      switch (reader.next(line)) {
      case line_reader::status::line:
        if (line.find_first_not_of(" \t") == std::string::npos)
          break;
        open = send_line(s.conn, handle_line(line));
        if (!open)
          logger()->debug("write failed: {}", std::strerror(errno));
        break;
      case line_reader::status::too_long:
        open = send_line(
            s.conn, encode_error(nullptr, error_code::decode_error,
                                 "request line exceeds " +
                                     std::to_string(options_.max_line_bytes) +
                                     " bytes"));
        break;
      case line_reader::status::failed:
        logger()->debug("read failed: {}", std::strerror(errno));
        open = false;
        break;
      case line_reader::status::closed:
        open = false;
        break;
      }
    }
    s.close();
    active_sessions_.fetch_sub(1);
    s.finished.store(true);
    logger()->debug("session closed");
  }

  /// Join session threads that have already returned.
  void reap_finished() {
    std::list<std::shared_ptr<session>> done;
    {
      std::lock_guard<std::mutex> lock(sessions_mu_);
      for (auto it = sessions_.begin(); it != sessions_.end();) {
        if ((*it)->finished.load()) {
          done.push_back(*it);
          it = sessions_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto &s : done) {
      if (s->thread.joinable())
        s->thread.join();
    }
  }

  static constexpr int kReapIntervalMs = 100;

  main_thread_executor &executor_;
  std::shared_ptr<const command_registry> registry_;
  bridge_options options_;
  tcp_listener listener_;
  std::atomic<bool> running_{false};
  std::thread accept_thread_;
  mutable std::mutex sessions_mu_;
  std::list<std::shared_ptr<session>> sessions_;
  std::atomic<std::size_t> active_sessions_{0};
};

} // namespace hostlink
