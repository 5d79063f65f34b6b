#pragma once

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

#include "config.hpp"

namespace hostlink {

struct tcp_listener {
  int fd = -1;
  std::string host;
  int port = 0;
};

struct connection {
  int fd = -1;
};

inline sockaddr_in make_address(const std::string &host, int port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  auto ip = host == "localhost" ? std::string("127.0.0.1") : host;
  if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
    throw std::invalid_argument("invalid tcp host: " + host);
  return addr;
}

/// Bind and listen on a loopback endpoint. Port 0 picks an ephemeral port;
/// the bound port is reported back in the listener.
inline tcp_listener listen(const endpoint &ep) {
  if (!is_loopback_host(ep.host))
    throw std::invalid_argument("bridge only listens on loopback, got: " +
                                ep.host);
  auto addr = make_address(ep.host, ep.port);

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0)
    throw std::runtime_error("socket() failed: " +
                             std::string(std::strerror(errno)));

  int one = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(fd);
    throw std::runtime_error("bind() failed on port " +
                             std::to_string(ep.port) + ": " +
                             std::strerror(err));
  }
  if (::listen(fd, 16) < 0) {
    int err = errno;
    ::close(fd);
    throw std::runtime_error("listen() failed: " +
                             std::string(std::strerror(err)));
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  int port = ep.port;
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &len) == 0)
    port = ntohs(bound.sin_port);
  return tcp_listener{fd, ep.host, port};
}

/// Accept one connection. Throws once the listener has been shut down.
inline connection accept(tcp_listener &lis) {
  while (true) {
    int fd = ::accept(lis.fd, nullptr, nullptr);
    if (fd >= 0) {
      int one = 1;
      ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      return connection{fd};
    }
    if (errno == EINTR)
      continue;
    throw std::runtime_error("accept(tcp) failed: " +
                             std::string(std::strerror(errno)));
  }
}

/// Wait up to `timeout_ms` for a pending connection or a shutdown.
inline bool wait_acceptable(const tcp_listener &lis, int timeout_ms) {
  pollfd pfd{};
  pfd.fd = lis.fd;
  pfd.events = POLLIN;
  return ::poll(&pfd, 1, timeout_ms) > 0;
}

/// Wake a thread blocked in accept() without closing the descriptor.
inline void shutdown_listener(tcp_listener &lis) {
  if (lis.fd >= 0)
    ::shutdown(lis.fd, SHUT_RDWR);
}

inline void close_listener(tcp_listener &lis) {
  if (lis.fd >= 0) {
    ::close(lis.fd);
    lis.fd = -1;
  }
}

inline ssize_t conn_read(const connection &conn, void *buf, size_t n) {
  return ::recv(conn.fd, buf, n, 0);
}

inline ssize_t conn_write(const connection &conn, const void *buf, size_t n) {
  return ::send(conn.fd, buf, n, MSG_NOSIGNAL);
}

inline void close_connection(connection &conn) {
  if (conn.fd >= 0) {
    ::close(conn.fd);
    conn.fd = -1;
  }
}

/// Write the whole buffer. Returns false on any I/O error.
inline bool send_all(const connection &conn, const std::string &data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    auto n = conn_write(conn, data.data() + sent, data.size() - sent);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      return false;
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

inline bool send_line(const connection &conn, const std::string &line) {
  return send_all(conn, line + "\n");
}

/// Splits a byte stream into '\n'-terminated lines.
class line_reader {
public:
  enum class status { line, too_long, closed, failed };

  line_reader(const connection &conn, std::size_t max_line_bytes)
      : conn_(conn), max_line_bytes_(max_line_bytes) {}

  /// Next line without its terminator (a trailing '\r' is stripped too).
  /// An overlong line reports too_long once and its remainder is skipped.
  status next(std::string &line) {
    while (true) {
      auto newline = buffer_.find('\n', scan_from_);
      if (newline != std::string::npos) {
        bool overlong = discarding_ || newline > max_line_bytes_;
        line.assign(buffer_, 0, newline);
        buffer_.erase(0, newline + 1);
        scan_from_ = 0;
        if (overlong) {
          bool report = !discarding_;
          discarding_ = false;
          if (report)
            return status::too_long;
          continue;
        }
        if (!line.empty() && line.back() == '\r')
          line.pop_back();
        return status::line;
      }

      if (buffer_.size() > max_line_bytes_) {
        buffer_.clear();
        scan_from_ = 0;
        if (!discarding_) {
          discarding_ = true;
          return status::too_long;
        }
      }
      scan_from_ = buffer_.size();

      char chunk[4096];
      auto n = conn_read(conn_, chunk, sizeof(chunk));
      if (n < 0 && errno == EINTR)
        continue;
      if (n < 0)
        return status::failed;
      if (n == 0) {
        if (buffer_.empty() || discarding_)
          return status::closed;
        line.swap(buffer_);
        buffer_.clear();
        scan_from_ = 0;
        if (!line.empty() && line.back() == '\r')
          line.pop_back();
        return status::line;
      }
      buffer_.append(chunk, static_cast<std::size_t>(n));
    }
  }

private:
  const connection &conn_;
  std::size_t max_line_bytes_;
  std::string buffer_;
  std::size_t scan_from_ = 0;
  bool discarding_ = false;
};

/// Blocking connect to host:port.
inline connection dial(const std::string &host, int port) {
  auto addr = make_address(host, port);
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0)
    throw std::runtime_error("socket() failed: " +
                             std::string(std::strerror(errno)));
  if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(fd);
    throw std::runtime_error("connect() to " + host + ":" +
                             std::to_string(port) +
                             " failed: " + std::strerror(err));
  }
  int one = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  return connection{fd};
}

/// True when something accepts TCP connections on host:port within
/// `timeout_ms`.
inline bool is_reachable(const std::string &host, int port,
                         int timeout_ms = 500) {
  sockaddr_in addr{};
  try {
    addr = make_address(host, port);
  } catch (const std::invalid_argument &) {
    return false;
  }

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0)
    return false;
  int flags = ::fcntl(fd, F_GETFL, 0);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

  bool reachable = false;
  int rc = ::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  if (rc == 0) {
    reachable = true;
  } else if (errno == EINPROGRESS) {
    pollfd pfd{fd, POLLOUT, 0};
    if (::poll(&pfd, 1, timeout_ms) == 1) {
      int err = 0;
      socklen_t len = sizeof(err);
      reachable = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 &&
                  err == 0;
    }
  }
  ::close(fd);
  return reachable;
}

} // namespace hostlink
