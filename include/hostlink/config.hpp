#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#ifndef HOSTLINK_VERSION
#define HOSTLINK_VERSION "1.0.0"
#endif

namespace hostlink {

/// Default listen URI when --listen and --port are omitted.
constexpr std::string_view kDefaultURI = "tcp://127.0.0.1:7777";
constexpr int kDefaultPort = 7777;
constexpr int kDefaultInvocationTimeoutMs = 10000;
constexpr std::size_t kDefaultMaxLineBytes = 1 << 20;

struct bridge_options {
  std::string listen_uri = std::string(kDefaultURI);
  int invocation_timeout_ms = kDefaultInvocationTimeoutMs;
  std::size_t max_line_bytes = kDefaultMaxLineBytes;
  bool atomic_workflows = false;
  std::string log_level = "info";
};

/// Parsed tcp listen address.
struct endpoint {
  std::string host;
  int port = 0;
};

/// Extract the scheme from a URI.
inline std::string scheme(std::string_view uri) {
  auto pos = uri.find("://");
  return pos != std::string_view::npos ? std::string(uri.substr(0, pos))
                                       : std::string(uri);
}

inline bool is_loopback_host(const std::string &host) {
  return host == "127.0.0.1" || host == "localhost";
}

inline int parse_port(const std::string &text) {
  std::size_t used = 0;
  int port = 0;
  try {
    port = std::stoi(text, &used);
  } catch (const std::exception &) {
    throw std::invalid_argument("invalid port: " + text);
  }
  if (used != text.size() || port < 0 || port > 65535)
    throw std::invalid_argument("invalid port: " + text);
  return port;
}

inline std::tuple<std::string, int> split_host_port(const std::string &addr,
                                                     int default_port) {
  if (addr.empty())
    return {"127.0.0.1", default_port};

  auto pos = addr.rfind(':');
  if (pos == std::string::npos)
    return {addr, default_port};

  std::string host = addr.substr(0, pos);
  if (host.empty())
    host = "127.0.0.1";
  std::string port_text = addr.substr(pos + 1);
  int port = port_text.empty() ? default_port : parse_port(port_text);
  return {host, port};
}

/// Parse a tcp:// URI. The bridge only ever listens on loopback.
inline endpoint parse_listen_uri(const std::string &uri) {
  if (scheme(uri) != "tcp" || uri.rfind("tcp://", 0) != 0)
    throw std::invalid_argument("unsupported listen URI: " + uri);
  auto [host, port] = split_host_port(uri.substr(6), kDefaultPort);
  if (!is_loopback_host(host))
    throw std::invalid_argument("bridge only listens on loopback, got: " +
                                host);
  return {host == "localhost" ? "127.0.0.1" : host, port};
}

inline int parse_positive(const std::string &flag, const std::string &text) {
  std::size_t used = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &used);
  } catch (const std::exception &) {
    throw std::invalid_argument(flag + " expects a number, got: " + text);
  }
  if (used != text.size() || value <= 0 || value > 0x7fffffff)
    throw std::invalid_argument(flag + " expects a positive number, got: " +
                                text);
  return static_cast<int>(value);
}

/// Parse command-line flags. Unknown flags are ignored.
inline bridge_options parse_flags(const std::vector<std::string> &args) {
  bridge_options options;
  for (size_t i = 0; i < args.size(); ++i) {
    bool has_value = i + 1 < args.size();
    if (args[i] == "--listen" && has_value) {
      options.listen_uri = args[++i];
    } else if (args[i] == "--port" && has_value) {
      options.listen_uri = "tcp://127.0.0.1:" + args[++i];
    } else if (args[i] == "--timeout-ms" && has_value) {
      options.invocation_timeout_ms = parse_positive(args[i], args[i + 1]);
      ++i;
    } else if (args[i] == "--max-line-bytes" && has_value) {
      options.max_line_bytes =
          static_cast<std::size_t>(parse_positive(args[i], args[i + 1]));
      ++i;
    } else if (args[i] == "--log-level" && has_value) {
      options.log_level = args[++i];
    } else if (args[i] == "--atomic-workflows") {
      options.atomic_workflows = true;
    }
  }
  (void)parse_listen_uri(options.listen_uri);
  return options;
}

} // namespace hostlink
