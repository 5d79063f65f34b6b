#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>

#include <nlohmann/json.hpp>

#include "codec.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "transport.hpp"

namespace hostlink {

/// Synchronous line client for the bridge: one request, one response.
class bridge_client {
public:
  using json = nlohmann::json;

  explicit bridge_client(int response_timeout_ms =
                             kDefaultInvocationTimeoutMs + 1000)
      : response_timeout_ms_(response_timeout_ms) {}

  bridge_client(const bridge_client &) = delete;
  bridge_client &operator=(const bridge_client &) = delete;

  ~bridge_client() { close(); }

  void connect(const std::string &host = "127.0.0.1", int port = kDefaultPort) {
    close();
    conn_ = dial(host, port);

    timeval tv{};
    tv.tv_sec = response_timeout_ms_ / 1000;
    tv.tv_usec = (response_timeout_ms_ % 1000) * 1000;
    ::setsockopt(conn_.fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    reader_ = std::make_unique<line_reader>(conn_, kDefaultMaxLineBytes * 16);
  }

  bool connected() const { return conn_.fd >= 0; }

  /// Send `command` and return its result; an error response is thrown as
  /// bridge_error with the server's code.
  json call(const std::string &command, const json &params = json::object()) {
    json envelope = {{"id", "c" + std::to_string(++next_id_)},
                     {"command", command},
                     {"params", params}};
    auto res = decode_response(call_raw(envelope.dump()));
    if (!res.ok)
      throw bridge_error(res.code, res.error);
    return res.result;
  }

  /// Send one raw line and return the raw response line.
  std::string call_raw(const std::string &line) {
    if (!connected())
      throw std::runtime_error("bridge client is not connected");
    if (!send_line(conn_, line)) {
      close();
      throw std::runtime_error("bridge connection lost while sending");
    }

    std::string response;
    switch (reader_->next(response)) {
    case line_reader::status::line:
      return response;
    case line_reader::status::too_long:
      close();
      throw bridge_error(error_code::decode_error, "response line too long");
    case line_reader::status::failed:
      close();
      throw bridge_error(error_code::timeout,
                         "no response within " +
                             std::to_string(response_timeout_ms_) + " ms");
    case line_reader::status::closed:
      break;
    }
    close();
    throw std::runtime_error("bridge closed the connection");
  }

  void close() {
    reader_.reset();
    close_connection(conn_);
  }

private:
  int response_timeout_ms_;
  connection conn_;
  std::unique_ptr<line_reader> reader_;
  long long next_id_ = 0;
};

} // namespace hostlink
