#include "../include/hostlink/hostlink.hpp"

#include <cassert>
#include <cstdio>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

bool throws_code(const std::function<void()> &fn, hostlink::error_code code) {
  try {
    fn();
  } catch (const hostlink::bridge_error &e) {
    return e.code() == code;
  }
  return false;
}

bool throws_invalid_argument(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const std::invalid_argument &) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  using hostlink::error_code;
  using hostlink::json;
  int passed = 0;

  // --- error codes ---
  assert(std::string(hostlink::to_string(error_code::unknown_command)) ==
         "unknown_command");
  ++passed;
  assert(hostlink::error_code_from_string("read_only") == error_code::read_only);
  ++passed;
  assert(hostlink::error_code_from_string("bogus") == error_code::host_exception);
  ++passed;

  // --- scheme / listen URI ---
  assert(hostlink::scheme("tcp://127.0.0.1:7777") == "tcp");
  ++passed;
  assert(hostlink::kDefaultURI == "tcp://127.0.0.1:7777");
  ++passed;
  {
    auto ep = hostlink::parse_listen_uri("tcp://localhost:0");
    assert(ep.host == "127.0.0.1");
    ++passed;
    assert(ep.port == 0);
    ++passed;
  }
  {
    auto ep = hostlink::parse_listen_uri("tcp://:8123");
    assert(ep.host == "127.0.0.1" && ep.port == 8123);
    ++passed;
  }
  assert(throws_invalid_argument(
      []() { hostlink::parse_listen_uri("tcp://0.0.0.0:7777"); }));
  ++passed;
  assert(throws_invalid_argument(
      []() { hostlink::parse_listen_uri("unix:///tmp/x.sock"); }));
  ++passed;
  assert(throws_invalid_argument(
      []() { hostlink::parse_listen_uri("tcp://127.0.0.1:99999"); }));
  ++passed;

  // --- parse_flags ---
  {
    auto opts = hostlink::parse_flags({});
    assert(opts.listen_uri == "tcp://127.0.0.1:7777");
    ++passed;
    assert(opts.invocation_timeout_ms == 10000);
    ++passed;
    assert(!opts.atomic_workflows);
    ++passed;
  }
  {
    auto opts = hostlink::parse_flags({"--port", "9001", "--timeout-ms", "250",
                                       "--atomic-workflows", "--log-level",
                                       "debug", "--unknown"});
    assert(opts.listen_uri == "tcp://127.0.0.1:9001");
    ++passed;
    assert(opts.invocation_timeout_ms == 250);
    ++passed;
    assert(opts.atomic_workflows);
    ++passed;
    assert(opts.log_level == "debug");
    ++passed;
  }
  assert(throws_invalid_argument(
      []() { hostlink::parse_flags({"--timeout-ms", "0"}); }));
  ++passed;
  assert(throws_invalid_argument(
      []() { hostlink::parse_flags({"--listen", "tcp://10.0.0.1:7777"}); }));
  ++passed;
  assert(throws_invalid_argument([]() { hostlink::set_log_level("loud"); }));
  ++passed;

  // --- decode_request ---
  {
    auto req = hostlink::decode_request(
        R"({"id":7,"command":"ping","params":{"a":1}})");
    assert(req.id == 7);
    ++passed;
    assert(req.command == "ping");
    ++passed;
    assert(req.params["a"] == 1);
    ++passed;
  }
  {
    auto req = hostlink::decode_request(R"({"command":"ping"})");
    assert(req.id.is_null());
    ++passed;
    assert(req.params.is_object() && req.params.empty());
    ++passed;
  }
  {
    auto req = hostlink::decode_request(R"({"command":"ping","params":null})");
    assert(req.params.is_object());
    ++passed;
  }
  assert(throws_code([]() { hostlink::decode_request("{not json"); },
                     error_code::decode_error));
  ++passed;
  assert(throws_code([]() { hostlink::decode_request("[1,2]"); },
                     error_code::decode_error));
  ++passed;
  assert(throws_code([]() { hostlink::decode_request(R"({"params":{}})"); },
                     error_code::decode_error));
  ++passed;
  assert(throws_code([]() { hostlink::decode_request(R"({"command":""})"); },
                     error_code::decode_error));
  ++passed;
  assert(throws_code(
      []() { hostlink::decode_request(R"({"command":"x","params":[1]})"); },
      error_code::decode_error));
  ++passed;

  // --- encode ---
  {
    auto line = hostlink::encode_result("abc", "pong");
    assert(line.find('\n') == std::string::npos);
    ++passed;
    auto back = json::parse(line);
    assert(back["result"] == "pong" && back["id"] == "abc");
    ++passed;
  }
  {
    auto back = json::parse(hostlink::encode_result(nullptr, {{"n", 1}}));
    assert(!back.contains("id"));
    ++passed;
  }
  {
    auto line = hostlink::encode_error(
        3, error_code::unknown_command, "Unknown command: Frobnicate");
    auto res = hostlink::decode_response(line);
    assert(!res.ok);
    ++passed;
    assert(res.error == "Unknown command: Frobnicate");
    ++passed;
    assert(res.code == error_code::unknown_command);
    ++passed;
    assert(res.id == 3);
    ++passed;
  }
  {
    // invalid UTF-8 in a message is replaced, not thrown
    std::string bad = "bad \xff byte";
    auto line = hostlink::encode_error(nullptr, error_code::host_exception, bad);
    assert(json::parse(line).contains("error"));
    ++passed;
  }
  assert(throws_code(
      []() { hostlink::decode_response(R"({"result":1,"error":"x"})"); },
      error_code::decode_error));
  ++passed;

  // --- params helpers ---
  {
    json p = {{"name", "Cube"},
              {"position", {{"x", 1}, {"y", 2}}},
              {"scale", {2, 2, 2}},
              {"value", 5},
              {"flag", true},
              {"systems", {"HealthSystem", "ManaSystem"}}};
    assert(hostlink::params::require_string(p, "name") == "Cube");
    ++passed;
    auto pos = hostlink::params::optional_vec3(p, "position");
    assert(pos && pos->x == 1.0f && pos->y == 2.0f && pos->z == 0.0f);
    ++passed;
    auto scale = hostlink::params::optional_vec3(p, "scale");
    assert(scale && scale->z == 2.0f);
    ++passed;
    assert(!hostlink::params::optional_vec3(p, "rotation"));
    ++passed;
    assert(hostlink::params::value_text(p, "value") == "5");
    ++passed;
    assert(hostlink::params::value_text(p, "flag") == "true");
    ++passed;
    assert(hostlink::params::string_list(p, "systems").size() == 2);
    ++passed;
    assert(throws_code(
        [&p]() { hostlink::params::require_string(p, "missing"); },
        error_code::invalid_params));
    ++passed;
    assert(throws_code(
        [&p]() { hostlink::params::optional_bool(p, "name", false); },
        error_code::invalid_params));
    ++passed;
    assert(throws_code(
        [&p]() { hostlink::params::string_list(p, "missing", true); },
        error_code::invalid_params));
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
