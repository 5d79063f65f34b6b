#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "assets.hpp"
#include "errors.hpp"
#include "scene.hpp"

namespace hostlink {

using json = nlohmann::json;

/// One decoded request line.
struct request {
  json id; // null when the client sent none
  std::string command;
  json params = json::object();
};

inline request decode_request(const std::string &line) {
  json envelope;
  try {
    envelope = json::parse(line);
  } catch (const json::parse_error &e) {
    throw bridge_error(error_code::decode_error,
                       std::string("invalid JSON: ") + e.what());
  }
  if (!envelope.is_object())
    throw bridge_error(error_code::decode_error,
                       "request must be a JSON object");

  auto command = envelope.find("command");
  if (command == envelope.end() || !command->is_string())
    throw bridge_error(error_code::decode_error,
                       "request is missing \"command\"");

  request req;
  req.command = command->get<std::string>();
  if (req.command.empty())
    throw bridge_error(error_code::decode_error, "\"command\" is empty");

  auto params = envelope.find("params");
  if (params != envelope.end() && !params->is_null()) {
    if (!params->is_object())
      throw bridge_error(error_code::decode_error,
                         "\"params\" must be an object");
    req.params = *params;
  }

  auto id = envelope.find("id");
  if (id != envelope.end())
    req.id = *id;
  return req;
}

inline std::string encode_result(const json &id, const json &value) {
  json response = {{"result", value}};
  if (!id.is_null())
    response["id"] = id;
  return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

inline std::string encode_error(const json &id, error_code code,
                                const std::string &message) {
  json response = {{"error", message}, {"code", to_string(code)}};
  if (!id.is_null())
    response["id"] = id;
  return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

inline std::string encode_error(const json &id, const bridge_error &err) {
  return encode_error(id, err.code(), err.what());
}

/// Client side view of a response line.
struct response {
  json id;
  bool ok = false;
  json result;
  error_code code = error_code::host_exception;
  std::string error;
};

inline response decode_response(const std::string &line) {
  json envelope;
  try {
    envelope = json::parse(line);
  } catch (const json::parse_error &e) {
    throw bridge_error(error_code::decode_error,
                       std::string("invalid response: ") + e.what());
  }
  if (!envelope.is_object())
    throw bridge_error(error_code::decode_error,
                       "response must be a JSON object");

  response res;
  if (envelope.contains("id"))
    res.id = envelope["id"];

  bool has_result = envelope.contains("result");
  bool has_error = envelope.contains("error");
  if (has_result == has_error)
    throw bridge_error(error_code::decode_error,
                       "response must carry exactly one of result or error");

  if (has_result) {
    res.ok = true;
    res.result = envelope["result"];
    return res;
  }
  const auto &error = envelope["error"];
  res.error = error.is_string() ? error.get<std::string>() : error.dump();
  if (envelope.contains("code") && envelope["code"].is_string())
    res.code = error_code_from_string(envelope["code"].get<std::string>());
  return res;
}

/// Flat description of an entity: no component or child objects, only names.
inline json to_json(const entity &e) {
  auto parent = e.parent();
  return {{"name", e.name()},
          {"path", e.path()},
          {"tag", e.tag()},
          {"active", e.active()},
          {"parent", parent ? json(parent->name()) : json(nullptr)},
          {"childCount", e.children().size()}};
}

inline json to_json(const asset &a) {
  return {{"name", a.name}, {"path", a.path}, {"type", a.type_name}};
}

inline json to_json(const std::shared_ptr<entity> &e) {
  return e ? to_json(*e) : json(nullptr);
}

inline json to_json(const std::shared_ptr<asset> &a) {
  return a ? to_json(*a) : json(nullptr);
}

} // namespace hostlink
