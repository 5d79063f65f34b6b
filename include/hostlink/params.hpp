#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "scene.hpp"

namespace hostlink {
namespace params {

using json = nlohmann::json;

inline std::string require_string(const json &p, const char *key) {
  auto it = p.find(key);
  if (it == p.end() || !it->is_string() || it->get<std::string>().empty())
    throw bridge_error(error_code::invalid_params,
                       std::string("\"") + key + "\" is required");
  return it->get<std::string>();
}

inline std::string optional_string(const json &p, const char *key,
                                   const std::string &fallback = "") {
  auto it = p.find(key);
  if (it == p.end() || it->is_null())
    return fallback;
  if (!it->is_string())
    throw bridge_error(error_code::invalid_params,
                       std::string("\"") + key + "\" must be a string");
  return it->get<std::string>();
}

inline bool optional_bool(const json &p, const char *key, bool fallback) {
  auto it = p.find(key);
  if (it == p.end() || it->is_null())
    return fallback;
  if (!it->is_boolean())
    throw bridge_error(error_code::invalid_params,
                       std::string("\"") + key + "\" must be a boolean");
  return it->get<bool>();
}

inline double optional_number(const json &p, const char *key,
                              double fallback) {
  auto it = p.find(key);
  if (it == p.end() || it->is_null())
    return fallback;
  if (!it->is_number())
    throw bridge_error(error_code::invalid_params,
                       std::string("\"") + key + "\" must be a number");
  return it->get<double>();
}

/// Wire text of a scalar param; numbers and booleans are accepted as-is.
inline std::string value_text(const json &p, const char *key) {
  auto it = p.find(key);
  if (it == p.end() || it->is_null())
    return "";
  if (it->is_string())
    return it->get<std::string>();
  if (it->is_boolean())
    return it->get<bool>() ? "true" : "false";
  if (it->is_number())
    return it->dump();
  throw bridge_error(error_code::invalid_params,
                     std::string("\"") + key + "\" must be a scalar");
}

/// {"x":..,"y":..,"z":..} or [x, y, z]; missing axes default to 0.
inline std::optional<vec3> optional_vec3(const json &p, const char *key) {
  auto it = p.find(key);
  if (it == p.end() || it->is_null())
    return std::nullopt;

  auto axis = [key](const json &v) {
    if (!v.is_number())
      throw bridge_error(error_code::invalid_params,
                         std::string("\"") + key + "\" must hold numbers");
    return v.get<float>();
  };

  vec3 v;
  if (it->is_object()) {
    if (it->contains("x"))
      v.x = axis((*it)["x"]);
    if (it->contains("y"))
      v.y = axis((*it)["y"]);
    if (it->contains("z"))
      v.z = axis((*it)["z"]);
    return v;
  }
  if (it->is_array() && it->size() == 3) {
    v.x = axis((*it)[0]);
    v.y = axis((*it)[1]);
    v.z = axis((*it)[2]);
    return v;
  }
  throw bridge_error(error_code::invalid_params,
                     std::string("\"") + key +
                         "\" must be {x, y, z} or a 3-element array");
}

inline std::vector<std::string> string_list(const json &p, const char *key,
                                            bool required = false) {
  auto it = p.find(key);
  if (it == p.end() || it->is_null()) {
    if (required)
      throw bridge_error(error_code::invalid_params,
                         std::string("\"") + key + "\" is required");
    return {};
  }
  if (!it->is_array())
    throw bridge_error(error_code::invalid_params,
                       std::string("\"") + key + "\" must be an array");
  std::vector<std::string> items;
  for (const auto &item : *it) {
    if (!item.is_string())
      throw bridge_error(error_code::invalid_params,
                         std::string("\"") + key + "\" must hold strings");
    items.push_back(item.get<std::string>());
  }
  return items;
}

} // namespace params
} // namespace hostlink
