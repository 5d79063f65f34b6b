#pragma once

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace hostlink {

/// Name -> handler table. Built once at startup, read-only afterwards.
class command_registry {
public:
  using json = nlohmann::json;
  using handler_fn = std::function<json(const json &)>;

  void add(const std::string &name, handler_fn handler) {
    if (name.empty())
      throw std::invalid_argument("command name is required");
    if (!handler)
      throw std::invalid_argument("handler is required for " + name);
    if (!handlers_.emplace(name, std::move(handler)).second)
      throw std::invalid_argument("command already registered: " + name);
  }

  bool contains(const std::string &name) const {
    return handlers_.count(name) != 0;
  }

  json dispatch(const std::string &name, const json &params) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end())
      throw bridge_error(error_code::unknown_command,
                         "Unknown command: " + name);
    return it->second(params);
  }

  /// Registered names in sorted order.
  std::vector<std::string> names() const {
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto &kv : handlers_)
      result.push_back(kv.first);
    return result;
  }

  std::size_t size() const { return handlers_.size(); }

private:
  std::map<std::string, handler_fn> handlers_;
};

} // namespace hostlink
