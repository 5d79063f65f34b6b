#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "scene.hpp"

namespace hostlink {

/// A persisted (in this host: in-memory) resource addressed by path.
struct asset {
  std::string path;
  std::string name;
  std::string type_name;
  nlohmann::json data = nlohmann::json::object();
  /// Detached entity tree for Prefab assets, empty otherwise.
  std::shared_ptr<entity> prefab_root;
};

inline std::string to_lower(std::string text) {
  for (auto &c : text)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return text;
}

/// File name without directory and extension.
inline std::string asset_stem(const std::string &path) {
  auto slash = path.find_last_of('/');
  std::string file = slash == std::string::npos ? path : path.substr(slash + 1);
  auto dot = file.find_last_of('.');
  return dot == std::string::npos || dot == 0 ? file : file.substr(0, dot);
}

class asset_database {
public:
  /// Register (or replace) the asset at `path`.
  std::shared_ptr<asset> add(const std::string &path,
                             const std::string &type_name,
                             nlohmann::json data = nlohmann::json::object()) {
    if (path.empty())
      throw std::invalid_argument("asset path is required");
    auto a = std::make_shared<asset>();
    a->path = path;
    a->name = asset_stem(path);
    a->type_name = type_name;
    a->data = std::move(data);
    assets_[path] = a;
    return a;
  }

  /// Exact path lookup. An empty type_name accepts any type.
  std::shared_ptr<asset> load(const std::string &path,
                              const std::string &type_name = "") const {
    auto it = assets_.find(path);
    if (it == assets_.end())
      return nullptr;
    if (!type_name.empty() && it->second->type_name != type_name)
      return nullptr;
    return it->second;
  }

  /// Assets whose name contains `name_filter` (case-insensitive) and whose
  /// type equals `type_name` when given, ordered by path.
  std::vector<std::shared_ptr<asset>>
  find(const std::string &name_filter, const std::string &type_name = "") const {
    std::vector<std::shared_ptr<asset>> found;
    auto needle = to_lower(name_filter);
    for (const auto &kv : assets_) {
      const auto &a = kv.second;
      if (!type_name.empty() && a->type_name != type_name)
        continue;
      if (!needle.empty() && to_lower(a->name).find(needle) == std::string::npos)
        continue;
      found.push_back(a);
    }
    return found;
  }

  /// Search with a query such as "Player t:Prefab".
  std::vector<std::shared_ptr<asset>> query(const std::string &text) const {
    std::istringstream words(text);
    std::string word, type_name, name_filter;
    while (words >> word) {
      if (word.rfind("t:", 0) == 0) {
        type_name = word.substr(2);
      } else {
        if (!name_filter.empty())
          name_filter += " ";
        name_filter += word;
      }
    }
    return find(name_filter, type_name);
  }

  /// Put back an asset object previously returned by this database.
  void put(const std::shared_ptr<asset> &a) {
    if (!a || a->path.empty())
      throw std::invalid_argument("asset path is required");
    assets_[a->path] = a;
  }

  bool remove(const std::string &path) { return assets_.erase(path) > 0; }

  std::vector<std::shared_ptr<asset>> list() const {
    std::vector<std::shared_ptr<asset>> all;
    for (const auto &kv : assets_)
      all.push_back(kv.second);
    return all;
  }

  std::size_t size() const { return assets_.size(); }

private:
  std::map<std::string, std::shared_ptr<asset>> assets_;
};

} // namespace hostlink
