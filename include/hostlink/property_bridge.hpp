#pragma once

#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include "assets.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "scene.hpp"
#include "types.hpp"

namespace hostlink {

/// A member value rendered for the wire, with its declared type name.
struct property_value {
  std::string value;
  std::string type;
};

inline const char *to_string(member_kind kind) {
  switch (kind) {
  case member_kind::integer:
    return "integer";
  case member_kind::floating:
    return "float";
  case member_kind::boolean:
    return "bool";
  case member_kind::string:
    return "string";
  case member_kind::vector3:
    return "vector3";
  case member_kind::entity_ref:
    return "entity";
  case member_kind::component_ref:
    return "component";
  case member_kind::asset_ref:
    return "asset";
  case member_kind::event:
    return "event";
  }
  return "unknown";
}

inline const char *to_string(member_visibility visibility) {
  switch (visibility) {
  case member_visibility::public_member:
    return "public";
  case member_visibility::serialized:
    return "serialized";
  case member_visibility::private_member:
    return "private";
  }
  return "private";
}

namespace detail {

inline std::string trim(const std::string &text) {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return "";
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

/// Shortest text that reads back to the same value at the member's width.
inline std::string format_number(double v, bool single_precision) {
  if (single_precision)
    return fmt::format("{}", static_cast<float>(v));
  return fmt::format("{}", v);
}

inline bool parse_integer(const std::string &text, long long &out) {
  auto t = trim(text);
  if (t.empty())
    return false;
  try {
    std::size_t used = 0;
    out = std::stoll(t, &used);
    return used == t.size();
  } catch (const std::exception &) {
    return false;
  }
}

inline bool parse_floating(const std::string &text, double &out) {
  auto t = trim(text);
  if (!t.empty() && (t.back() == 'f' || t.back() == 'F'))
    t.pop_back();
  if (t.empty())
    return false;
  try {
    std::size_t used = 0;
    out = std::stod(t, &used);
    return used == t.size();
  } catch (const std::exception &) {
    return false;
  }
}

inline bool parse_boolean(const std::string &text, bool &out) {
  auto t = to_lower(trim(text));
  if (t == "true" || t == "1" || t == "yes") {
    out = true;
    return true;
  }
  if (t == "false" || t == "0" || t == "no") {
    out = false;
    return true;
  }
  return false;
}

/// Accepts "x,y,z", "(x, y, z)" and "[x, y, z]".
inline bool parse_vector3(const std::string &text, vec3 &out) {
  auto t = trim(text);
  if (t.size() >= 2 && ((t.front() == '(' && t.back() == ')') ||
                        (t.front() == '[' && t.back() == ']')))
    t = t.substr(1, t.size() - 2);

  double parts[3];
  std::size_t count = 0;
  std::string::size_type start = 0;
  while (true) {
    auto comma = t.find(',', start);
    auto piece = t.substr(start, comma == std::string::npos ? std::string::npos
                                                            : comma - start);
    if (count == 3 || !parse_floating(piece, parts[count]))
      return false;
    ++count;
    if (comma == std::string::npos)
      break;
    start = comma + 1;
  }
  if (count != 3)
    return false;
  out = vec3{static_cast<float>(parts[0]), static_cast<float>(parts[1]),
             static_cast<float>(parts[2])};
  return true;
}

inline bool is_known_value_type(const std::string &tag) {
  static const char *known[] = {
      "",        "int",    "integer", "long",       "float",
      "double",  "single", "bool",    "boolean",    "string",
      "vector3", "entity", "object",  "gameobject", "component",
      "asset",   "reference",
  };
  auto lower = to_lower(tag);
  for (auto k : known) {
    if (lower == k)
      return true;
  }
  return false;
}

} // namespace detail

/// Generic get/set of named members on live components.
///
/// Entities are resolved with scene::find, so duplicate names resolve to the
/// first match in depth-first pre-order.
class property_bridge {
public:
  using json = nlohmann::json;

  property_bridge(scene &world, type_registry &types, asset_database &assets)
      : world_(world), types_(types), assets_(assets) {}

  std::shared_ptr<entity> resolve_entity(const std::string &name) const {
    auto e = world_.find(name);
    if (!e)
      throw bridge_error(error_code::entity_not_found,
                         "Entity not found: " + name);
    return e;
  }

  /// First attached component whose runtime type is registered as `type_name`.
  std::shared_ptr<component>
  resolve_component(const entity &e, const std::string &type_name) const {
    if (auto wanted = types_.find(type_name)) {
      for (const auto &c : e.components()) {
        if (std::type_index(typeid(*c)) == wanted->type)
          return c;
      }
    }
    throw bridge_error(error_code::component_not_found,
                       "Component not found: " + type_name + " on " +
                           e.name());
  }

  const member_descriptor &resolve_member(const component &c,
                                          const std::string &name) const {
    const auto &type = types_.type_of(c);
    if (auto m = types_.find_member(type, name))
      return *m;
    throw bridge_error(error_code::member_not_found,
                       "Field or property not found: " + name + " on " +
                           type.name);
  }

  property_value get(const std::string &entity_name,
                     const std::string &component_type,
                     const std::string &member_name) const {
    auto e = resolve_entity(entity_name);
    auto c = resolve_component(*e, component_type);
    return read(*c, resolve_member(*c, member_name));
  }

  property_value read(const component &c, const member_descriptor &m) const {
    return {format(m.get(c), m.single_precision), type_name_of(m)};
  }

  /// Coerce `value` to the member's type, assign it and return the value
  /// read back.
  property_value set(const std::string &entity_name,
                     const std::string &component_type,
                     const std::string &member_name, const std::string &value,
                     const std::string &value_type = "",
                     bool required = false) {
    auto e = resolve_entity(entity_name);
    auto c = resolve_component(*e, component_type);
    const auto &m = resolve_member(*c, member_name);
    check_writable(m);
    assign(*c, m, coerce(m, value, value_type, required));
    logger()->debug("set {}.{}.{} = {}", e->name(), component_type,
                    member_name, value);
    return read(*c, m);
  }

  void assign(component &c, const member_descriptor &m,
              const member_value &value) const {
    check_writable(m);
    m.set(c, value);
  }

  member_value coerce(const member_descriptor &m, const std::string &value,
                      const std::string &value_type, bool required) const {
    if (!detail::is_known_value_type(value_type))
      throw bridge_error(error_code::conversion_error,
                         "Unknown value type '" + value_type + "'");

    if (is_reference(m.kind)) {
      auto resolved = resolve_reference(m, value);
      if (required && std::holds_alternative<std::monostate>(resolved))
        throw bridge_error(error_code::conversion_error,
                           "Cannot resolve '" + value + "' to " +
                               type_name_of(m));
      return resolved;
    }

    switch (m.kind) {
    case member_kind::integer: {
      long long v = 0;
      if (detail::parse_integer(value, v))
        return v;
      break;
    }
    case member_kind::floating: {
      double v = 0;
      if (detail::parse_floating(value, v))
        return v;
      break;
    }
    case member_kind::boolean: {
      bool v = false;
      if (detail::parse_boolean(value, v))
        return v;
      break;
    }
    case member_kind::vector3: {
      vec3 v;
      if (detail::parse_vector3(value, v))
        return v;
      break;
    }
    case member_kind::string:
      return value;
    default:
      break;
    }
    throw bridge_error(error_code::conversion_error,
                       "Cannot convert '" + value + "' to " + type_name_of(m) +
                           " (given type '" +
                           (value_type.empty() ? "string" : value_type) +
                           "')");
  }

  /// Tiered lookup: live entity by name, asset at path, first asset by name.
  /// Returns monostate when every tier misses.
  member_value resolve_reference(const member_descriptor &m,
                                 const std::string &value) const {
    auto name = detail::trim(value);
    if (name.empty())
      return std::monostate{};

    if (m.kind != member_kind::asset_ref) {
      if (auto e = world_.find(name)) {
        auto adapted = adapt(m, e);
        if (!std::holds_alternative<std::monostate>(adapted))
          return adapted;
      }
    }

    if (auto a = assets_.load(name)) {
      auto adapted = adapt(m, a);
      if (!std::holds_alternative<std::monostate>(adapted))
        return adapted;
    }

    auto filter_type = m.kind == member_kind::asset_ref ? m.asset_type
                                                        : std::string("Prefab");
    for (const auto &a : assets_.find(asset_stem(name), filter_type)) {
      auto adapted = adapt(m, a);
      if (!std::holds_alternative<std::monostate>(adapted))
        return adapted;
    }
    return std::monostate{};
  }

  /// Wire type name of a member: "int", "float", "Vector3", or the declared
  /// reference type.
  std::string type_name_of(const member_descriptor &m) const {
    switch (m.kind) {
    case member_kind::integer:
      return "int";
    case member_kind::floating:
      return "float";
    case member_kind::boolean:
      return "bool";
    case member_kind::string:
      return "string";
    case member_kind::vector3:
      return "Vector3";
    case member_kind::entity_ref:
      return "Entity";
    case member_kind::component_ref:
      return types_.name_of(m.ref_type);
    case member_kind::asset_ref:
      return m.asset_type.empty() ? "Asset" : m.asset_type;
    case member_kind::event:
      return "Event";
    }
    return "unknown";
  }

  static std::string format(const member_value &value,
                            bool single_precision) {
    struct visitor {
      bool single;
      std::string operator()(std::monostate) const { return "null"; }
      std::string operator()(long long v) const { return std::to_string(v); }
      std::string operator()(double v) const {
        return detail::format_number(v, single);
      }
      std::string operator()(bool v) const { return v ? "true" : "false"; }
      std::string operator()(const std::string &v) const { return v; }
      std::string operator()(const vec3 &v) const {
        return "(" + detail::format_number(v.x, true) + ", " +
               detail::format_number(v.y, true) + ", " +
               detail::format_number(v.z, true) + ")";
      }
      std::string operator()(const std::shared_ptr<entity> &v) const {
        return v ? v->name() : "null";
      }
      std::string operator()(const std::shared_ptr<component> &v) const {
        if (!v)
          return "null";
        auto owner = v->owner();
        return owner ? owner->name() : "null";
      }
      std::string operator()(const std::shared_ptr<asset> &v) const {
        return v ? v->name : "null";
      }
    };
    return std::visit(visitor{single_precision}, value);
  }

  /// Every member of `c`, fields before properties, base types last.
  json list_members(const component &c) const {
    const auto &type = types_.type_of(c);
    json members = json::array();
    auto describe = [&](const member_descriptor &m) {
      json entry = {{"name", m.name},
                    {"kind", to_string(m.kind)},
                    {"type", type_name_of(m)},
                    {"visibility", to_string(m.visibility)},
                    {"member", m.kind == member_kind::event
                                   ? "event"
                                   : (m.is_property ? "property" : "field")},
                    {"writable", m.writable()},
                    {"value", format(m.get(c), m.single_precision)}};
      members.push_back(std::move(entry));
    };
    for (auto m : types_.fields_of(type))
      describe(*m);
    for (auto m : types_.properties_of(type))
      describe(*m);
    return members;
  }

  scene &world() const { return world_; }
  type_registry &types() const { return types_; }
  asset_database &assets() const { return assets_; }

private:
  void check_writable(const member_descriptor &m) const {
    if (m.kind == member_kind::event)
      throw bridge_error(error_code::read_only,
                         "Member '" + m.name +
                             "' is an event and cannot be assigned");
    if (!m.writable())
      throw bridge_error(error_code::read_only,
                         "Property '" + m.name + "' is read-only");
  }

  member_value adapt(const member_descriptor &m,
                     const std::shared_ptr<entity> &e) const {
    if (m.kind == member_kind::entity_ref)
      return e;
    if (m.kind == member_kind::component_ref) {
      for (const auto &c : e->components()) {
        if (types_.is_assignable(m.ref_type, std::type_index(typeid(*c))))
          return c;
      }
    }
    return std::monostate{};
  }

  member_value adapt(const member_descriptor &m,
                     const std::shared_ptr<asset> &a) const {
    if (m.kind == member_kind::asset_ref) {
      if (m.asset_type.empty() || a->type_name == m.asset_type)
        return a;
      return std::monostate{};
    }
    if (a->prefab_root)
      return adapt(m, a->prefab_root);
    return std::monostate{};
  }

  scene &world_;
  type_registry &types_;
  asset_database &assets_;
};

} // namespace hostlink
