#pragma once

#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <variant>
#include <vector>

#include "assets.hpp"
#include "errors.hpp"
#include "scene.hpp"

namespace hostlink {

/// Event-like member. Listeners are attached when the host runs the graph.
struct host_event {
  std::vector<std::function<void()>> listeners;

  void connect(std::function<void()> fn) { listeners.push_back(std::move(fn)); }
  void emit() const {
    for (const auto &fn : listeners)
      fn();
  }
};

enum class member_kind {
  integer,
  floating,
  boolean,
  string,
  vector3,
  entity_ref,
  component_ref,
  asset_ref,
  event,
};

enum class member_visibility {
  public_member,
  /// Non-public but settable from outside (inspector-style).
  serialized,
  private_member,
};

inline bool is_reference(member_kind kind) {
  return kind == member_kind::entity_ref || kind == member_kind::component_ref ||
         kind == member_kind::asset_ref;
}

using member_value =
    std::variant<std::monostate, long long, double, bool, std::string, vec3,
                 std::shared_ptr<entity>, std::shared_ptr<component>,
                 std::shared_ptr<asset>>;

/// Typed accessor pair for one named member of a component type.
struct member_descriptor {
  std::string name;
  member_kind kind = member_kind::string;
  member_visibility visibility = member_visibility::public_member;
  bool is_property = false;
  /// Declared component type for component_ref members.
  std::type_index ref_type{typeid(void)};
  /// Declared asset type for asset_ref members, empty for any.
  std::string asset_type;
  /// Floating member stored as `float`.
  bool single_precision = false;
  std::function<member_value(const component &)> get;
  std::function<void(component &, const member_value &)> set;

  bool writable() const { return static_cast<bool>(set); }
};

namespace detail {

[[noreturn]] inline void wrong_value(const std::string &expected) {
  throw bridge_error(error_code::conversion_error,
                     "value is not a " + expected);
}

struct no_ref_type {
  static std::type_index ref_type() { return typeid(void); }
};

template <typename M, typename Enable = void> struct member_traits;

template <typename M>
struct member_traits<
    M, std::enable_if_t<std::is_integral_v<M> && !std::is_same_v<M, bool>>>
    : no_ref_type {
  static constexpr member_kind kind = member_kind::integer;
  static member_value to_value(const M &v) { return static_cast<long long>(v); }
  static M from_value(const member_value &v) {
    auto p = std::get_if<long long>(&v);
    if (p == nullptr)
      wrong_value("int");
    bool in_range = true;
    if constexpr (std::is_signed_v<M>) {
      in_range = *p >= static_cast<long long>(std::numeric_limits<M>::min()) &&
                 *p <= static_cast<long long>(std::numeric_limits<M>::max());
    } else {
      in_range = *p >= 0 &&
                 static_cast<unsigned long long>(*p) <=
                     static_cast<unsigned long long>(
                         std::numeric_limits<M>::max());
    }
    if (!in_range)
      throw bridge_error(error_code::conversion_error,
                         "integer " + std::to_string(*p) + " is out of range");
    return static_cast<M>(*p);
  }
};

template <typename M>
struct member_traits<M, std::enable_if_t<std::is_floating_point_v<M>>>
    : no_ref_type {
  static constexpr member_kind kind = member_kind::floating;
  static member_value to_value(const M &v) { return static_cast<double>(v); }
  static M from_value(const member_value &v) {
    if (auto p = std::get_if<double>(&v))
      return static_cast<M>(*p);
    if (auto p = std::get_if<long long>(&v))
      return static_cast<M>(*p);
    wrong_value("float");
  }
};

template <> struct member_traits<bool> : no_ref_type {
  static constexpr member_kind kind = member_kind::boolean;
  static member_value to_value(const bool &v) { return v; }
  static bool from_value(const member_value &v) {
    if (auto p = std::get_if<bool>(&v))
      return *p;
    wrong_value("bool");
  }
};

template <> struct member_traits<std::string> : no_ref_type {
  static constexpr member_kind kind = member_kind::string;
  static member_value to_value(const std::string &v) { return v; }
  static std::string from_value(const member_value &v) {
    if (auto p = std::get_if<std::string>(&v))
      return *p;
    wrong_value("string");
  }
};

template <> struct member_traits<vec3> : no_ref_type {
  static constexpr member_kind kind = member_kind::vector3;
  static member_value to_value(const vec3 &v) { return v; }
  static vec3 from_value(const member_value &v) {
    if (auto p = std::get_if<vec3>(&v))
      return *p;
    wrong_value("Vector3");
  }
};

template <> struct member_traits<std::weak_ptr<entity>> : no_ref_type {
  static constexpr member_kind kind = member_kind::entity_ref;
  static member_value to_value(const std::weak_ptr<entity> &v) {
    return v.lock();
  }
  static std::weak_ptr<entity> from_value(const member_value &v) {
    if (std::holds_alternative<std::monostate>(v))
      return {};
    if (auto p = std::get_if<std::shared_ptr<entity>>(&v))
      return *p;
    wrong_value("Entity");
  }
};

template <typename U>
struct member_traits<std::weak_ptr<U>,
                     std::enable_if_t<std::is_base_of_v<component, U>>> {
  static constexpr member_kind kind = member_kind::component_ref;
  static std::type_index ref_type() { return typeid(U); }
  static member_value to_value(const std::weak_ptr<U> &v) {
    return std::shared_ptr<component>(v.lock());
  }
  static std::weak_ptr<U> from_value(const member_value &v) {
    if (std::holds_alternative<std::monostate>(v))
      return {};
    auto p = std::get_if<std::shared_ptr<component>>(&v);
    if (p == nullptr)
      wrong_value("component");
    if (!*p)
      return {};
    auto typed = std::dynamic_pointer_cast<U>(*p);
    if (!typed)
      throw bridge_error(error_code::conversion_error,
                         "component is not assignable to the declared type");
    return typed;
  }
};

template <> struct member_traits<std::shared_ptr<asset>> : no_ref_type {
  static constexpr member_kind kind = member_kind::asset_ref;
  static member_value to_value(const std::shared_ptr<asset> &v) { return v; }
  static std::shared_ptr<asset> from_value(const member_value &v) {
    if (std::holds_alternative<std::monostate>(v))
      return nullptr;
    if (auto p = std::get_if<std::shared_ptr<asset>>(&v))
      return *p;
    wrong_value("asset");
  }
};

} // namespace detail

/// Registered description of one concrete component class.
struct component_type {
  std::string name;
  std::type_index type{typeid(void)};
  std::optional<std::type_index> base;
  std::vector<member_descriptor> fields;
  std::vector<member_descriptor> properties;
  std::function<std::shared_ptr<component>()> create;
  std::function<std::shared_ptr<component>(const component &)> clone;
};

template <typename T> class type_builder {
public:
  explicit type_builder(component_type &type) : type_(type) {}

  template <typename B> type_builder &base() {
    static_assert(std::is_base_of_v<B, T>, "B must be a base of T");
    type_.base = std::type_index(typeid(B));
    return *this;
  }

  template <typename M>
  type_builder &
  field(const std::string &name, M T::*member,
        member_visibility visibility = member_visibility::public_member) {
    using traits = detail::member_traits<M>;
    member_descriptor d;
    d.name = name;
    d.kind = traits::kind;
    d.single_precision = std::is_same_v<M, float>;
    d.visibility = visibility;
    d.ref_type = traits::ref_type();
    d.get = [member](const component &c) {
      return traits::to_value(static_cast<const T &>(c).*member);
    };
    d.set = [member](component &c, const member_value &v) {
      static_cast<T &>(c).*member = traits::from_value(v);
    };
    type_.fields.push_back(std::move(d));
    return *this;
  }

  type_builder &
  asset_field(const std::string &name, std::shared_ptr<asset> T::*member,
              const std::string &asset_type,
              member_visibility visibility = member_visibility::public_member) {
    field(name, member, visibility);
    type_.fields.back().asset_type = asset_type;
    return *this;
  }

  type_builder &
  event(const std::string &name, host_event T::*member,
        member_visibility visibility = member_visibility::public_member) {
    member_descriptor d;
    d.name = name;
    d.kind = member_kind::event;
    d.visibility = visibility;
    d.get = [member](const component &c) -> member_value {
      auto count = (static_cast<const T &>(c).*member).listeners.size();
      return std::to_string(count) + " listeners";
    };
    type_.fields.push_back(std::move(d));
    return *this;
  }

  /// Computed member. A null setter makes it read-only.
  template <typename M>
  type_builder &
  property(const std::string &name, std::function<M(const T &)> getter,
           std::function<void(T &, const M &)> setter = nullptr,
           member_visibility visibility = member_visibility::public_member) {
    using traits = detail::member_traits<M>;
    member_descriptor d;
    d.name = name;
    d.kind = traits::kind;
    d.single_precision = std::is_same_v<M, float>;
    d.visibility = visibility;
    d.is_property = true;
    d.ref_type = traits::ref_type();
    d.get = [getter](const component &c) {
      return traits::to_value(getter(static_cast<const T &>(c)));
    };
    if (setter) {
      d.set = [setter](component &c, const member_value &v) {
        setter(static_cast<T &>(c), traits::from_value(v));
      };
    }
    type_.properties.push_back(std::move(d));
    return *this;
  }

private:
  component_type &type_;
};

/// Maps type names to typed adapters.
class type_registry {
public:
  template <typename T> type_builder<T> add(const std::string &name) {
    static_assert(std::is_base_of_v<component, T>,
                  "registered types must derive from component");
    if (name.empty())
      throw std::invalid_argument("component type name is required");
    if (by_name_.count(name) != 0 || by_type_.count(typeid(T)) != 0)
      throw std::invalid_argument("component type already registered: " +
                                  name);

    auto type = std::make_unique<component_type>();
    type->name = name;
    type->type = typeid(T);
    if constexpr (std::is_default_constructible_v<T>)
      type->create = []() { return std::make_shared<T>(); };
    type->clone = [](const component &c) -> std::shared_ptr<component> {
      return std::make_shared<T>(static_cast<const T &>(c));
    };

    auto &ref = *type;
    by_type_.emplace(std::type_index(typeid(T)), &ref);
    by_name_.emplace(name, std::move(type));
    return type_builder<T>(ref);
  }

  /// Exact name, or the last segment of a dotted name ("Engine.Canvas").
  const component_type *find(const std::string &name) const {
    auto it = by_name_.find(name);
    if (it != by_name_.end())
      return it->second.get();
    auto dot = name.find_last_of('.');
    if (dot != std::string::npos && dot + 1 < name.size()) {
      it = by_name_.find(name.substr(dot + 1));
      if (it != by_name_.end())
        return it->second.get();
    }
    return nullptr;
  }

  const component_type *find(std::type_index type) const {
    auto it = by_type_.find(type);
    return it == by_type_.end() ? nullptr : it->second;
  }

  const component_type &type_of(const component &c) const {
    if (auto type = find(std::type_index(typeid(c))))
      return *type;
    throw bridge_error(error_code::type_not_found,
                       std::string("component type not registered: ") +
                           typeid(c).name());
  }

  /// Registered name, "Component" for the common base.
  std::string name_of(std::type_index type) const {
    if (type == std::type_index(typeid(component)))
      return "Component";
    if (auto found = find(type))
      return found->name;
    return type.name();
  }

  bool is_assignable(std::type_index declared, std::type_index runtime) const {
    if (declared == std::type_index(typeid(component)))
      return true;
    std::optional<std::type_index> current = runtime;
    while (current) {
      if (*current == declared)
        return true;
      auto type = find(*current);
      current = type ? type->base : std::nullopt;
    }
    return false;
  }

  std::shared_ptr<component> create(const std::string &name) const {
    auto type = find(name);
    if (type == nullptr)
      throw bridge_error(error_code::type_not_found,
                         "Component type not found: " + name);
    if (!type->create)
      throw bridge_error(error_code::type_not_found,
                         "Component type cannot be instantiated: " + name);
    return type->create();
  }

  std::shared_ptr<component> clone(const component &c) const {
    return type_of(c).clone(c);
  }

  /// Fields of `type` and then of its registered bases.
  std::vector<const member_descriptor *>
  fields_of(const component_type &type) const {
    std::vector<const member_descriptor *> result;
    for (auto t = &type; t != nullptr; t = base_of(*t)) {
      for (const auto &m : t->fields)
        result.push_back(&m);
    }
    return result;
  }

  std::vector<const member_descriptor *>
  properties_of(const component_type &type) const {
    std::vector<const member_descriptor *> result;
    for (auto t = &type; t != nullptr; t = base_of(*t)) {
      for (const auto &m : t->properties)
        result.push_back(&m);
    }
    return result;
  }

  /// Fields first, then properties; exact name, every visibility.
  const member_descriptor *find_member(const component_type &type,
                                       const std::string &name) const {
    for (auto m : fields_of(type)) {
      if (m->name == name)
        return m;
    }
    for (auto m : properties_of(type)) {
      if (m->name == name)
        return m;
    }
    return nullptr;
  }

  std::vector<std::string> names() const {
    std::vector<std::string> result;
    for (const auto &kv : by_name_)
      result.push_back(kv.first);
    return result;
  }

  std::size_t size() const { return by_name_.size(); }

private:
  const component_type *base_of(const component_type &type) const {
    return type.base ? find(*type.base) : nullptr;
  }

  std::map<std::string, std::unique_ptr<component_type>> by_name_;
  std::unordered_map<std::type_index, component_type *> by_type_;
};

} // namespace hostlink
