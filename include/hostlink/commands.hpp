#pragma once

#include <memory>
#include <string>
#include <typeindex>
#include <vector>

#include <nlohmann/json.hpp>

#include "assets.hpp"
#include "autowire.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "params.hpp"
#include "property_bridge.hpp"
#include "registry.hpp"
#include "scene.hpp"
#include "standard_components.hpp"
#include "types.hpp"

namespace hostlink {

/// Everything a command handler may touch. Lives on, and is only used from,
/// the host thread.
struct host_context {
  explicit host_context(const std::string &scene_name = "SampleScene")
      : world(scene_name), properties(world, types, assets),
        wiring(world, types, properties) {
    register_standard_components(types);
  }

  host_context(const host_context &) = delete;
  host_context &operator=(const host_context &) = delete;

  scene world;
  type_registry types;
  asset_database assets;
  property_bridge properties;
  autowirer wiring;
  /// Path of the last SaveScene, empty until the scene is saved.
  std::string scene_path;
};

namespace detail {

inline bool is_primitive(const std::string &name) {
  return name == "Cube" || name == "Sphere" || name == "Capsule" ||
         name == "Cylinder" || name == "Plane" || name == "Quad";
}

inline std::string component_name(const host_context &ctx, const component &c) {
  auto type = ctx.types.find(std::type_index(typeid(c)));
  return type ? type->name : std::string("Component");
}

inline bool active_in_hierarchy(const entity &e) {
  if (!e.active())
    return false;
  for (auto p = e.parent(); p; p = p->parent()) {
    if (!p->active())
      return false;
  }
  return true;
}

/// Create an entity from CreateEntity-style params.
inline std::shared_ptr<entity> spawn(host_context &ctx, const json &p) {
  auto name = params::require_string(p, "name");
  auto primitive = params::optional_string(p, "primitiveType");
  if (!primitive.empty() && !is_primitive(primitive))
    throw bridge_error(error_code::invalid_params,
                       "Unknown primitive type: " + primitive);

  std::shared_ptr<entity> parent;
  auto parent_name = params::optional_string(p, "parent");
  if (!parent_name.empty())
    parent = ctx.properties.resolve_entity(parent_name);

  auto e = ctx.world.create_entity(name, parent);
  if (!primitive.empty()) {
    e->add<renderer>();
    e->add<collider>();
  }
  auto tag = params::optional_string(p, "tag");
  if (!tag.empty())
    e->set_tag(tag);

  auto t = e->get_transform();
  if (auto position = params::optional_vec3(p, "position"))
    t->position = *position;
  if (auto rotation = params::optional_vec3(p, "rotation"))
    t->rotation = *rotation;
  if (auto scale = params::optional_vec3(p, "scale"))
    t->scale = *scale;
  return e;
}

inline std::shared_ptr<entity> clone(host_context &ctx, const entity &source,
                                     const std::string &name) {
  return scene::clone_tree(source, name, [&ctx](const component &c) {
    return ctx.types.clone(c);
  });
}

/// Save a detached copy of `e` as a Prefab asset at `path`.
inline std::shared_ptr<asset> save_prefab(host_context &ctx, const entity &e,
                                          const std::string &path) {
  auto a = ctx.assets.add(path, "Prefab",
                          {{"source", e.path()}, {"tag", e.tag()}});
  a->prefab_root = clone(ctx, e, e.name());
  logger()->info("prefab saved to {}", path);
  return a;
}

/// Attach registered components by name; unknown names are skipped.
inline std::vector<std::string>
attach_systems(host_context &ctx, entity &e,
               const std::vector<std::string> &systems) {
  std::vector<std::string> attached;
  for (const auto &name : systems) {
    if (ctx.types.find(name) == nullptr) {
      logger()->warn("system type not found: {}", name);
      continue;
    }
    e.add_component(ctx.types.create(name));
    attached.push_back(name);
  }
  return attached;
}

inline json name_list(const std::vector<std::shared_ptr<entity>> &entities) {
  json names = json::array();
  for (const auto &e : entities)
    names.push_back(e->name());
  return names;
}

} // namespace detail

inline void register_core_commands(command_registry &registry,
                                   host_context &ctx) {
  using detail::spawn;
  namespace p = params;

  registry.add("ping", [](const json &) { return json("pong"); });

  registry.add("GetHostInfo", [&ctx](const json &) {
    return json{{"name", "hostlink"},
                {"version", HOSTLINK_VERSION},
                {"scene", ctx.world.name()},
                {"entityCount", ctx.world.size()},
                {"assetCount", ctx.assets.size()},
                {"componentTypes", ctx.types.names()}};
  });

  registry.add("CreateEntity", [&ctx](const json &params) {
    auto e = spawn(ctx, params);
    return json{{"success", true}, {"name", e->name()}, {"path", e->path()}};
  });

  registry.add("BatchCreateEntities", [&ctx](const json &params) {
    auto objects = params.find("objects");
    if (objects == params.end() || !objects->is_array())
      throw bridge_error(error_code::invalid_params,
                         "\"objects\" must be an array");
    json created = json::array();
    json failed = json::array();
    for (const auto &item : *objects) {
      try {
        if (!item.is_object())
          throw bridge_error(error_code::invalid_params,
                             "each object must be a JSON object");
        created.push_back(spawn(ctx, item)->name());
      } catch (const bridge_error &e) {
        failed.push_back(json{{"object", item}, {"error", e.what()}});
      }
    }
    return json{{"success", failed.empty()},
                {"created", created},
                {"failed", failed},
                {"count", created.size()}};
  });

  registry.add("DeleteEntity", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    ctx.world.destroy(e);
    return json{{"success", true}};
  });

  registry.add("RenameEntity", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    auto old_name = e->name();
    e->set_name(p::require_string(params, "newName"));
    return json{{"success", true}, {"oldName", old_name}, {"newName", e->name()}};
  });

  registry.add("DuplicateEntity", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    auto name = p::optional_string(params, "newName", e->name() + " (Clone)");
    auto copy = detail::clone(ctx, *e, name);
    ctx.world.adopt(copy, e->parent());
    return json{{"success", true}, {"name", copy->name()}, {"path", copy->path()}};
  });

  registry.add("SetParent", [&ctx](const json &params) {
    auto child = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    auto parent_name = p::optional_string(params, "parentName");
    std::shared_ptr<entity> parent;
    if (!parent_name.empty())
      parent = ctx.properties.resolve_entity(parent_name);
    try {
      ctx.world.set_parent(child, parent);
    } catch (const std::invalid_argument &e) {
      throw bridge_error(error_code::invalid_params, e.what());
    }
    return json{{"success", true}, {"path", child->path()}};
  });

  registry.add("GetParent", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    auto parent = e->parent();
    return json{{"parent", parent ? json(parent->name()) : json(nullptr)}};
  });

  registry.add("GetChildren", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    return json{{"children", detail::name_list(e->children())},
                {"count", e->children().size()}};
  });

  registry.add("GetHierarchy", [&ctx](const json &params) {
    return json{{"hierarchy",
                 ctx.world.hierarchy(p::optional_bool(params, "rootOnly", false))}};
  });

  registry.add("SetActive", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    e->set_active(p::optional_bool(params, "active", true));
    return json{{"success", true}, {"active", e->active()}};
  });

  registry.add("GetActiveState", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    return json{{"activeSelf", e->active()},
                {"activeInHierarchy", detail::active_in_hierarchy(*e)}};
  });

  registry.add("SetTag", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    e->set_tag(p::require_string(params, "tag"));
    return json{{"success", true}};
  });

  registry.add("FindEntitiesByTag", [&ctx](const json &params) {
    auto found = ctx.world.find_all_by_tag(p::require_string(params, "tag"));
    return json{{"entities", detail::name_list(found)}, {"count", found.size()}};
  });

  registry.add("SetTransform", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    auto t = e->get_transform();
    if (auto position = p::optional_vec3(params, "position"))
      t->position = *position;
    if (auto rotation = p::optional_vec3(params, "rotation"))
      t->rotation = *rotation;
    if (auto scale = p::optional_vec3(params, "scale"))
      t->scale = *scale;
    return json{{"success", true}};
  });

  registry.add("AddComponent", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    auto type_name = p::require_string(params, "componentType");
    auto c = ctx.types.create(type_name);
    if (std::dynamic_pointer_cast<transform>(c))
      throw bridge_error(error_code::invalid_params,
                         e->name() + " already has a Transform");
    e->add_component(c);
    return json{{"success", true},
                {"componentType", detail::component_name(ctx, *c)}};
  });

  registry.add("RemoveComponent", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    auto c = ctx.properties.resolve_component(
        *e, p::require_string(params, "componentType"));
    if (std::dynamic_pointer_cast<transform>(c))
      throw bridge_error(error_code::invalid_params,
                         "Transform cannot be removed");
    e->remove_component(c);
    return json{{"success", true}};
  });

  registry.add("HasComponent", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    auto type = ctx.types.find(p::require_string(params, "componentType"));
    bool found = false;
    if (type != nullptr) {
      for (const auto &c : e->components())
        found = found || std::type_index(typeid(*c)) == type->type;
    }
    return json{{"hasComponent", found}};
  });

  registry.add("GetAllComponents", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    json names = json::array();
    for (const auto &c : e->components())
      names.push_back(detail::component_name(ctx, *c));
    return json{{"components", names}, {"count", names.size()}};
  });

  registry.add("GetComponentInfo", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    auto c = ctx.properties.resolve_component(
        *e, p::require_string(params, "componentType"));
    return json{{"componentType", detail::component_name(ctx, *c)},
                {"members", ctx.properties.list_members(*c)}};
  });

  registry.add("GetComponentProperty", [&ctx](const json &params) {
    auto v = ctx.properties.get(p::require_string(params, "entityName"),
                                p::require_string(params, "componentType"),
                                p::require_string(params, "propertyName"));
    return json{{"success", true}, {"value", v.value}, {"valueType", v.type}};
  });

  registry.add("SetComponentProperty", [&ctx](const json &params) {
    auto v = ctx.properties.set(p::require_string(params, "entityName"),
                                p::require_string(params, "componentType"),
                                p::require_string(params, "propertyName"),
                                p::value_text(params, "value"),
                                p::optional_string(params, "valueType"),
                                p::optional_bool(params, "required", false));
    return json{{"success", true}, {"value", v.value}, {"valueType", v.type}};
  });

  registry.add("FindAssets", [&ctx](const json &params) {
    auto filter = p::optional_string(params, "filter");
    auto type_name = p::optional_string(params, "type");
    auto found = type_name.empty() ? ctx.assets.query(filter)
                                   : ctx.assets.find(filter, type_name);
    json assets = json::array();
    for (const auto &a : found)
      assets.push_back(to_json(a));
    return json{{"assets", assets}, {"count", assets.size()}};
  });

  registry.add("CreatePrefab", [&ctx](const json &params) {
    auto e = ctx.properties.resolve_entity(p::require_string(params, "entityName"));
    auto path = p::optional_string(params, "path",
                                   "Assets/Prefabs/" + e->name() + ".prefab");
    auto a = detail::save_prefab(ctx, *e, path);
    return json{{"success", true}, {"path", a->path}};
  });

  registry.add("DeleteAsset", [&ctx](const json &params) {
    return json{{"success", ctx.assets.remove(p::require_string(params, "path"))}};
  });

  registry.add("SaveScene", [&ctx](const json &params) {
    auto path = p::optional_string(params, "path", ctx.scene_path);
    if (path.empty())
      path = ctx.world.name();
    if (path.rfind("Assets/", 0) != 0)
      path = "Assets/Scenes/" + path;
    if (path.size() < 6 || path.compare(path.size() - 6, 6, ".scene") != 0)
      path += ".scene";
    ctx.assets.add(path, "Scene",
                   {{"entityCount", ctx.world.size()},
                    {"hierarchy", ctx.world.hierarchy()}});
    ctx.scene_path = path;
    return json{{"success", true}, {"path", path}};
  });

  registry.add("GetActiveScene", [&ctx](const json &) {
    return json{{"name", ctx.world.name()},
                {"path", ctx.scene_path},
                {"rootCount", ctx.world.roots().size()},
                {"entityCount", ctx.world.size()}};
  });

  registry.add("LogMessage", [](const json &params) {
    auto message = p::require_string(params, "message");
    auto type = p::optional_string(params, "type", "log");
    if (type == "warning")
      logger()->warn("[client] {}", message);
    else if (type == "error")
      logger()->error("[client] {}", message);
    else
      logger()->info("[client] {}", message);
    return json{{"success", true}};
  });

  registry.add("ListCommands", [&registry](const json &) {
    auto names = registry.names();
    return json{{"commands", names}, {"count", names.size()}};
  });
}

} // namespace hostlink
