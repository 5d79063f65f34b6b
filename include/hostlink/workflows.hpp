#pragma once

#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "autowire.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "params.hpp"
#include "registry.hpp"
#include "standard_components.hpp"

namespace hostlink {

/// Root entities created by SetupSceneStructure when no list is given.
inline const std::vector<std::string> &default_scene_structure() {
  static const std::vector<std::string> structure = {
      "--- MANAGERS ---", "--- PLAYER ---", "--- ENEMIES ---",
      "--- ENVIRONMENT ---", "--- UI ---"};
  return structure;
}

/// Undo log for one workflow command. An atomic scope that is destroyed
/// without commit() reverts every recorded change, newest first.
class workflow_scope {
public:
  workflow_scope(host_context &ctx, bool atomic) : ctx_(ctx), atomic_(atomic) {}

  workflow_scope(const workflow_scope &) = delete;
  workflow_scope &operator=(const workflow_scope &) = delete;

  ~workflow_scope() {
    if (atomic_ && !committed_)
      rollback();
  }

  bool atomic() const { return atomic_; }

  std::shared_ptr<entity> created(std::shared_ptr<entity> e) {
    auto &world = ctx_.world;
    undo_.push_back([&world, e]() { world.destroy(e); });
    return e;
  }

  /// Call before writing the asset at `path`.
  void replacing_asset(const std::string &path) {
    auto &assets = ctx_.assets;
    auto previous = assets.load(path);
    undo_.push_back([&assets, path, previous]() {
      if (previous)
        assets.put(previous);
      else
        assets.remove(path);
    });
  }

  void on_rollback(std::function<void()> fn) { undo_.push_back(std::move(fn)); }

  void commit() { committed_ = true; }

  void rollback() {
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it)
      (*it)();
    undo_.clear();
    logger()->warn("workflow rolled back");
  }

private:
  host_context &ctx_;
  bool atomic_;
  bool committed_ = false;
  std::vector<std::function<void()>> undo_;
};

namespace detail {

inline bool contains_any(const std::string &text,
                         std::initializer_list<const char *> needles) {
  for (auto needle : needles) {
    if (text.find(needle) != std::string::npos)
      return true;
  }
  return false;
}

inline std::vector<std::string>
select_systems(const std::vector<std::string> &systems,
               std::initializer_list<const char *> needles) {
  std::vector<std::string> selected;
  for (const auto &s : systems) {
    if (contains_any(s, needles))
      selected.push_back(s);
  }
  return selected;
}

inline std::shared_ptr<entity> find_or_create_root(host_context &ctx,
                                                   workflow_scope &scope,
                                                   const std::string &name) {
  if (auto existing = ctx.world.find(name))
    return existing;
  return scope.created(ctx.world.create_entity(name));
}

inline std::shared_ptr<asset> save_prefab(host_context &ctx,
                                          workflow_scope &scope,
                                          const entity &e,
                                          const std::string &path) {
  scope.replacing_asset(path);
  return save_prefab(ctx, e, path);
}

inline std::string replace_spaces(std::string text) {
  for (auto &c : text) {
    if (c == ' ')
      c = '_';
  }
  return text;
}

} // namespace detail

inline json setup_scene_structure(host_context &ctx, workflow_scope &scope,
                                  const std::vector<std::string> &structure) {
  json created = json::array();
  for (const auto &name : structure) {
    if (ctx.world.find(name))
      continue;
    scope.created(ctx.world.create_entity(name));
    created.push_back(name);
  }
  return json{{"success", true},
              {"created", created},
              {"message", "Scene structure created with " +
                              std::to_string(created.size()) +
                              " root objects"}};
}

inline json setup_game_manager(host_context &ctx, workflow_scope &scope,
                               const std::vector<std::string> &systems) {
  auto parent = detail::find_or_create_root(ctx, scope, "--- MANAGERS ---");
  auto manager = scope.created(ctx.world.create_entity("GameManager", parent));
  auto attached = detail::attach_systems(ctx, *manager, systems);
  return json{{"success", true},
              {"entity", manager->name()},
              {"attachedSystems", attached},
              {"message", "GameManager created with " +
                              std::to_string(attached.size()) + " systems"}};
}

inline json setup_player(host_context &ctx, workflow_scope &scope,
                         const std::string &player_type,
                         const std::vector<std::string> &systems,
                         bool create_model) {
  auto parent = detail::find_or_create_root(ctx, scope, "--- PLAYER ---");
  auto player = scope.created(ctx.world.create_entity("Player", parent));
  player->set_tag("Player");

  if (create_model) {
    if (player_type == "2D") {
      player->add<sprite_renderer>()->color = "green";
    } else {
      player->add<renderer>();
    }
    player->add<rigidbody>();
    player->add<collider>();
  }

  auto attached = detail::attach_systems(ctx, *player, systems);
  auto prefab = detail::save_prefab(ctx, scope, *player,
                                    "Assets/Prefabs/Characters/Player.prefab");
  return json{{"success", true},
              {"entity", player->name()},
              {"prefabPath", prefab->path},
              {"attachedSystems", attached},
              {"playerType", player_type.empty() ? "3D" : player_type},
              {"message", "Player created with " +
                              std::to_string(attached.size()) +
                              " systems and saved as prefab"}};
}

/// Build a canvas with one widget per UI-capable system and wire each
/// widget to the matching component on the entity tagged "Player".
inline json setup_game_ui(host_context &ctx, workflow_scope &scope,
                          const std::vector<std::string> &systems) {
  auto parent = detail::find_or_create_root(ctx, scope, "--- UI ---");
  auto canvas_entity =
      scope.created(ctx.world.create_entity("GameCanvas", parent));
  canvas_entity->add<canvas>();

  auto tagged = ctx.world.find_all_by_tag("Player");
  auto player = tagged.empty() ? nullptr : tagged.front();

  json elements = json::array();
  wiring_report wiring;

  auto widget = [&](const std::string &name, std::shared_ptr<component> ui,
                    std::shared_ptr<component> source,
                    const std::string &source_type) {
    auto e = ctx.world.create_entity(name, canvas_entity);
    e->add<ui_image>();
    e->add_component(ui);
    elements.push_back(name);
    if (!player)
      return;
    if (!source) {
      wire_outcome missing;
      missing.source = source_type;
      missing.target = name;
      missing.reason = "Player has no " + source_type;
      wiring.failed.push_back(missing);
      return;
    }
    auto outcome = ctx.wiring.connect(source, ui, source_type);
    (outcome.wired ? wiring.wired : wiring.failed).push_back(outcome);
  };

  for (const auto &system : systems) {
    if (system.find("Health") != std::string::npos) {
      auto bar = std::make_shared<health_bar>();
      if (player)
        bar->player = player;
      widget("HealthBar", bar,
             player ? player->get<health_system>() : nullptr, "HealthSystem");
    }
    if (detail::contains_any(system, {"Mana", "Energy"})) {
      widget("ManaBar", std::make_shared<mana_bar>(),
             player ? player->get<mana_system>() : nullptr, "ManaSystem");
    }
    if (system.find("Inventory") != std::string::npos) {
      widget("InventoryPanel", std::make_shared<inventory_panel>(),
             player ? player->get<inventory_system>() : nullptr,
             "InventorySystem");
    }
  }

  if (scope.atomic() && !wiring.failed.empty())
    throw bridge_error(error_code::host_exception,
                       "SetupGameUI rolled back: " +
                           wiring.failed.front().reason);

  auto prefab = detail::save_prefab(ctx, scope, *canvas_entity,
                                    "Assets/Prefabs/UI/GameCanvas.prefab");
  bool wired_to_player = player != nullptr && !wiring.wired.empty();
  return json{{"success", true},
              {"canvas", canvas_entity->name()},
              {"prefabPath", prefab->path},
              {"elements", elements},
              {"wiring", wiring.to_json()},
              {"wiredToPlayer", wired_to_player},
              {"message", "UI Canvas created with " +
                              std::to_string(elements.size()) +
                              " elements, wired to Player: " +
                              (wired_to_player ? "true" : "false")}};
}

inline json create_enemy(host_context &ctx, workflow_scope &scope,
                         const std::string &name,
                         const std::string &enemy_type,
                         const std::vector<std::string> &systems,
                         bool create_model) {
  auto parent = detail::find_or_create_root(ctx, scope, "--- ENEMIES ---");
  auto enemy = scope.created(ctx.world.create_entity(name, parent));
  enemy->set_tag("Enemy");

  if (create_model) {
    enemy->add<renderer>()->color = "red";
    enemy->add<collider>();
    enemy->add<rigidbody>();
  }

  auto attached = detail::attach_systems(ctx, *enemy, systems);
  auto prefab = detail::save_prefab(
      ctx, scope, *enemy,
      "Assets/Prefabs/Enemies/" + detail::replace_spaces(name) + ".prefab");
  return json{{"success", true},
              {"entity", enemy->name()},
              {"prefabPath", prefab->path},
              {"enemyType", enemy_type.empty() ? "Melee" : enemy_type},
              {"attachedSystems", attached},
              {"message", "Enemy '" + name + "' created with " +
                              std::to_string(attached.size()) +
                              " systems and saved as prefab"}};
}

inline std::vector<wire_request> parse_connections(const json &p) {
  auto it = p.find("connections");
  if (it == p.end() || !it->is_array())
    throw bridge_error(error_code::invalid_params,
                       "\"connections\" must be an array");
  std::vector<wire_request> requests;
  for (const auto &conn : *it) {
    wire_request req;
    if (!conn.is_object()) {
      req.error = std::string("connection must be an object, got ") +
                  conn.type_name();
    } else {
      try {
        req.source = params::optional_string(conn, "source");
        req.target = params::optional_string(conn, "target");
        req.event_name = params::optional_string(conn, "eventName");
      } catch (const bridge_error &e) {
        req.error = e.what();
      }
    }
    requests.push_back(std::move(req));
  }
  return requests;
}

inline json generate_game(host_context &ctx, workflow_scope &scope,
                          const json &p) {
  auto game_name = params::require_string(p, "gameName");
  auto game_type = params::optional_string(p, "gameType");
  auto systems = params::string_list(p, "systems");
  json created = json::array();

  setup_scene_structure(ctx, scope, default_scene_structure());
  created.push_back("Scene structure created");

  auto manager_systems =
      detail::select_systems(systems, {"Manager", "Save", "Audio", "Event"});
  if (!manager_systems.empty()) {
    setup_game_manager(ctx, scope, manager_systems);
    created.push_back("GameManager with " +
                      std::to_string(manager_systems.size()) + " systems");
  }

  if (params::optional_bool(p, "createPlayer", true)) {
    auto player_systems = detail::select_systems(
        systems,
        {"Health", "Mana", "Inventory", "Combat", "Controller", "Stat"});
    auto player_type =
        game_type.find("2D") != std::string::npos ? "2D" : "3D";
    setup_player(ctx, scope, player_type, player_systems, true);
    created.push_back("Player with " + std::to_string(player_systems.size()) +
                      " systems");
  }

  if (params::optional_bool(p, "createUI", true)) {
    auto ui_systems = detail::select_systems(
        systems,
        {"Health", "Mana", "Energy", "Inventory", "Quest", "Minimap"});
    setup_game_ui(ctx, scope, ui_systems);
    created.push_back("UI Canvas with " + std::to_string(ui_systems.size()) +
                      " elements");
  }

  auto scene_path = "Assets/Scenes/" + game_name + ".scene";
  auto old_name = ctx.world.name();
  auto old_path = ctx.scene_path;
  scope.on_rollback([&ctx, old_name, old_path]() {
    ctx.world.set_name(old_name);
    ctx.scene_path = old_path;
  });
  scope.replacing_asset(scene_path);
  ctx.world.set_name(game_name);
  ctx.assets.add(scene_path, "Scene",
                 {{"entityCount", ctx.world.size()},
                  {"hierarchy", ctx.world.hierarchy()}});
  ctx.scene_path = scene_path;

  return json{{"success", true},
              {"gameName", game_name},
              {"scenePath", scene_path},
              {"created", created},
              {"message", "Game '" + game_name + "' generated with " +
                              std::to_string(created.size()) + " components"}};
}

/// Register the composite commands. `options.atomic_workflows` picks the
/// default policy; an "atomic" param overrides it per request.
inline void register_workflow_commands(command_registry &registry,
                                       host_context &ctx,
                                       const bridge_options &options) {
  bool atomic_default = options.atomic_workflows;

  // Each handler runs `body` inside a scope that commits on success.
  auto transactional = [&ctx, atomic_default](
                           std::function<json(workflow_scope &, const json &)>
                               body) {
    return [&ctx, atomic_default, body](const json &p) {
      workflow_scope scope(ctx,
                           params::optional_bool(p, "atomic", atomic_default));
      auto result = body(scope, p);
      scope.commit();
      return result;
    };
  };

  registry.add("SetupSceneStructure",
               transactional([&ctx](workflow_scope &scope, const json &p) {
                 auto structure = params::string_list(p, "structure");
                 if (structure.empty())
                   structure = default_scene_structure();
                 return setup_scene_structure(ctx, scope, structure);
               }));

  registry.add("SetupGameManager",
               transactional([&ctx](workflow_scope &scope, const json &p) {
                 return setup_game_manager(
                     ctx, scope, params::string_list(p, "systems", true));
               }));

  registry.add("SetupPlayer",
               transactional([&ctx](workflow_scope &scope, const json &p) {
                 return setup_player(
                     ctx, scope, params::optional_string(p, "playerType", "3D"),
                     params::string_list(p, "systems", true),
                     params::optional_bool(p, "createModel", true));
               }));

  registry.add("SetupGameUI",
               transactional([&ctx](workflow_scope &scope, const json &p) {
                 return setup_game_ui(ctx, scope,
                                      params::string_list(p, "systems", true));
               }));

  registry.add("CreateEnemy",
               transactional([&ctx](workflow_scope &scope, const json &p) {
                 return create_enemy(
                     ctx, scope, params::require_string(p, "enemyName"),
                     params::optional_string(p, "enemyType"),
                     params::string_list(p, "systems"),
                     params::optional_bool(p, "createModel", true));
               }));

  registry.add("GenerateGame",
               transactional([&ctx](workflow_scope &scope, const json &p) {
                 return generate_game(ctx, scope, p);
               }));

  registry.add("WireSystems", [&ctx, atomic_default](const json &p) {
    auto requests = parse_connections(p);
    auto policy = params::optional_bool(p, "atomic", atomic_default)
                      ? wiring_policy::atomic
                      : wiring_policy::best_effort;
    return ctx.wiring.wire(requests, policy).to_json();
  });
}

} // namespace hostlink
