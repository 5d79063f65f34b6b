#include "../include/hostlink/hostlink.hpp"

#include <cassert>
#include <cstdio>
#include <functional>
#include <memory>
#include <string>

namespace {

bool throws_code(const std::function<void()> &fn, hostlink::error_code code) {
  try {
    fn();
  } catch (const hostlink::bridge_error &e) {
    return e.code() == code;
  }
  return false;
}

std::string error_text(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const hostlink::bridge_error &e) {
    return e.what();
  }
  return "";
}

} // namespace

int main() {
  using hostlink::error_code;
  int passed = 0;

  hostlink::host_context ctx;
  auto &bridge = ctx.properties;

  auto player = ctx.world.create_entity("Player");
  player->set_tag("Player");
  auto controller = player->add<hostlink::player_controller>();
  auto health = player->add<hostlink::health_system>();
  auto body = player->add<hostlink::rigidbody>();

  auto enemy = ctx.world.create_entity("Goblin");
  auto ai = enemy->add<hostlink::enemy_ai>();
  auto combat = enemy->add<hostlink::combat_system>();
  auto look = enemy->add<hostlink::renderer>();

  // --- get / set primitives ---
  {
    auto v = bridge.get("Player", "PlayerController", "speed");
    assert(v.value == "5");
    ++passed;
    assert(v.type == "float");
    ++passed;

    auto set = bridge.set("Player", "PlayerController", "speed", "9.5", "float");
    assert(set.value == "9.5");
    ++passed;
    assert(bridge.get("Player", "PlayerController", "speed").value == "9.5");
    ++passed;
    assert(controller->speed == 9.5f);
    ++passed;

    // the same set twice leaves the same value
    bridge.set("Player", "PlayerController", "speed", "9.5", "float");
    assert(bridge.get("Player", "PlayerController", "speed").value == "9.5");
    ++passed;

    bridge.set("Player", "PlayerController", "speed", "2.5f");
    assert(controller->speed == 2.5f);
    ++passed;

    bridge.set("Player", "Rigidbody", "useGravity", "false", "bool");
    assert(!body->use_gravity);
    ++passed;

    auto pos = bridge.set("Player", "Transform", "position", "(1, 2.5, -3)",
                          "Vector3");
    assert(pos.value == "(1, 2.5, -3)");
    ++passed;
    assert(pos.type == "Vector3");
    ++passed;

    ctx.world.create_entity("HUD")->add<hostlink::canvas>();
    bridge.set("HUD", "Canvas", "sortingOrder", "12", "int");
    assert(bridge.get("HUD", "Canvas", "sortingOrder").value == "12");
    ++passed;
  }

  // --- reads keep full precision and feed back into set unchanged ---
  {
    bridge.set("Player", "HealthSystem", "maxHealth", "1234.5678", "float");
    auto read = bridge.get("Player", "HealthSystem", "maxHealth");
    assert(read.value == "1234.5678");
    ++passed;
    auto stored = health->max_health;
    bridge.set("Player", "HealthSystem", "maxHealth", read.value, read.type);
    assert(health->max_health == stored);
    ++passed;
    assert(bridge.get("Player", "HealthSystem", "maxHealth").value == read.value);
    ++passed;

    bridge.set("Player", "HealthSystem", "maxHealth", "2500000");
    assert(bridge.get("Player", "HealthSystem", "maxHealth").value == "2500000");
    ++passed;

    bridge.set("Player", "Transform", "position", "(0.1, 123456.7, -7.654321)");
    auto pos = bridge.get("Player", "Transform", "position");
    assert(pos.value == "(0.1, 123456.7, -7.654321)");
    ++passed;
    auto before = player->get_transform()->position;
    bridge.set("Player", "Transform", "position", pos.value, pos.type);
    assert(player->get_transform()->position.y == before.y);
    ++passed;
    assert(player->get_transform()->position.z == before.z);
    ++passed;

    health->max_health = 100.0f;
  }

  // --- failures leave the graph untouched ---
  {
    auto before = controller->speed;
    assert(throws_code(
        [&]() { bridge.set("Player", "PlayerController", "sped", "1"); },
        error_code::member_not_found));
    ++passed;
    assert(controller->speed == before);
    ++passed;
    assert(error_text([&]() {
             bridge.get("Player", "PlayerController", "sped");
           }) == "Field or property not found: sped on PlayerController");
    ++passed;

    assert(error_text([&]() {
             bridge.set("Player", "PlayerController", "speed", "abc", "float");
           }) == "Cannot convert 'abc' to float (given type 'float')");
    ++passed;
    assert(controller->speed == before);
    ++passed;

    assert(throws_code(
        [&]() {
          bridge.set("Player", "PlayerController", "speed", "1", "quaternion");
        },
        error_code::conversion_error));
    ++passed;
    assert(throws_code(
        [&]() { bridge.set("HUD", "Canvas", "renderMode", "99999999999"); },
        error_code::conversion_error));
    ++passed;

    assert(error_text([&]() { bridge.get("Nobody", "Transform", "position"); }) ==
           "Entity not found: Nobody");
    ++passed;
    assert(throws_code([&]() { bridge.get("Player", "Canvas", "renderMode"); },
                       error_code::component_not_found));
    ++passed;
  }

  // --- read-only members ---
  {
    assert(bridge.get("Player", "HealthSystem", "isDead").value == "false");
    ++passed;
    assert(throws_code(
        [&]() { bridge.set("Player", "HealthSystem", "isDead", "true"); },
        error_code::read_only));
    ++passed;
    assert(throws_code(
        [&]() { bridge.set("Player", "HealthSystem", "onDeath", "x"); },
        error_code::read_only));
    ++passed;
    assert(bridge.get("Player", "HealthSystem", "onDeath").type == "Event");
    ++passed;
  }

  // --- references: live entity tier ---
  {
    auto v = bridge.set("Goblin", "EnemyAI", "target", "Player");
    assert(v.value == "Player" && v.type == "Entity");
    ++passed;
    assert(ai->target.lock() == player);
    ++passed;

    // a component reference resolves to the first assignable component
    bridge.set("Goblin", "CombatSystem", "health", "Player");
    assert(combat->health.lock() == health);
    ++passed;
    assert(bridge.get("Goblin", "CombatSystem", "health").type == "HealthSystem");
    ++passed;

    // unresolved and optional: the field is cleared
    bridge.set("Goblin", "EnemyAI", "target", "Nobody");
    assert(ai->target.expired());
    ++passed;
    assert(throws_code(
        [&]() {
          bridge.set("Goblin", "EnemyAI", "target", "Nobody", "", true);
        },
        error_code::conversion_error));
    ++passed;
  }

  // --- references: asset tiers ---
  {
    auto red = ctx.assets.add("Assets/Materials/Red.mat", "Material");
    ctx.assets.add("Assets/Textures/Red.png", "Texture");

    bridge.set("Goblin", "Renderer", "material", "Assets/Materials/Red.mat");
    assert(look->material == red);
    ++passed;

    look->material.reset();
    auto v = bridge.set("Goblin", "Renderer", "material", "Red");
    assert(look->material == red);
    ++passed;
    assert(v.value == "Red" && v.type == "Material");
    ++passed;

    // a path of the wrong asset type falls through to the name tier
    look->material.reset();
    bridge.set("Goblin", "Renderer", "material", "Assets/Textures/Red.png");
    assert(look->material == red);
    ++passed;
  }

  // --- references: prefab tier ---
  {
    auto spare = ctx.world.create_entity("SpareHero");
    auto spare_health = spare->add<hostlink::health_system>();
    spare_health->max_health = 250.0f;
    auto prefab = hostlink::detail::save_prefab(
        ctx, *spare, "Assets/Prefabs/SpareHero.prefab");
    ctx.world.destroy(spare);

    bridge.set("Goblin", "CombatSystem", "health",
               "Assets/Prefabs/SpareHero.prefab");
    auto resolved = combat->health.lock();
    assert(resolved != nullptr && resolved != spare_health);
    ++passed;
    assert(resolved->max_health == 250.0f);
    ++passed;
    assert(resolved->owner() == prefab->prefab_root);
    ++passed;
  }

  // --- private and inherited members ---
  {
    assert(bridge.get("Player", "HealthSystem", "regenTimer").value == "0");
    ++passed;
    auto sprite = ctx.world.create_entity("Coin");
    sprite->add<hostlink::sprite_renderer>();
    bridge.set("Coin", "SpriteRenderer", "color", "gold");
    assert(bridge.get("Coin", "SpriteRenderer", "color").value == "gold");
    ++passed;
    // lookup is by exact runtime type, not by base
    assert(throws_code([&]() { bridge.get("Coin", "Renderer", "color"); },
                       error_code::component_not_found));
    ++passed;
  }

  // --- list_members ---
  {
    auto members = bridge.list_members(*health);
    bool saw_event = false;
    bool saw_property = false;
    for (const auto &m : members) {
      if (m["name"] == "onDeath")
        saw_event = m["member"] == "event" && m["writable"] == false;
      if (m["name"] == "isDead")
        saw_property = m["member"] == "property" && m["writable"] == false;
    }
    assert(saw_event && saw_property);
    ++passed;
    assert(members[0]["name"] == "maxHealth" && members[0]["value"] == "100");
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
