#pragma once

#include <memory>
#include <string>

#include "assets.hpp"
#include "scene.hpp"
#include "types.hpp"

namespace hostlink {

struct rigidbody : component {
  float mass = 1.0f;
  bool use_gravity = true;
  bool is_kinematic = false;
};

struct collider : component {
  vec3 size{1.0f, 1.0f, 1.0f};
  bool is_trigger = false;
};

struct renderer : component {
  std::string color = "white";
  std::shared_ptr<asset> material;
};

struct sprite_renderer : renderer {
  std::string sprite;
};

struct canvas : component {
  /// 0 = screen overlay, 1 = screen camera, 2 = world space.
  int render_mode = 0;
  int sorting_order = 0;
};

struct ui_text : component {
  std::string value;
  int font_size = 14;
};

struct ui_image : component {
  std::string color = "white";
  float fill_amount = 1.0f;
};

struct health_system : component {
  float max_health = 100.0f;
  float current_health = 100.0f;
  host_event on_death;
  host_event on_health_changed;

  void apply_damage(float amount) {
    current_health = current_health > amount ? current_health - amount : 0.0f;
    on_health_changed.emit();
    if (current_health <= 0.0f)
      on_death.emit();
  }

private:
  friend void register_standard_components(type_registry &);
  float regen_timer_ = 0.0f;
};

struct mana_system : component {
  float max_mana = 100.0f;
  float current_mana = 100.0f;
  host_event on_mana_changed;
};

struct inventory_system : component {
  int capacity = 20;
  host_event on_inventory_changed;
};

struct combat_system : component {
  float damage = 10.0f;
  std::weak_ptr<health_system> health;
};

struct player_controller : component {
  float speed = 5.0f;
  float jump_force = 7.0f;
  std::weak_ptr<rigidbody> body;
};

struct enemy_ai : component {
  float aggro_range = 8.0f;
  std::weak_ptr<entity> target;
  std::weak_ptr<health_system> health;
};

struct game_manager : component {
  std::string game_name;
  int score = 0;
  std::weak_ptr<entity> player;
};

struct audio_manager : component {
  float master_volume = 1.0f;
};

struct save_system : component {
  std::string save_slot = "slot0";
};

struct event_system : component {
  host_event on_event;
};

struct quest_system : component {
  int active_quests = 0;
  host_event on_quest_completed;
};

struct health_bar : component {
  std::weak_ptr<health_system> health_source;
  float fill = 1.0f;
  std::weak_ptr<entity> player;
};

struct mana_bar : component {
  std::weak_ptr<mana_system> mana_source;
  float fill = 1.0f;
};

struct inventory_panel : component {
  std::weak_ptr<inventory_system> inventory;
  int columns = 5;
};

/// Register the stock component set under its wire names.
inline void register_standard_components(type_registry &types) {
  using vis = member_visibility;

  types.add<transform>("Transform")
      .field("position", &transform::position)
      .field("rotation", &transform::rotation)
      .field("scale", &transform::scale);

  types.add<rigidbody>("Rigidbody")
      .field("mass", &rigidbody::mass)
      .field("useGravity", &rigidbody::use_gravity)
      .field("isKinematic", &rigidbody::is_kinematic);

  types.add<collider>("Collider")
      .field("size", &collider::size)
      .field("isTrigger", &collider::is_trigger);

  types.add<renderer>("Renderer")
      .field("color", &renderer::color)
      .asset_field("material", &renderer::material, "Material");

  types.add<sprite_renderer>("SpriteRenderer")
      .base<renderer>()
      .field("sprite", &sprite_renderer::sprite);

  types.add<canvas>("Canvas")
      .field("renderMode", &canvas::render_mode)
      .field("sortingOrder", &canvas::sorting_order);

  types.add<ui_text>("Text")
      .field("text", &ui_text::value)
      .field("fontSize", &ui_text::font_size);

  types.add<ui_image>("Image")
      .field("color", &ui_image::color)
      .field("fillAmount", &ui_image::fill_amount);

  types.add<health_system>("HealthSystem")
      .field("maxHealth", &health_system::max_health)
      .field("currentHealth", &health_system::current_health)
      .event("onDeath", &health_system::on_death)
      .event("onHealthChanged", &health_system::on_health_changed)
      .field("regenTimer", &health_system::regen_timer_, vis::private_member)
      .property<bool>("isDead", [](const health_system &h) {
        return h.current_health <= 0.0f;
      });

  types.add<mana_system>("ManaSystem")
      .field("maxMana", &mana_system::max_mana)
      .field("currentMana", &mana_system::current_mana)
      .event("onManaChanged", &mana_system::on_mana_changed);

  types.add<inventory_system>("InventorySystem")
      .field("capacity", &inventory_system::capacity)
      .event("onInventoryChanged", &inventory_system::on_inventory_changed);

  types.add<combat_system>("CombatSystem")
      .field("damage", &combat_system::damage)
      .field("health", &combat_system::health, vis::serialized);

  types.add<player_controller>("PlayerController")
      .field("speed", &player_controller::speed)
      .field("jumpForce", &player_controller::jump_force)
      .field("body", &player_controller::body, vis::serialized);

  types.add<enemy_ai>("EnemyAI")
      .field("aggroRange", &enemy_ai::aggro_range)
      .field("target", &enemy_ai::target)
      .field("health", &enemy_ai::health, vis::serialized);

  types.add<game_manager>("GameManager")
      .field("gameName", &game_manager::game_name)
      .field("score", &game_manager::score)
      .field("player", &game_manager::player);

  types.add<audio_manager>("AudioManager")
      .field("masterVolume", &audio_manager::master_volume);

  types.add<save_system>("SaveSystem")
      .field("saveSlot", &save_system::save_slot);

  types.add<event_system>("EventSystem")
      .event("onEvent", &event_system::on_event);

  types.add<quest_system>("QuestSystem")
      .field("activeQuests", &quest_system::active_quests)
      .event("onQuestCompleted", &quest_system::on_quest_completed);

  types.add<health_bar>("HealthBar")
      .field("healthSystem", &health_bar::health_source)
      .field("fill", &health_bar::fill)
      .field("player", &health_bar::player, vis::serialized)
      .property<float>(
          "fillPercent",
          [](const health_bar &b) { return b.fill * 100.0f; },
          [](health_bar &b, const float &percent) { b.fill = percent / 100.0f; });

  types.add<mana_bar>("ManaBar")
      .field("manaSystem", &mana_bar::mana_source)
      .field("fill", &mana_bar::fill);

  types.add<inventory_panel>("InventoryPanel")
      .field("inventory", &inventory_panel::inventory, vis::serialized)
      .field("columns", &inventory_panel::columns);
}

} // namespace hostlink
