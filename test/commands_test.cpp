#include "../include/hostlink/hostlink.hpp"

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <functional>
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

bool contains(const hostlink::json &array, const std::string &value) {
  return std::find(array.begin(), array.end(), value) != array.end();
}

} // namespace

int main() {
  using hostlink::error_code;
  using hostlink::json;
  int passed = 0;

  hostlink::host_context ctx("SampleScene");
  hostlink::command_registry registry;
  hostlink::register_core_commands(registry, ctx);
  hostlink::register_workflow_commands(registry, ctx, hostlink::bridge_options{});

  auto call = [&registry](const std::string &name, const json &params) {
    return registry.dispatch(name, params);
  };

  // --- registration ---
  {
    auto listed = call("ListCommands", json::object());
    assert(listed["count"] == registry.size());
    ++passed;
    assert(contains(listed["commands"], "SetComponentProperty"));
    ++passed;
    assert(contains(listed["commands"], "WireSystems"));
    ++passed;
    assert(call("ping", json::object()) == "pong");
    ++passed;
    auto info = call("GetHostInfo", json::object());
    assert(info["scene"] == "SampleScene");
    ++passed;
    assert(contains(info["componentTypes"], "HealthBar"));
    ++passed;
  }

  // --- entity lifecycle ---
  {
    auto created = call("CreateEntity", {{"name", "Crate"},
                                         {"primitiveType", "Cube"},
                                         {"position", {1, 2, 3}},
                                         {"tag", "Prop"}});
    assert(created["success"] == true && created["path"] == "Crate");
    ++passed;
    auto crate = ctx.world.find("Crate");
    assert(crate && crate->get<hostlink::renderer>() &&
           crate->get<hostlink::collider>());
    ++passed;
    assert(crate->get_transform()->position.y == 2.0f);
    ++passed;

    call("CreateEntity", {{"name", "Lid"}, {"parent", "Crate"}});
    assert(ctx.world.find("Crate/Lid") != nullptr);
    ++passed;

    assert(throws_code(
        [&]() { call("CreateEntity", {{"name", "X"}, {"primitiveType", "Torus"}}); },
        error_code::invalid_params));
    ++passed;
    assert(throws_code(
        [&]() { call("CreateEntity", {{"name", "X"}, {"parent", "Ghost"}}); },
        error_code::entity_not_found));
    ++passed;
    assert(throws_code([&]() { call("CreateEntity", json::object()); },
                       error_code::invalid_params));
    ++passed;

    auto batch = call("BatchCreateEntities",
                      {{"objects", {{{"name", "Tree1"}},
                                    {{"name", "Tree2"}, {"tag", "Flora"}},
                                    {{"primitiveType", "Cube"}}}}});
    assert(batch["count"] == 2);
    ++passed;
    assert(batch["success"] == false && batch["failed"].size() == 1);
    ++passed;

    call("RenameEntity", {{"entityName", "Tree1"}, {"newName", "Oak"}});
    assert(ctx.world.find("Oak") && !ctx.world.find("Tree1"));
    ++passed;

    auto dup = call("DuplicateEntity", {{"entityName", "Crate"}});
    assert(dup["name"] == "Crate (Clone)");
    ++passed;
    auto clone = ctx.world.find("Crate (Clone)");
    assert(clone->children().size() == 1);
    ++passed;
    assert(clone->get<hostlink::renderer>() != crate->get<hostlink::renderer>());
    ++passed;

    call("SetParent", {{"entityName", "Oak"}, {"parentName", "Crate"}});
    assert(call("GetParent", {{"entityName", "Oak"}})["parent"] == "Crate");
    ++passed;
    assert(call("GetChildren", {{"entityName", "Crate"}})["count"] == 2);
    ++passed;
    assert(throws_code(
        [&]() {
          call("SetParent", {{"entityName", "Crate"}, {"parentName", "Lid"}});
        },
        error_code::invalid_params));
    ++passed;
    call("SetParent", {{"entityName", "Oak"}});
    assert(call("GetParent", {{"entityName", "Oak"}})["parent"].is_null());
    ++passed;

    call("SetActive", {{"entityName", "Crate"}, {"active", false}});
    auto state = call("GetActiveState", {{"entityName", "Lid"}});
    assert(state["activeSelf"] == true && state["activeInHierarchy"] == false);
    ++passed;
    // inactive entities still resolve
    assert(call("GetAllComponents", {{"entityName", "Crate"}})["count"] == 3);
    ++passed;

    call("SetTag", {{"entityName", "Oak"}, {"tag", "Flora"}});
    auto flora = call("FindEntitiesByTag", {{"tag", "Flora"}});
    assert(flora["count"] == 2 && contains(flora["entities"], "Oak"));
    ++passed;

    call("SetTransform", {{"entityName", "Oak"},
                          {"scale", {{"x", 2}, {"y", 3}, {"z", 4}}}});
    assert(ctx.world.find("Oak")->get_transform()->scale.z == 4.0f);
    ++passed;

    auto hierarchy = call("GetHierarchy", {{"rootOnly", true}});
    assert(!contains(hierarchy["hierarchy"], "Lid"));
    ++passed;
    assert(contains(call("GetHierarchy", json::object())["hierarchy"], "  Lid"));
    ++passed;

    call("DeleteEntity", {{"entityName", "Crate (Clone)"}});
    assert(!ctx.world.find("Crate (Clone)"));
    ++passed;
  }

  // --- components ---
  {
    call("CreateEntity", {{"name", "Hero"}});
    auto added = call("AddComponent",
                      {{"entityName", "Hero"}, {"componentType", "HealthSystem"}});
    assert(added["componentType"] == "HealthSystem");
    ++passed;
    assert(call("HasComponent", {{"entityName", "Hero"},
                                 {"componentType", "HealthSystem"}})["hasComponent"] ==
           true);
    ++passed;
    assert(throws_code(
        [&]() {
          call("AddComponent", {{"entityName", "Hero"}, {"componentType", "Jetpack"}});
        },
        error_code::type_not_found));
    ++passed;
    assert(throws_code(
        [&]() {
          call("RemoveComponent",
               {{"entityName", "Hero"}, {"componentType", "Transform"}});
        },
        error_code::invalid_params));
    ++passed;

    auto info = call("GetComponentInfo",
                     {{"entityName", "Hero"}, {"componentType", "HealthSystem"}});
    assert(info["members"].size() == 6);
    ++passed;

    auto set = call("SetComponentProperty", {{"entityName", "Hero"},
                                             {"componentType", "HealthSystem"},
                                             {"propertyName", "maxHealth"},
                                             {"value", 150},
                                             {"valueType", "float"}});
    assert(set["value"] == "150" && set["valueType"] == "float");
    ++passed;
    auto got = call("GetComponentProperty", {{"entityName", "Hero"},
                                             {"componentType", "HealthSystem"},
                                             {"propertyName", "maxHealth"}});
    assert(got["value"] == "150");
    ++passed;

    call("RemoveComponent",
         {{"entityName", "Hero"}, {"componentType", "HealthSystem"}});
    assert(!ctx.world.find("Hero")->get<hostlink::health_system>());
    ++passed;
  }

  // --- assets and scene ---
  {
    auto prefab = call("CreatePrefab", {{"entityName", "Hero"}});
    assert(prefab["path"] == "Assets/Prefabs/Hero.prefab");
    ++passed;
    auto found = call("FindAssets", {{"filter", "hero t:Prefab"}});
    assert(found["count"] == 1 && found["assets"][0]["type"] == "Prefab");
    ++passed;
    assert(call("FindAssets", {{"filter", "hero"}, {"type", "Scene"}})["count"] == 0);
    ++passed;

    auto saved = call("SaveScene", {{"path", "Level1"}});
    assert(saved["path"] == "Assets/Scenes/Level1.scene");
    ++passed;
    assert(call("GetActiveScene", json::object())["path"] ==
           "Assets/Scenes/Level1.scene");
    ++passed;

    assert(call("DeleteAsset", {{"path", "Assets/Prefabs/Hero.prefab"}})["success"] ==
           true);
    ++passed;
    assert(call("DeleteAsset", {{"path", "Assets/Prefabs/Hero.prefab"}})["success"] ==
           false);
    ++passed;

    assert(call("LogMessage", {{"message", "hello"}, {"type", "warning"}})["success"] ==
           true);
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
