#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "log.hpp"
#include "property_bridge.hpp"
#include "scene.hpp"
#include "types.hpp"

namespace hostlink {

struct wire_request {
  std::string source;
  std::string target;
  std::string event_name;
  /// Set when the entry could not be read; the pair fails with it.
  std::string error;
};

/// What happened to one source/target pair.
struct wire_outcome {
  std::string source;
  std::string target;
  bool wired = false;
  std::string member; // field that received the reference, or the event
  std::string mode;   // "component", "entity" or "deferred_event"
  std::string reason; // why the pair failed

  nlohmann::json to_json() const {
    nlohmann::json j = {{"source", source}, {"target", target}};
    if (wired) {
      j["field"] = member;
      j["mode"] = mode;
    } else {
      j["reason"] = reason;
    }
    return j;
  }
};

struct wiring_report {
  std::vector<wire_outcome> wired;
  std::vector<wire_outcome> failed;
  bool rolled_back = false;

  bool success() const { return failed.empty(); }

  std::string message() const {
    return "Wired " + std::to_string(wired.size()) + " connections, " +
           std::to_string(failed.size()) + " failed";
  }

  nlohmann::json to_json() const {
    nlohmann::json j = {{"success", success()},
                        {"wired", nlohmann::json::array()},
                        {"failed", nlohmann::json::array()},
                        {"rolledBack", rolled_back},
                        {"message", message()}};
    for (const auto &o : wired)
      j["wired"].push_back(o.to_json());
    for (const auto &o : failed)
      j["failed"].push_back(o.to_json());
    return j;
  }
};

enum class wiring_policy {
  best_effort,
  /// Undo every assignment of the batch when any pair fails.
  atomic,
};

/// Inputs a matcher may look at when judging one target field.
struct match_context {
  const type_registry &types;
  const component &source;
  /// The source as the caller named it, e.g. "HealthSystem".
  const std::string &source_query;
};

class field_matcher {
public:
  virtual ~field_matcher() = default;
  virtual const char *name() const = 0;
  virtual bool matches(const member_descriptor &field,
                       const match_context &ctx) const = 0;
};

/// Field declared with exactly the source's runtime type.
class exact_type_matcher : public field_matcher {
public:
  const char *name() const override { return "exact_type"; }
  bool matches(const member_descriptor &field,
               const match_context &ctx) const override {
    return field.kind == member_kind::component_ref &&
           field.ref_type == std::type_index(typeid(ctx.source));
  }
};

/// Field whose declared type accepts the source (a base or Component).
class assignable_type_matcher : public field_matcher {
public:
  const char *name() const override { return "assignable_type"; }
  bool matches(const member_descriptor &field,
               const match_context &ctx) const override {
    return field.kind == member_kind::component_ref &&
           ctx.types.is_assignable(field.ref_type,
                                   std::type_index(typeid(ctx.source)));
  }
};

/// Field whose name contains the source name, lowercased with "system"
/// removed, and that can hold the source or its entity.
class name_matcher : public field_matcher {
public:
  const char *name() const override { return "name"; }

  static std::string normalize(const std::string &query) {
    auto text = to_lower(query);
    const std::string noise = "system";
    for (auto pos = text.find(noise); pos != std::string::npos;
         pos = text.find(noise))
      text.erase(pos, noise.size());
    return text;
  }

  bool matches(const member_descriptor &field,
               const match_context &ctx) const override {
    auto needle = normalize(ctx.source_query);
    if (needle.empty() || to_lower(field.name).find(needle) == std::string::npos)
      return false;
    if (field.kind == member_kind::entity_ref)
      return true;
    return field.kind == member_kind::component_ref &&
           ctx.types.is_assignable(field.ref_type,
                                   std::type_index(typeid(ctx.source)));
  }
};

inline std::vector<std::unique_ptr<field_matcher>> default_matchers() {
  std::vector<std::unique_ptr<field_matcher>> matchers;
  matchers.push_back(std::make_unique<exact_type_matcher>());
  matchers.push_back(std::make_unique<assignable_type_matcher>());
  matchers.push_back(std::make_unique<name_matcher>());
  return matchers;
}

/// Connects discovered components by assigning references between them.
class autowirer {
public:
  /// Previous value of a field, kept so an atomic batch can be undone.
  struct undo_entry {
    std::shared_ptr<component> target;
    const member_descriptor *field;
    member_value previous;
  };

  autowirer(scene &world, const type_registry &types, property_bridge &bridge,
            std::vector<std::unique_ptr<field_matcher>> matchers =
                default_matchers())
      : world_(world), types_(types), bridge_(bridge),
        matchers_(std::move(matchers)) {}

  autowirer(const autowirer &) = delete;
  autowirer &operator=(const autowirer &) = delete;

  /// Append a matcher with the lowest rank.
  void add_matcher(std::unique_ptr<field_matcher> matcher) {
    matchers_.push_back(std::move(matcher));
  }

  const std::vector<std::unique_ptr<field_matcher>> &matchers() const {
    return matchers_;
  }

  /// First live component whose type name equals `query`, else the first
  /// whose type name contains it, both in depth-first scene order.
  std::shared_ptr<component> discover(const std::string &query) const {
    std::shared_ptr<component> exact;
    std::shared_ptr<component> partial;
    if (query.empty())
      return nullptr;
    world_.walk([&](const std::shared_ptr<entity> &e) {
      for (const auto &c : e->components()) {
        auto type = types_.find(std::type_index(typeid(*c)));
        if (type == nullptr)
          continue;
        if (!exact && type->name == query)
          exact = c;
        else if (!partial && type->name.find(query) != std::string::npos)
          partial = c;
      }
    });
    return exact ? exact : partial;
  }

  wiring_report wire(const std::vector<wire_request> &requests,
                     wiring_policy policy = wiring_policy::best_effort) {
    wiring_report report;
    std::vector<undo_entry> undo;

    for (const auto &req : requests) {
      wire_outcome outcome;
      outcome.source = req.source;
      outcome.target = req.target;

      if (!req.error.empty()) {
        outcome.reason = req.error;
      } else if (req.source.empty() || req.target.empty()) {
        outcome.reason = "source and target are required";
      } else {
        auto source = discover(req.source);
        auto target = discover(req.target);
        if (!source) {
          outcome.reason = "source component not found: " + req.source;
        } else if (!target) {
          outcome.reason = "target component not found: " + req.target;
        } else if (source == target) {
          outcome.reason = "source and target are the same component";
        } else {
          outcome = connect(source, target, req.source, req.event_name, &undo);
          outcome.source = req.source;
          outcome.target = req.target;
        }
      }

      if (outcome.wired) {
        logger()->info("wired {} -> {} ({} via {})", outcome.source,
                       outcome.target, outcome.member, outcome.mode);
        report.wired.push_back(std::move(outcome));
      } else {
        logger()->warn("could not wire {} -> {}: {}", outcome.source,
                       outcome.target, outcome.reason);
        report.failed.push_back(std::move(outcome));
      }
    }

    if (policy == wiring_policy::atomic && !report.failed.empty() &&
        !report.wired.empty()) {
      rollback(undo);
      for (auto &o : report.wired) {
        o.wired = false;
        o.reason = "rolled back";
        report.failed.push_back(std::move(o));
      }
      report.wired.clear();
      report.rolled_back = true;
      logger()->warn("rolled back wiring batch: {} failed",
                     report.failed.size());
    }
    return report;
  }

  /// Wire one resolved pair. `source_query` feeds the name matcher; when no
  /// field matches, an `event_name` on the source defers the pair.
  wire_outcome connect(const std::shared_ptr<component> &source,
                       const std::shared_ptr<component> &target,
                       const std::string &source_query,
                       const std::string &event_name = "",
                       std::vector<undo_entry> *undo = nullptr) {
    wire_outcome outcome;
    const auto &source_type = types_.type_of(*source);
    const auto &target_type = types_.type_of(*target);
    outcome.source = source_type.name;
    outcome.target = target_type.name;

    auto candidates = wirable_fields(target_type);
    match_context ctx{types_, *source,
                      source_query.empty() ? source_type.name : source_query};

    for (const auto &matcher : matchers_) {
      for (auto field : candidates) {
        if (!matcher->matches(*field, ctx))
          continue;
        try {
          member_value value;
          if (field->kind == member_kind::entity_ref) {
            value = source->owner();
            outcome.mode = "entity";
          } else {
            value = source;
            outcome.mode = "component";
          }
          auto previous = field->get(*target);
          bridge_.assign(*target, *field, value);
          if (undo != nullptr)
            undo->push_back({target, field, std::move(previous)});
          outcome.wired = true;
          outcome.member = field->name;
          return outcome;
        } catch (const bridge_error &e) {
          logger()->debug("{} matcher hit {}.{} but assignment failed: {}",
                          matcher->name(), target_type.name, field->name,
                          e.what());
        }
      }
    }

    if (!event_name.empty()) {
      auto member = types_.find_member(source_type, event_name);
      if (member != nullptr && member->kind == member_kind::event) {
        outcome.wired = true;
        outcome.member = event_name;
        outcome.mode = "deferred_event";
        return outcome;
      }
    }

    outcome.reason = "no compatible field on " + target_type.name;
    return outcome;
  }

private:
  /// Public fields, then serialized ones. Private fields and events are
  /// never wired.
  std::vector<const member_descriptor *>
  wirable_fields(const component_type &type) const {
    std::vector<const member_descriptor *> result;
    auto fields = types_.fields_of(type);
    for (auto visibility :
         {member_visibility::public_member, member_visibility::serialized}) {
      for (auto f : fields) {
        if (f->visibility == visibility && f->kind != member_kind::event &&
            f->writable())
          result.push_back(f);
      }
    }
    return result;
  }

  void rollback(std::vector<undo_entry> &undo) {
    for (auto it = undo.rbegin(); it != undo.rend(); ++it)
      it->field->set(*it->target, it->previous);
    undo.clear();
  }

  scene &world_;
  const type_registry &types_;
  property_bridge &bridge_;
  std::vector<std::unique_ptr<field_matcher>> matchers_;
};

} // namespace hostlink
