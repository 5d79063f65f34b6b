#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace hostlink {

struct vec3 {
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
};

inline bool operator==(const vec3 &a, const vec3 &b) {
  return a.x == b.x && a.y == b.y && a.z == b.z;
}

class entity;

/// Base of every unit of state attached to an entity.
class component {
public:
  virtual ~component() = default;

  std::shared_ptr<entity> owner() const { return owner_.lock(); }

private:
  friend class entity;
  std::weak_ptr<entity> owner_;
};

/// Every entity carries exactly one transform, created with it.
struct transform : component {
  vec3 position;
  vec3 rotation;
  vec3 scale{1.0f, 1.0f, 1.0f};
};

class entity : public std::enable_shared_from_this<entity> {
public:
  explicit entity(std::string name) : name_(std::move(name)) {}

  const std::string &name() const { return name_; }
  void set_name(std::string name) { name_ = std::move(name); }

  const std::string &tag() const { return tag_; }
  void set_tag(std::string tag) { tag_ = std::move(tag); }

  bool active() const { return active_; }
  void set_active(bool active) { active_ = active; }

  std::shared_ptr<entity> parent() const { return parent_.lock(); }
  const std::vector<std::shared_ptr<entity>> &children() const {
    return children_;
  }
  const std::vector<std::shared_ptr<component>> &components() const {
    return components_;
  }

  void add_component(std::shared_ptr<component> c) {
    c->owner_ = weak_from_this();
    components_.push_back(std::move(c));
  }

  template <typename T, typename... Args>
  std::shared_ptr<T> add(Args &&...args) {
    auto c = std::make_shared<T>(std::forward<Args>(args)...);
    add_component(c);
    return c;
  }

  template <typename T> std::shared_ptr<T> get() const {
    for (const auto &c : components_) {
      if (auto typed = std::dynamic_pointer_cast<T>(c))
        return typed;
    }
    return nullptr;
  }

  bool remove_component(const std::shared_ptr<component> &c) {
    auto it = std::find(components_.begin(), components_.end(), c);
    if (it == components_.end())
      return false;
    (*it)->owner_.reset();
    components_.erase(it);
    return true;
  }

  std::shared_ptr<transform> get_transform() const { return get<transform>(); }

  /// Slash-separated path from the root, e.g. "--- UI ---/GameCanvas".
  std::string path() const {
    std::string result = name_;
    for (auto p = parent(); p; p = p->parent())
      result = p->name_ + "/" + result;
    return result;
  }

  bool is_descendant_of(const entity &other) const {
    for (auto p = parent(); p; p = p->parent()) {
      if (p.get() == &other)
        return true;
    }
    return false;
  }

private:
  friend class scene;

  std::string name_;
  std::string tag_ = "Untagged";
  bool active_ = true;
  std::weak_ptr<entity> parent_;
  std::vector<std::shared_ptr<entity>> children_;
  std::vector<std::shared_ptr<component>> components_;
};

/// The live object graph. Only the host thread may touch it.
class scene {
public:
  using visitor = std::function<void(const std::shared_ptr<entity> &)>;

  explicit scene(std::string name = "Untitled") : name_(std::move(name)) {}

  const std::string &name() const { return name_; }
  void set_name(std::string name) { name_ = std::move(name); }

  const std::vector<std::shared_ptr<entity>> &roots() const { return roots_; }

  std::shared_ptr<entity>
  create_entity(const std::string &name,
                const std::shared_ptr<entity> &parent = nullptr) {
    auto e = std::make_shared<entity>(name);
    e->add<transform>();
    attach(e, parent);
    return e;
  }

  /// Insert an already built (e.g. cloned) subtree.
  void adopt(const std::shared_ptr<entity> &e,
             const std::shared_ptr<entity> &parent = nullptr) {
    attach(e, parent);
  }

  /// Move `child` under `parent`, or to the root when parent is null.
  void set_parent(const std::shared_ptr<entity> &child,
                  const std::shared_ptr<entity> &parent) {
    if (parent && (parent == child || parent->is_descendant_of(*child)))
      throw std::invalid_argument("cannot parent '" + child->name() +
                                  "' under its own descendant");
    detach(child);
    attach(child, parent);
  }

  void destroy(const std::shared_ptr<entity> &e) { detach(e); }

  /// Detached deep copy of `source` and its children. Components are copied
  /// with `copy_component`; references they hold are not remapped.
  static std::shared_ptr<entity> clone_tree(
      const entity &source, const std::string &name,
      const std::function<std::shared_ptr<component>(const component &)>
          &copy_component) {
    auto copy = std::make_shared<entity>(name);
    copy->tag_ = source.tag_;
    copy->active_ = source.active_;
    for (const auto &c : source.components_)
      copy->add_component(copy_component(*c));
    for (const auto &child : source.children_) {
      auto child_copy = clone_tree(*child, child->name_, copy_component);
      child_copy->parent_ = copy;
      copy->children_.push_back(child_copy);
    }
    return copy;
  }

  /// Resolve a name or a slash-separated path.
  ///
  /// A plain name returns the first match in depth-first pre-order, roots in
  /// creation order, inactive entities included. Duplicate names therefore
  /// always resolve to the earliest entity in that order.
  std::shared_ptr<entity> find(const std::string &name) const {
    if (name.empty())
      return nullptr;
    if (name.find('/') != std::string::npos)
      return find_path(name);

    std::shared_ptr<entity> found;
    walk_until([&](const std::shared_ptr<entity> &e) {
      if (e->name() == name)
        found = e;
      return found != nullptr;
    });
    return found;
  }

  std::vector<std::shared_ptr<entity>>
  find_all_by_tag(const std::string &tag) const {
    std::vector<std::shared_ptr<entity>> found;
    walk([&](const std::shared_ptr<entity> &e) {
      if (e->tag() == tag)
        found.push_back(e);
    });
    return found;
  }

  /// Depth-first pre-order over every entity.
  void walk(const visitor &visit) const {
    walk_until([&](const std::shared_ptr<entity> &e) {
      visit(e);
      return false;
    });
  }

  std::size_t size() const {
    std::size_t count = 0;
    walk([&count](const std::shared_ptr<entity> &) { ++count; });
    return count;
  }

  /// Entity names indented two spaces per depth level.
  std::vector<std::string> hierarchy(bool roots_only = false) const {
    std::vector<std::string> lines;
    for (const auto &root : roots_) {
      if (roots_only)
        lines.push_back(root->name());
      else
        append_hierarchy(*root, "", lines);
    }
    return lines;
  }

private:
  bool walk_until(
      const std::function<bool(const std::shared_ptr<entity> &)> &visit) const {
    std::vector<std::shared_ptr<entity>> stack(roots_.rbegin(), roots_.rend());
    while (!stack.empty()) {
      auto e = stack.back();
      stack.pop_back();
      if (visit(e))
        return true;
      for (auto it = e->children_.rbegin(); it != e->children_.rend(); ++it)
        stack.push_back(*it);
    }
    return false;
  }

  std::shared_ptr<entity> find_path(const std::string &path) const {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (start <= path.size()) {
      auto slash = path.find('/', start);
      if (slash == std::string::npos)
        slash = path.size();
      if (slash > start)
        parts.push_back(path.substr(start, slash - start));
      start = slash + 1;
    }
    if (parts.empty())
      return nullptr;

    const std::vector<std::shared_ptr<entity>> *level = &roots_;
    std::shared_ptr<entity> current;
    for (const auto &part : parts) {
      current.reset();
      for (const auto &candidate : *level) {
        if (candidate->name() == part) {
          current = candidate;
          break;
        }
      }
      if (!current)
        return nullptr;
      level = &current->children_;
    }
    return current;
  }

  void attach(const std::shared_ptr<entity> &e,
              const std::shared_ptr<entity> &parent) {
    e->parent_ = parent;
    if (parent)
      parent->children_.push_back(e);
    else
      roots_.push_back(e);
  }

  void detach(const std::shared_ptr<entity> &e) {
    auto &siblings = e->parent() ? e->parent()->children_ : roots_;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), e),
                   siblings.end());
    e->parent_.reset();
  }

  static void append_hierarchy(const entity &e, const std::string &indent,
                               std::vector<std::string> &lines) {
    lines.push_back(indent + e.name());
    for (const auto &child : e.children())
      append_hierarchy(*child, indent + "  ", lines);
  }

  std::string name_;
  std::vector<std::shared_ptr<entity>> roots_;
};

} // namespace hostlink
