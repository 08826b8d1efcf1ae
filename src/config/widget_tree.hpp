#pragma once

#include "config/config_value.hpp"
#include "gphoto/error_mapper.hpp"
#include "gphoto/native_api.hpp"
#include "gphoto/native_handles.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gpcam::config {

// Maps libgphoto2 widget type ordinals onto semantic kinds.
WidgetKind ToWidgetKind(CameraWidgetType type);

// Pushes a modified widget tree back to the device. `ConfigItem::Set` always
// commits the root of the tree it came from, never the single widget.
// Items keep a raw pointer to their committer, which must outlive the tree.
class IConfigCommitter {
public:
  virtual ~IConfigCommitter() = default;

  virtual bool CommitConfig(CameraWidget* root, gphoto::Error& error) = 0;
};

// Projection of one non-container widget.
//
// The value is read once while the tree is built. `Set` validates locally
// before touching the native widget; on success the cached value is updated.
// The widget pointers stay valid for the lifetime of the owning ConfigTree.
class ConfigItem {
public:
  struct Binding {
    const gphoto::NativeApi* api = nullptr;
    CameraWidget* widget = nullptr;
    CameraWidget* root = nullptr;
    IConfigCommitter* committer = nullptr;
  };

  ConfigItem(Binding binding, std::string name, std::string label, std::string info,
             WidgetKind kind, WidgetValue value, bool readonly);

  const std::string& name() const {
    return name_;
  }
  const std::string& label() const {
    return label_;
  }
  const std::string& info() const {
    return info_;
  }
  WidgetKind kind() const {
    return kind_;
  }
  const WidgetValue& value() const {
    return value_;
  }
  bool readonly() const {
    return readonly_;
  }

  // Order of checks: readonly, then kind/value validation, then the native
  // write followed by a commit of the root widget. Only the last step issues
  // native calls.
  bool Set(const SettableValue& value, gphoto::Error& error);

  // Validation step of `Set` without side effects.
  bool Validate(const SettableValue& value, gphoto::Error& error) const;

private:
  bool WriteNative(const SettableValue& value, gphoto::Error& error);

  Binding binding_;
  std::string name_;
  std::string label_;
  std::string info_;
  WidgetKind kind_ = WidgetKind::kText;
  WidgetValue value_;
  bool readonly_ = false;
};

// A window or section widget. Children are keyed by widget name; when two
// siblings share a name the later one wins.
class ConfigSection {
public:
  using SectionMap = std::map<std::string, std::unique_ptr<ConfigSection>, std::less<>>;
  using ItemMap = std::map<std::string, std::unique_ptr<ConfigItem>, std::less<>>;

  ConfigSection() = default;
  ConfigSection(std::string name, std::string label);

  const std::string& name() const {
    return name_;
  }
  const std::string& label() const {
    return label_;
  }
  const SectionMap& sections() const {
    return sections_;
  }
  const ItemMap& items() const {
    return items_;
  }

  ConfigSection* FindSection(std::string_view name) const;
  ConfigItem* FindItem(std::string_view name) const;

  ConfigSection& AddSection(std::unique_ptr<ConfigSection> section);
  ConfigItem& AddItem(std::unique_ptr<ConfigItem> item);

  // Non-container descendants at any depth.
  std::size_t LeafCount() const;

private:
  std::string name_;
  std::string label_;
  SectionMap sections_;
  ItemMap items_;
};

// Owns the native root widget and the section/item projection of it.
class ConfigTree {
public:
  ConfigTree() = default;
  explicit ConfigTree(gphoto::NativeHandle<CameraWidget> root);

  ConfigTree(const ConfigTree&) = delete;
  ConfigTree& operator=(const ConfigTree&) = delete;
  ConfigTree(ConfigTree&&) = default;
  ConfigTree& operator=(ConfigTree&&) = default;

  bool empty() const {
    return !root_widget_;
  }

  CameraWidget* root_widget() const {
    return root_widget_.get();
  }

  const ConfigSection& root() const {
    return root_;
  }
  ConfigSection& root() {
    return root_;
  }

  // `path` is slash separated: "settings/capturetarget". A bare name is
  // looked up among the root's direct children.
  ConfigItem* FindItem(std::string_view path) const;
  ConfigSection* FindSection(std::string_view path) const;

  std::size_t LeafCount() const {
    return root_.LeafCount();
  }

private:
  gphoto::NativeHandle<CameraWidget> root_widget_;
  ConfigSection root_;
};

// Walks the native tree below `root` depth-first and fills `tree`.
//
// Ownership of `root` passes to the tree before the first native call, so a
// failure at any depth releases the whole native tree and leaves `tree`
// untouched.
bool BuildConfigTree(const gphoto::NativeApi& api, CameraWidget* root,
                     IConfigCommitter* committer, ConfigTree& tree, gphoto::Error& error);

struct ConfigItemRef {
  std::string section;
  const ConfigItem* item = nullptr;
};

// Writable settings: non-readonly items of top-level sections whose name
// contains "settings" or equals "other".
std::vector<ConfigItemRef> CollectWritableSettings(const ConfigTree& tree);

// Status readout: readonly items of every top-level section plus all items of
// the "status" section. Bare PTP property ids ("d402") are skipped.
std::vector<ConfigItemRef> CollectStatus(const ConfigTree& tree);

} // namespace gpcam::config
