#include "config/widget_tree.hpp"

#include "gphoto/native_call.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace gpcam::config {

namespace {

using gphoto::CheckNativeResult;
using gphoto::Error;
using gphoto::ErrorCode;
using gphoto::MakeLocalError;
using gphoto::NativeApi;
using gphoto::ReadNativeString;

constexpr int kToggleUnsetSentinel = 2;

bool IsPtpPropertyId(std::string_view name) {
  return name.size() == 4U && std::all_of(name.begin(), name.end(), [](const unsigned char c) {
           return std::isxdigit(c) != 0;
         });
}

std::string JoinChoices(const std::vector<std::string>& choices) {
  std::string joined;
  for (const std::string& choice : choices) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += choice;
  }
  return joined;
}

Error WrongAlternative(const std::string& name, const WidgetKind kind, const char* expected,
                       const SettableValue& value) {
  return MakeLocalError(ErrorCode::kInvalidValue,
                        std::string(ToString(kind)) + " setting '" + name + "' expects " +
                            expected + ", got " + SettableTypeName(value));
}

bool ReadItemValue(const NativeApi& api, CameraWidget* widget, const WidgetKind kind,
                   WidgetValue& value, Error& error) {
  switch (kind) {
  case WidgetKind::kText: {
    const char* raw = nullptr;
    if (!CheckNativeResult(api, "gp_widget_get_value", api.widget_get_value(widget, &raw),
                           error)) {
      return false;
    }
    value = TextValue{.text = raw == nullptr ? std::string() : std::string(raw)};
    return true;
  }
  case WidgetKind::kRange: {
    RangeValue range_value;
    if (!CheckNativeResult(api, "gp_widget_get_value",
                           api.widget_get_value(widget, &range_value.value), error)) {
      return false;
    }
    if (!CheckNativeResult(api, "gp_widget_get_range",
                           api.widget_get_range(widget, &range_value.range.min,
                                                &range_value.range.max, &range_value.range.step),
                           error)) {
      return false;
    }
    value = range_value;
    return true;
  }
  case WidgetKind::kToggle: {
    int raw = 0;
    if (!CheckNativeResult(api, "gp_widget_get_value", api.widget_get_value(widget, &raw),
                           error)) {
      return false;
    }
    ToggleValue toggle;
    if (raw != kToggleUnsetSentinel) {
      toggle.state = raw != 0;
    }
    value = toggle;
    return true;
  }
  case WidgetKind::kSelection: {
    SelectionValue selection;
    const char* raw = nullptr;
    if (!CheckNativeResult(api, "gp_widget_get_value", api.widget_get_value(widget, &raw),
                           error)) {
      return false;
    }
    selection.choice = raw == nullptr ? std::string() : std::string(raw);

    const int choice_count = api.widget_count_choices(widget);
    for (int index = 0; index < choice_count; ++index) {
      std::string choice;
      if (!ReadNativeString(
              api, "gp_widget_get_choice",
              [&](const char** out) { return api.widget_get_choice(widget, index, out); },
              choice, error)) {
        return false;
      }
      selection.choices.push_back(std::move(choice));
    }
    value = std::move(selection);
    return true;
  }
  case WidgetKind::kDate: {
    DateValue date;
    if (!CheckNativeResult(api, "gp_widget_get_value",
                           api.widget_get_value(widget, &date.timestamp), error)) {
      return false;
    }
    value = date;
    return true;
  }
  case WidgetKind::kButton:
  case WidgetKind::kWindow:
  case WidgetKind::kSection:
    value = ButtonValue{};
    return true;
  }
  value = ButtonValue{};
  return true;
}

bool TraverseChildren(const NativeApi& api, CameraWidget* parent, CameraWidget* root,
                      IConfigCommitter* committer, ConfigSection& section, Error& error) {
  const int child_count = api.widget_count_children(parent);
  for (int index = 0; index < child_count; ++index) {
    CameraWidget* child = nullptr;
    if (!CheckNativeResult(api, "gp_widget_get_child", api.widget_get_child(parent, index, &child),
                           error)) {
      return false;
    }

    CameraWidgetType native_type = GP_WIDGET_TEXT;
    if (!CheckNativeResult(api, "gp_widget_get_type", api.widget_get_type(child, &native_type),
                           error)) {
      return false;
    }
    const WidgetKind kind = ToWidgetKind(native_type);

    std::string name;
    std::string label;
    if (!ReadNativeString(
            api, "gp_widget_get_name",
            [&](const char** out) { return api.widget_get_name(child, out); }, name, error) ||
        !ReadNativeString(
            api, "gp_widget_get_label",
            [&](const char** out) { return api.widget_get_label(child, out); }, label, error)) {
      return false;
    }

    if (IsContainer(kind)) {
      auto nested = std::make_unique<ConfigSection>(std::move(name), std::move(label));
      if (!TraverseChildren(api, child, root, committer, *nested, error)) {
        return false;
      }
      section.AddSection(std::move(nested));
      continue;
    }

    std::string info;
    if (!ReadNativeString(
            api, "gp_widget_get_info",
            [&](const char** out) { return api.widget_get_info(child, out); }, info, error)) {
      return false;
    }

    WidgetValue value;
    if (!ReadItemValue(api, child, kind, value, error)) {
      return false;
    }

    int readonly = 0;
    if (!CheckNativeResult(api, "gp_widget_get_readonly", api.widget_get_readonly(child, &readonly),
                           error)) {
      return false;
    }

    section.AddItem(std::make_unique<ConfigItem>(
        ConfigItem::Binding{.api = &api, .widget = child, .root = root, .committer = committer},
        std::move(name), std::move(label), std::move(info), kind, std::move(value),
        readonly != 0));
  }
  return true;
}

} // namespace

WidgetKind ToWidgetKind(const CameraWidgetType type) {
  switch (type) {
  case GP_WIDGET_WINDOW:
    return WidgetKind::kWindow;
  case GP_WIDGET_SECTION:
    return WidgetKind::kSection;
  case GP_WIDGET_TEXT:
    return WidgetKind::kText;
  case GP_WIDGET_RANGE:
    return WidgetKind::kRange;
  case GP_WIDGET_TOGGLE:
    return WidgetKind::kToggle;
  case GP_WIDGET_RADIO:
  case GP_WIDGET_MENU:
    return WidgetKind::kSelection;
  case GP_WIDGET_DATE:
    return WidgetKind::kDate;
  case GP_WIDGET_BUTTON:
    return WidgetKind::kButton;
  }
  // Ordinals added by newer libgphoto2 releases carry no value we can read.
  return WidgetKind::kButton;
}

ConfigItem::ConfigItem(Binding binding, std::string name, std::string label, std::string info,
                       const WidgetKind kind, WidgetValue value, const bool readonly)
    : binding_(binding), name_(std::move(name)), label_(std::move(label)), info_(std::move(info)),
      kind_(kind), value_(std::move(value)), readonly_(readonly) {}

bool ConfigItem::Validate(const SettableValue& value, Error& error) const {
  error.Clear();
  switch (kind_) {
  case WidgetKind::kText:
    if (!std::holds_alternative<std::string>(value)) {
      error = WrongAlternative(name_, kind_, "string", value);
      return false;
    }
    return true;
  case WidgetKind::kSelection: {
    const auto* text = std::get_if<std::string>(&value);
    if (text == nullptr) {
      error = WrongAlternative(name_, kind_, "string", value);
      return false;
    }
    const auto& choices = std::get<SelectionValue>(value_).choices;
    if (std::find(choices.begin(), choices.end(), *text) == choices.end()) {
      error = MakeLocalError(ErrorCode::kInvalidValue, "'" + *text +
                                                           "' is not a valid choice for '" +
                                                           name_ + "' (" + JoinChoices(choices) +
                                                           ")");
      return false;
    }
    return true;
  }
  case WidgetKind::kRange: {
    double numeric = 0.0;
    if (const auto* as_int = std::get_if<int>(&value)) {
      numeric = static_cast<double>(*as_int);
    } else if (const auto* as_double = std::get_if<double>(&value)) {
      numeric = *as_double;
    } else {
      error = WrongAlternative(name_, kind_, "a number", value);
      return false;
    }
    std::string reason;
    if (!std::get<RangeValue>(value_).range.Accepts(numeric, reason)) {
      error = MakeLocalError(ErrorCode::kInvalidValue, "setting '" + name_ + "': " + reason);
      return false;
    }
    return true;
  }
  case WidgetKind::kToggle:
    if (!std::holds_alternative<bool>(value)) {
      error = WrongAlternative(name_, kind_, "bool", value);
      return false;
    }
    return true;
  case WidgetKind::kDate:
    if (!std::holds_alternative<int>(value)) {
      error = WrongAlternative(name_, kind_, "int", value);
      return false;
    }
    return true;
  case WidgetKind::kButton:
  case WidgetKind::kWindow:
  case WidgetKind::kSection:
    break;
  }
  error = MakeLocalError(ErrorCode::kInvalidValue,
                         std::string(ToString(kind_)) + " setting '" + name_ +
                             "' has no settable value");
  return false;
}

bool ConfigItem::Set(const SettableValue& value, Error& error) {
  if (readonly_) {
    error = MakeLocalError(ErrorCode::kReadOnly, "setting '" + name_ + "' is read-only");
    return false;
  }
  if (!Validate(value, error)) {
    return false;
  }
  return WriteNative(value, error);
}

bool ConfigItem::WriteNative(const SettableValue& value, Error& error) {
  if (binding_.api == nullptr || binding_.widget == nullptr || binding_.committer == nullptr) {
    error = MakeLocalError(ErrorCode::kNotInitialized,
                           "setting '" + name_ + "' is not bound to a camera");
    return false;
  }
  const NativeApi& api = *binding_.api;

  int rc = GP_OK;
  switch (kind_) {
  case WidgetKind::kText:
  case WidgetKind::kSelection:
    rc = api.widget_set_value(binding_.widget, std::get<std::string>(value).c_str());
    break;
  case WidgetKind::kRange: {
    const float native = std::holds_alternative<int>(value)
                             ? static_cast<float>(std::get<int>(value))
                             : static_cast<float>(std::get<double>(value));
    rc = api.widget_set_value(binding_.widget, &native);
    break;
  }
  case WidgetKind::kToggle: {
    const int native = std::get<bool>(value) ? 1 : 0;
    rc = api.widget_set_value(binding_.widget, &native);
    break;
  }
  case WidgetKind::kDate: {
    const int native = std::get<int>(value);
    rc = api.widget_set_value(binding_.widget, &native);
    break;
  }
  case WidgetKind::kButton:
  case WidgetKind::kWindow:
  case WidgetKind::kSection:
    break;
  }
  if (!CheckNativeResult(api, "gp_widget_set_value", rc, error)) {
    return false;
  }
  if (!binding_.committer->CommitConfig(binding_.root, error)) {
    return false;
  }

  if (auto* text = std::get_if<TextValue>(&value_)) {
    text->text = std::get<std::string>(value);
  } else if (auto* selection = std::get_if<SelectionValue>(&value_)) {
    selection->choice = std::get<std::string>(value);
  } else if (auto* range = std::get_if<RangeValue>(&value_)) {
    range->value = std::holds_alternative<int>(value) ? static_cast<float>(std::get<int>(value))
                                                      : static_cast<float>(std::get<double>(value));
  } else if (auto* toggle = std::get_if<ToggleValue>(&value_)) {
    toggle->state = std::get<bool>(value);
  } else if (auto* date = std::get_if<DateValue>(&value_)) {
    date->timestamp = std::get<int>(value);
  }
  return true;
}

ConfigSection::ConfigSection(std::string name, std::string label)
    : name_(std::move(name)), label_(std::move(label)) {}

ConfigSection* ConfigSection::FindSection(std::string_view name) const {
  const auto it = sections_.find(name);
  return it == sections_.end() ? nullptr : it->second.get();
}

ConfigItem* ConfigSection::FindItem(std::string_view name) const {
  const auto it = items_.find(name);
  return it == items_.end() ? nullptr : it->second.get();
}

ConfigSection& ConfigSection::AddSection(std::unique_ptr<ConfigSection> section) {
  const std::string key = section->name();
  items_.erase(key);
  auto& slot = sections_[key];
  slot = std::move(section);
  return *slot;
}

ConfigItem& ConfigSection::AddItem(std::unique_ptr<ConfigItem> item) {
  const std::string key = item->name();
  sections_.erase(key);
  auto& slot = items_[key];
  slot = std::move(item);
  return *slot;
}

std::size_t ConfigSection::LeafCount() const {
  std::size_t count = items_.size();
  for (const auto& [name, section] : sections_) {
    count += section->LeafCount();
  }
  return count;
}

ConfigTree::ConfigTree(gphoto::NativeHandle<CameraWidget> root) : root_widget_(std::move(root)) {}

ConfigSection* ConfigTree::FindSection(std::string_view path) const {
  const ConfigSection* current = &root_;
  while (!path.empty()) {
    const std::size_t slash = path.find('/');
    const std::string_view component = path.substr(0, slash);
    if (!component.empty()) {
      current = current->FindSection(component);
      if (current == nullptr) {
        return nullptr;
      }
    }
    if (slash == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slash + 1U);
  }
  return const_cast<ConfigSection*>(current);
}

ConfigItem* ConfigTree::FindItem(std::string_view path) const {
  const std::size_t slash = path.rfind('/');
  if (slash == std::string_view::npos) {
    return root_.FindItem(path);
  }
  const ConfigSection* section = FindSection(path.substr(0, slash));
  return section == nullptr ? nullptr : section->FindItem(path.substr(slash + 1U));
}

bool BuildConfigTree(const NativeApi& api, CameraWidget* root, IConfigCommitter* committer,
                     ConfigTree& tree, Error& error) {
  error.Clear();
  ConfigTree built{gphoto::NativeHandle<CameraWidget>(&api, root)};
  if (root == nullptr) {
    error = MakeLocalError(ErrorCode::kNotInitialized, "configuration root widget is missing");
    return false;
  }

  std::string name;
  std::string label;
  if (!ReadNativeString(
          api, "gp_widget_get_name", [&](const char** out) { return api.widget_get_name(root, out); },
          name, error) ||
      !ReadNativeString(
          api, "gp_widget_get_label",
          [&](const char** out) { return api.widget_get_label(root, out); }, label, error)) {
    return false;
  }
  built.root() = ConfigSection(std::move(name), std::move(label));

  if (!TraverseChildren(api, root, root, committer, built.root(), error)) {
    return false;
  }
  tree = std::move(built);
  return true;
}

std::vector<ConfigItemRef> CollectWritableSettings(const ConfigTree& tree) {
  std::vector<ConfigItemRef> writable;
  for (const auto& [section_name, section] : tree.root().sections()) {
    if (section_name.find("settings") == std::string::npos && section_name != "other") {
      continue;
    }
    for (const auto& [item_name, item] : section->items()) {
      if (!item->readonly()) {
        writable.push_back(ConfigItemRef{.section = section_name, .item = item.get()});
      }
    }
  }
  return writable;
}

std::vector<ConfigItemRef> CollectStatus(const ConfigTree& tree) {
  std::vector<ConfigItemRef> status;
  for (const auto& [section_name, section] : tree.root().sections()) {
    for (const auto& [item_name, item] : section->items()) {
      if ((item->readonly() || section_name == "status") && !IsPtpPropertyId(item_name)) {
        status.push_back(ConfigItemRef{.section = section_name, .item = item.get()});
      }
    }
  }
  return status;
}

} // namespace gpcam::config
