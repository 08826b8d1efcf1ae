#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gpcam::config {

// Semantic widget kinds. Radio and menu widgets both surface as `kSelection`.
enum class WidgetKind {
  kWindow = 0,
  kSection,
  kText,
  kRange,
  kToggle,
  kSelection,
  kDate,
  kButton,
};

const char* ToString(WidgetKind kind);

// Window and section widgets group children and never carry a value.
bool IsContainer(WidgetKind kind);

// Numeric constraint reported by range widgets. The native representation is
// single precision, so bound and step checks allow a small tolerance.
struct Range {
  float min = 0.0F;
  float max = 0.0F;
  float step = 0.0F;

  bool InBounds(double value) const;

  // Drivers report `step == 0` for continuous ranges; every in-bounds value
  // is on-step then.
  bool OnStep(double value) const;

  // Fills `reason` with the first violated rule.
  bool Accepts(double value, std::string& reason) const;
};

struct TextValue {
  std::string text;
};

struct RangeValue {
  float value = 0.0F;
  Range range;
};

// `state` is unset when the driver reports the tri-state sentinel (2), i.e.
// the setting cannot currently be evaluated.
struct ToggleValue {
  std::optional<bool> state;
};

struct SelectionValue {
  std::string choice;
  std::vector<std::string> choices;
};

// Raw integer as reported by the driver (seconds since the epoch).
struct DateValue {
  int timestamp = 0;
};

// Buttons trigger driver actions and have no readable value.
struct ButtonValue {};

using WidgetValue =
    std::variant<TextValue, RangeValue, ToggleValue, SelectionValue, DateValue, ButtonValue>;

// What callers may pass to `ConfigItem::Set`. Each widget kind accepts exactly
// one alternative (range also accepts `int`).
using SettableValue = std::variant<bool, int, double, std::string>;

// "min..max step s".
std::string FormatRange(const Range& range);

const char* SettableTypeName(const SettableValue& value);

// Human-readable value: "1/250", "true", "unset", "12.5", ...
std::string FormatWidgetValue(const WidgetValue& value);

// Converts command-line text into the alternative `kind` expects. Toggle
// accepts true/false/on/off/1/0.
bool ParseSettableValue(WidgetKind kind, std::string_view text, SettableValue& value,
                        std::string& error);

} // namespace gpcam::config
