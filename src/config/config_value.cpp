#include "config/config_value.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace gpcam::config {

namespace {

// Relative slack for float-backed range checks.
constexpr double kRangeTolerance = 1e-4;

std::string FormatCompactFloat(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(6) << value;
  std::string text = out.str();
  while (!text.empty() && text.back() == '0') {
    text.pop_back();
  }
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  return text.empty() ? "0" : text;
}

std::string ToLowerAscii(std::string_view raw) {
  std::string lowered(raw);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool ParseInt(std::string_view raw, int& parsed) {
  if (raw.empty()) {
    return false;
  }
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  return ec == std::errc() && ptr == end;
}

bool ParseFiniteDouble(std::string_view raw, double& parsed) {
  if (raw.empty()) {
    return false;
  }
  std::string value(raw);
  char* parse_end = nullptr;
  parsed = std::strtod(value.c_str(), &parse_end);
  return parse_end != nullptr && *parse_end == '\0' && std::isfinite(parsed);
}

} // namespace

const char* ToString(const WidgetKind kind) {
  switch (kind) {
  case WidgetKind::kWindow:
    return "window";
  case WidgetKind::kSection:
    return "section";
  case WidgetKind::kText:
    return "text";
  case WidgetKind::kRange:
    return "range";
  case WidgetKind::kToggle:
    return "toggle";
  case WidgetKind::kSelection:
    return "selection";
  case WidgetKind::kDate:
    return "date";
  case WidgetKind::kButton:
    return "button";
  }
  return "text";
}

bool IsContainer(const WidgetKind kind) {
  return kind == WidgetKind::kWindow || kind == WidgetKind::kSection;
}

bool Range::InBounds(const double value) const {
  const double slack = kRangeTolerance * std::max(1.0, std::fabs(static_cast<double>(step)));
  return value >= static_cast<double>(min) - slack && value <= static_cast<double>(max) + slack;
}

bool Range::OnStep(const double value) const {
  if (step <= 0.0F) {
    return true;
  }
  const double steps = (value - static_cast<double>(min)) / static_cast<double>(step);
  return std::fabs(steps - std::round(steps)) <= kRangeTolerance;
}

bool Range::Accepts(const double value, std::string& reason) const {
  if (!std::isfinite(value)) {
    reason = "value must be finite";
    return false;
  }
  if (!InBounds(value)) {
    reason = "value " + FormatCompactFloat(value) + " exceeds valid range (" +
             FormatCompactFloat(min) + "-" + FormatCompactFloat(max) + ")";
    return false;
  }
  if (!OnStep(value)) {
    reason = "value can only be changed in steps of " + FormatCompactFloat(step);
    return false;
  }
  return true;
}

std::string FormatRange(const Range& range) {
  return FormatCompactFloat(range.min) + ".." + FormatCompactFloat(range.max) + " step " +
         FormatCompactFloat(range.step);
}

const char* SettableTypeName(const SettableValue& value) {
  switch (value.index()) {
  case 0:
    return "bool";
  case 1:
    return "int";
  case 2:
    return "double";
  default:
    return "string";
  }
}

std::string FormatWidgetValue(const WidgetValue& value) {
  if (const auto* text = std::get_if<TextValue>(&value)) {
    return text->text;
  }
  if (const auto* range = std::get_if<RangeValue>(&value)) {
    return FormatCompactFloat(range->value);
  }
  if (const auto* toggle = std::get_if<ToggleValue>(&value)) {
    if (!toggle->state.has_value()) {
      return "unset";
    }
    return toggle->state.value() ? "true" : "false";
  }
  if (const auto* selection = std::get_if<SelectionValue>(&value)) {
    return selection->choice;
  }
  if (const auto* date = std::get_if<DateValue>(&value)) {
    return std::to_string(date->timestamp);
  }
  return "";
}

bool ParseSettableValue(const WidgetKind kind, std::string_view text, SettableValue& value,
                        std::string& error) {
  error.clear();
  switch (kind) {
  case WidgetKind::kText:
  case WidgetKind::kSelection:
    value = std::string(text);
    return true;
  case WidgetKind::kRange: {
    double parsed = 0.0;
    if (!ParseFiniteDouble(text, parsed)) {
      error = "expected a number, got '" + std::string(text) + "'";
      return false;
    }
    value = parsed;
    return true;
  }
  case WidgetKind::kToggle: {
    const std::string lowered = ToLowerAscii(text);
    if (lowered == "true" || lowered == "on" || lowered == "1") {
      value = true;
      return true;
    }
    if (lowered == "false" || lowered == "off" || lowered == "0") {
      value = false;
      return true;
    }
    error = "expected true|false, got '" + std::string(text) + "'";
    return false;
  }
  case WidgetKind::kDate: {
    int parsed = 0;
    if (!ParseInt(text, parsed)) {
      error = "expected an integer timestamp, got '" + std::string(text) + "'";
      return false;
    }
    value = parsed;
    return true;
  }
  case WidgetKind::kWindow:
  case WidgetKind::kSection:
  case WidgetKind::kButton:
  default:
    error = std::string(ToString(kind)) + " widgets have no settable value";
    return false;
  }
}

} // namespace gpcam::config
