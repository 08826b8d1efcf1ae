#include "../common/assertions.hpp"
#include "../common/fake_camera.hpp"
#include "config/widget_tree.hpp"

#include <string>
#include <variant>
#include <vector>

namespace {

using gpcam::config::ConfigItem;
using gpcam::config::ConfigTree;
using gpcam::config::SettableValue;
using gpcam::gphoto::Error;
using gpcam::gphoto::ErrorCode;
using gpcam::tests::common::AppendWidget;
using gpcam::tests::common::Fail;

// Records commits instead of talking to a device.
class RecordingCommitter final : public gpcam::config::IConfigCommitter {
public:
  bool CommitConfig(CameraWidget* root, Error& error) override {
    roots.push_back(root);
    if (fail_with != GP_OK) {
      error = gpcam::gphoto::MapNativeError(fail_with, "");
      return false;
    }
    return true;
  }

  std::vector<CameraWidget*> roots;
  int fail_with = GP_OK;
};

ConfigItem& RequireItem(const ConfigTree& tree, std::string_view path) {
  ConfigItem* item = tree.FindItem(path);
  if (item == nullptr) {
    Fail("missing item: " + std::string(path));
  }
  return *item;
}

void ExpectSetFails(ConfigItem& item, const SettableValue& value, ErrorCode expected,
                    std::string_view context) {
  Error error;
  if (item.Set(value, error)) {
    Fail(std::string(context) + ": set should fail");
  }
  if (error.code != expected) {
    Fail(std::string(context) + ": unexpected error " + gpcam::gphoto::FormatError(error));
  }
}

} // namespace

int main() {
  using gpcam::config::BuildConfigTree;
  using gpcam::config::CollectStatus;
  using gpcam::config::CollectWritableSettings;
  using gpcam::config::RangeValue;
  using gpcam::config::SelectionValue;
  using gpcam::config::ToggleValue;
  using gpcam::config::WidgetKind;
  using gpcam::gphoto::DefaultNativeApi;
  using gpcam::gphoto::NativeApi;
  using gpcam::tests::common::AssertContains;
  using gpcam::tests::common::BuildFakeConfig;
  using gpcam::tests::common::FakeCamera;

  NativeApi api = DefaultNativeApi();
  int setter_calls = 0;
  api.widget_set_value = [&setter_calls](CameraWidget* widget, const void* value) {
    ++setter_calls;
    return gp_widget_set_value(widget, value);
  };

  {
    // window{section{toggle}, text} -> {section:{toggle}, text}
    CameraWidget* root = AppendWidget(nullptr, GP_WIDGET_WINDOW, "main", "Main");
    CameraWidget* section = AppendWidget(root, GP_WIDGET_SECTION, "actions", "Actions");
    CameraWidget* toggle = AppendWidget(section, GP_WIDGET_TOGGLE, "autofocus", "Autofocus");
    const int unset = 2;
    (void)gp_widget_set_value(toggle, &unset);
    CameraWidget* text = AppendWidget(root, GP_WIDGET_TEXT, "owner", "Owner");
    (void)gp_widget_set_value(text, "lab");

    RecordingCommitter committer;
    ConfigTree tree;
    Error error;
    if (!BuildConfigTree(api, root, &committer, tree, error)) {
      Fail("tree build failed: " + gpcam::gphoto::FormatError(error));
    }
    if (tree.root().name() != "main" || tree.root().sections().size() != 1U ||
        tree.root().items().size() != 1U) {
      Fail("root should hold one section and one item");
    }
    if (tree.LeafCount() != 2U) {
      Fail("leaf count should count non-container widgets at any depth");
    }
    const ConfigItem& autofocus = RequireItem(tree, "actions/autofocus");
    if (autofocus.kind() != WidgetKind::kToggle ||
        std::get<ToggleValue>(autofocus.value()).state.has_value()) {
      Fail("toggle sentinel 2 should read as unset");
    }
    if (RequireItem(tree, "owner").label() != "Owner") {
      Fail("top-level item should be reachable by bare name");
    }
    if (tree.FindItem("actions/missing") != nullptr || tree.FindSection("nope") != nullptr) {
      Fail("unknown paths should not resolve");
    }
  }

  {
    FakeCamera fake;
    RecordingCommitter committer;
    ConfigTree tree;
    Error error;
    if (!BuildConfigTree(api, BuildFakeConfig(fake), &committer, tree, error)) {
      Fail("fake config build failed: " + gpcam::gphoto::FormatError(error));
    }
    if (tree.LeafCount() != 6U) {
      Fail("fake config should expose six leaves");
    }

    // Read-only items fail before any native call.
    ConfigItem& battery = RequireItem(tree, "status/batterylevel");
    ExpectSetFails(battery, SettableValue(std::string("10%")), ErrorCode::kReadOnly, "readonly");
    if (setter_calls != 0 || !committer.roots.empty()) {
      Fail("readonly set should make zero native setter calls");
    }

    ConfigItem& target = RequireItem(tree, "settings/capturetarget");
    ExpectSetFails(target, SettableValue(std::string("SD card 2")), ErrorCode::kInvalidValue,
                   "unknown choice");
    ExpectSetFails(target, SettableValue(true), ErrorCode::kInvalidValue, "wrong alternative");
    if (setter_calls != 0) {
      Fail("validation failures should not reach the native setter");
    }

    if (!target.Set(SettableValue(std::string("Internal RAM")), error)) {
      Fail("valid choice should be set: " + gpcam::gphoto::FormatError(error));
    }
    if (setter_calls != 1 || committer.roots.size() != 1U ||
        committer.roots.front() != tree.root_widget()) {
      Fail("set should write once and commit the root widget");
    }
    if (std::get<SelectionValue>(target.value()).choice != "Internal RAM") {
      Fail("cached value should follow a successful set");
    }
    if (gpcam::tests::common::ReadChildString(tree.root_widget(), "capturetarget") !=
        "Internal RAM") {
      Fail("native widget should hold the new value");
    }

    ConfigItem& exposure = RequireItem(tree, "capturesettings/exposurecompensation");
    ExpectSetFails(exposure, SettableValue(0.25), ErrorCode::kInvalidValue, "off-step range");
    ExpectSetFails(exposure, SettableValue(4), ErrorCode::kInvalidValue, "out-of-range");
    ExpectSetFails(exposure, SettableValue(std::string("1")), ErrorCode::kInvalidValue,
                   "string for range");
    if (!exposure.Set(SettableValue(-1.5), error) ||
        std::get<RangeValue>(exposure.value()).value != -1.5F) {
      Fail("on-step range value should be set");
    }

    ConfigItem& movie = RequireItem(tree, "actions/movie");
    ExpectSetFails(movie, SettableValue(1), ErrorCode::kInvalidValue, "int for toggle");
    if (!movie.Set(SettableValue(true), error) ||
        std::get<ToggleValue>(movie.value()).state != true) {
      Fail("toggle should accept bool");
    }

    committer.fail_with = GP_ERROR_CAMERA_BUSY;
    Error busy;
    if (RequireItem(tree, "settings/iso").Set(SettableValue(std::string("400")), busy)) {
      Fail("commit failure should fail the set");
    }
    if (busy.code != ErrorCode::kCameraBusy) {
      Fail("commit failure should surface the native error");
    }
    if (std::get<SelectionValue>(RequireItem(tree, "settings/iso").value()).choice != "100") {
      Fail("cached value should stay when the commit fails");
    }

    const auto writable = CollectWritableSettings(tree);
    if (writable.size() != 3U) {
      Fail("writable view should list the settings sections only");
    }
    for (const auto& ref : writable) {
      if (ref.section.find("settings") == std::string::npos || ref.item->readonly()) {
        Fail("writable view should only contain writable settings");
      }
    }

    const auto status = CollectStatus(tree);
    if (status.size() != 1U || status.front().item->name() != "batterylevel") {
      Fail("status view should skip bare PTP property ids");
    }
  }

  {
    Error error;
    ConfigTree tree;
    if (BuildConfigTree(api, nullptr, nullptr, tree, error) ||
        error.code != ErrorCode::kNotInitialized) {
      Fail("null root should be rejected");
    }
  }

  {
    // A failure deep in the traversal leaves the target tree untouched.
    NativeApi failing = api;
    failing.widget_get_readonly = [](CameraWidget*, int*) { return GP_ERROR_CORRUPTED_DATA; };
    FakeCamera fake;
    ConfigTree tree;
    Error error;
    if (BuildConfigTree(failing, BuildFakeConfig(fake), nullptr, tree, error)) {
      Fail("traversal failure should fail the build");
    }
    if (!tree.empty() || error.code != ErrorCode::kCorruptedData) {
      Fail("failed build should report the native error and keep the tree empty");
    }
    AssertContains(gpcam::gphoto::FormatError(error), "GP_CORRUPTED_DATA");
  }

  return 0;
}
