#include "camera/video_capture.hpp"

#include "camera/camera.hpp"
#include "config/widget_tree.hpp"

namespace gpcam::camera {

namespace {

constexpr std::string_view kMovieTogglePath = "actions/movie";
constexpr std::string_view kCaptureTargetPath = "settings/capturetarget";

} // namespace

VideoCapture::VideoCapture(Camera& camera) : camera_(camera) {}

VideoCapture::~VideoCapture() {
  if (!recording_) {
    return;
  }
  files::File discarded;
  gphoto::Error error;
  if (!Stop(discarded, error)) {
    camera_.logger().Warn("failed to stop video recording", {{"error", gphoto::FormatError(error)}});
  }
}

bool VideoCapture::SetMovie(const bool enabled, gphoto::Error& error) {
  config::ConfigTree tree;
  if (!camera_.ReadConfigUnchecked(&camera_.device_committer_, tree, error)) {
    return false;
  }
  config::ConfigItem* movie = tree.FindItem(kMovieTogglePath);
  if (movie == nullptr) {
    error = gphoto::MakeLocalError(gphoto::ErrorCode::kUnsupportedDevice,
                                   "camera has no actions/movie setting");
    return false;
  }
  return movie->Set(config::SettableValue(enabled), error);
}

bool VideoCapture::Start(gphoto::Error& error) {
  if (recording_) {
    error = gphoto::MakeLocalError(gphoto::ErrorCode::kCaptureInProgress,
                                   "video recording already running");
    return false;
  }
  if (!camera_.EnsureReady(error)) {
    return false;
  }
  gphoto::ScopedDeviceOperation operation(*camera_.session_);

  config::ConfigTree tree;
  if (!camera_.ReadConfigUnchecked(&camera_.device_committer_, tree, error)) {
    return false;
  }
  previous_target_.reset();
  if (const config::ConfigItem* target = tree.FindItem(kCaptureTargetPath); target != nullptr) {
    const std::string current = config::FormatWidgetValue(target->value());
    if (current != camera_.options().storage_target) {
      previous_target_ = current;
    }
  }
  if (previous_target_.has_value() &&
      !camera_.SelectCaptureTarget(camera_.options().storage_target, error)) {
    return false;
  }

  if (!SetMovie(true, error)) {
    return false;
  }
  recording_ = true;
  camera_.logger().Info("video recording started");
  return true;
}

bool VideoCapture::Stop(files::File& video, gphoto::Error& error) {
  if (!recording_) {
    error = gphoto::MakeLocalError(gphoto::ErrorCode::kNotInitialized,
                                   "no video recording is running");
    return false;
  }
  gphoto::ScopedDeviceOperation operation(*camera_.session_);

  if (!SetMovie(false, error)) {
    return false;
  }
  recording_ = false;

  EventWaitResult waited;
  const EventWaitOptions wait{
      .until = GP_EVENT_FILE_ADDED,
      .poll_timeout = camera_.options().event_timeout,
      .max_duration = camera_.options().capture_timeout,
  };
  if (!camera_.WaitForEventUnchecked(wait, waited, error)) {
    return false;
  }
  video = files::File(camera_.session_, waited.folder, waited.name);
  camera_.logger().Info("video recording stopped", {{"path", video.path()}});

  if (previous_target_.has_value()) {
    const std::string restore = previous_target_.value();
    previous_target_.reset();
    if (!camera_.SelectCaptureTarget(restore, error)) {
      return false;
    }
  }
  return true;
}

} // namespace gpcam::camera
