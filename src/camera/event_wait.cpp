#include "camera/event_wait.hpp"

#include "gphoto/native_call.hpp"

#include <cstdlib>
#include <memory>

namespace gpcam::camera {

namespace {

struct FreeDeleter {
  void operator()(void* payload) const {
    std::free(payload);
  }
};

// libgphoto2 allocates event payloads with malloc and leaves them to the
// caller.
using EventPayload = std::unique_ptr<void, FreeDeleter>;

} // namespace

const char* ToString(const CameraEventType type) {
  switch (type) {
  case GP_EVENT_UNKNOWN:
    return "unknown";
  case GP_EVENT_TIMEOUT:
    return "timeout";
  case GP_EVENT_FILE_ADDED:
    return "file_added";
  case GP_EVENT_FOLDER_ADDED:
    return "folder_added";
  case GP_EVENT_CAPTURE_COMPLETE:
    return "capture_complete";
  default:
    return "other";
  }
}

bool WaitForCameraEvent(const gphoto::NativeApi& api, ::Camera* camera, GPContext* context,
                        const EventWaitOptions& options, core::logging::Logger& logger,
                        EventWaitResult& result, gphoto::Error& error) {
  result = EventWaitResult{};
  error.Clear();
  if (!options.until.has_value() && !options.max_duration.has_value()) {
    error = gphoto::MakeLocalError(gphoto::ErrorCode::kInvalidValue,
                                   "event wait needs an event type or a duration");
    return false;
  }

  const int poll_timeout_ms = static_cast<int>(options.poll_timeout.count());
  const auto started = std::chrono::steady_clock::now();
  while (true) {
    CameraEventType type = GP_EVENT_UNKNOWN;
    void* raw_payload = nullptr;
    const int rc = api.camera_wait_for_event(camera, poll_timeout_ms, &type, &raw_payload, context);
    EventPayload payload(raw_payload);
    ++result.polls;
    if (!gphoto::CheckNativeResult(api, "gp_camera_wait_for_event", rc, error)) {
      return false;
    }
    result.last_event = type;

    switch (type) {
    case GP_EVENT_CAPTURE_COMPLETE:
      logger.Info("capture completed");
      break;
    case GP_EVENT_FILE_ADDED: {
      const auto* path = static_cast<const CameraFilePath*>(payload.get());
      if (path != nullptr) {
        result.folder = path->folder;
        result.name = path->name;
      }
      logger.Info("file added", {{"folder", result.folder}, {"name", result.name}});
      break;
    }
    case GP_EVENT_TIMEOUT:
      logger.Debug("timeout while waiting for event");
      break;
    default:
      logger.Debug("camera event", {{"type", ToString(type)}});
      break;
    }

    if (options.until.has_value() && type == options.until.value()) {
      result.matched = true;
      return true;
    }

    if (options.max_duration.has_value() &&
        std::chrono::steady_clock::now() - started >= options.max_duration.value()) {
      if (!options.until.has_value()) {
        return true;
      }
      error = gphoto::MakeLocalError(gphoto::ErrorCode::kOperationCancelled,
                                     std::string("gave up waiting for ") +
                                         ToString(options.until.value()) + " after " +
                                         std::to_string(options.max_duration->count()) + " ms");
      return false;
    }
  }
}

} // namespace gpcam::camera
