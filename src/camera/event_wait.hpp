#pragma once

#include "core/logging/logger.hpp"
#include "gphoto/error_mapper.hpp"
#include "gphoto/native_api.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace gpcam::camera {

const char* ToString(CameraEventType type);

struct EventWaitOptions {
  // Event that ends the wait.
  std::optional<CameraEventType> until;
  // Bound of each `gp_camera_wait_for_event` call.
  std::chrono::milliseconds poll_timeout{1000};
  // Overall bound, checked between polls.
  std::optional<std::chrono::milliseconds> max_duration;
};

struct EventWaitResult {
  // True when `until` was observed; false when the duration bound ended the
  // wait first.
  bool matched = false;
  CameraEventType last_event = GP_EVENT_UNKNOWN;
  std::size_t polls = 0;
  // Location reported by the last FILE_ADDED event.
  std::string folder;
  std::string name;
};

// Polls the device for events.
//
// CAPTURE_COMPLETE and FILE_ADDED are logged, TIMEOUT polls again. Every event
// payload is released after it has been read. At least one of `until` and
// `max_duration` is required. When `until` is set and the duration bound
// elapses first, the wait fails with `kOperationCancelled`.
bool WaitForCameraEvent(const gphoto::NativeApi& api, ::Camera* camera, GPContext* context,
                        const EventWaitOptions& options, core::logging::Logger& logger,
                        EventWaitResult& result, gphoto::Error& error);

} // namespace gpcam::camera
