#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace gpcam::camera {

// Capture target names libgphoto2 drivers use for the `capturetarget` setting.
inline constexpr std::string_view kStorageCaptureTarget = "Memory card";
inline constexpr std::string_view kVolatileCaptureTarget = "Internal RAM";

struct CameraOptions {
  // "usb:BBB,DDD"; unset means libgphoto2 autodetection.
  std::optional<std::string> port;
  // Defer device initialization to the first operation.
  bool lazy = false;
  // Per-poll bound of `gp_camera_wait_for_event`.
  std::chrono::milliseconds event_timeout{1000};
  // Overall bound of the wait for the captured file; unset waits until the
  // device reports it.
  std::optional<std::chrono::milliseconds> capture_timeout;
  // Default chunk size of streamed downloads.
  std::size_t chunk_size = 64U * 1024U;
  std::string storage_target = std::string(kStorageCaptureTarget);
  std::string volatile_target = std::string(kVolatileCaptureTarget);
};

struct UsbAddress {
  int bus = 0;
  int device = 0;
};

// Parses "usb:BBB,DDD" (leading zeros optional).
bool ParseUsbPort(std::string_view port, UsbAddress& address, std::string& error);

// Canonical "usb:%03d,%03d" spelling used by libgphoto2 port lists.
std::string FormatUsbPort(const UsbAddress& address);

using EnvLookup = std::function<const char*(const char* name)>;

// Applies GPCAM_PORT, GPCAM_EVENT_TIMEOUT_MS, GPCAM_CAPTURE_TIMEOUT_MS and
// GPCAM_CHUNK_SIZE on top of `options`. Unset variables leave the field alone;
// malformed values fail with the variable named in `error`.
bool ApplyEnvironmentOverrides(CameraOptions& options, const EnvLookup& lookup,
                               std::string& error);

// Same, reading the process environment.
bool ApplyEnvironmentOverrides(CameraOptions& options, std::string& error);

} // namespace gpcam::camera
