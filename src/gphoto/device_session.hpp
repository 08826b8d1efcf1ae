#pragma once

#include "gphoto/error_mapper.hpp"
#include "gphoto/native_api.hpp"
#include "gphoto/native_handles.hpp"

#include <optional>

namespace gpcam::gphoto {

// Native state of one opened device: the camera handle, its context and the
// abilities record read from the driver.
//
// Camera, Directory and File references share ownership through
// `std::shared_ptr`, so a File handed out by a capture keeps the device handle
// alive. The NativeApi table (owned by Gphoto2Library) must outlive every
// session.
class DeviceSession {
public:
  DeviceSession(const NativeApi& api, NativeHandle<GPContext> context,
                NativeHandle<Camera> camera);
  ~DeviceSession();

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

  const NativeApi& api() const {
    return *api_;
  }

  Camera* camera() const {
    return camera_.get();
  }

  GPContext* context() const {
    return context_.get();
  }

  // Closes the device connection so other processes may claim it. libgphoto2
  // reopens it transparently on the next camera call.
  void ExitAfterOperation() const;

  // Read once from the driver, then served from the cache.
  bool Abilities(CameraAbilities& abilities, Error& error);

  // Seeds the cache when the abilities are already known (discovery).
  void SeedAbilities(const CameraAbilities& abilities);

private:
  const NativeApi* api_ = nullptr;
  NativeHandle<GPContext> context_;
  NativeHandle<Camera> camera_;
  std::optional<CameraAbilities> abilities_;
};

// Calls `ExitAfterOperation` when the enclosing public operation returns,
// on success and failure alike.
class ScopedDeviceOperation {
public:
  explicit ScopedDeviceOperation(const DeviceSession& session) : session_(session) {}
  ~ScopedDeviceOperation() {
    session_.ExitAfterOperation();
  }

  ScopedDeviceOperation(const ScopedDeviceOperation&) = delete;
  ScopedDeviceOperation& operator=(const ScopedDeviceOperation&) = delete;

private:
  const DeviceSession& session_;
};

} // namespace gpcam::gphoto
