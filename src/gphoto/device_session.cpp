#include "gphoto/device_session.hpp"

#include "gphoto/native_call.hpp"

#include <utility>

namespace gpcam::gphoto {

DeviceSession::DeviceSession(const NativeApi& api, NativeHandle<GPContext> context,
                             NativeHandle<Camera> camera)
    : api_(&api), context_(std::move(context)), camera_(std::move(camera)) {}

DeviceSession::~DeviceSession() {
  ExitAfterOperation();
}

void DeviceSession::ExitAfterOperation() const {
  if (!camera_ || !api_->camera_exit) {
    return;
  }
  (void)api_->camera_exit(camera_.get(), context_.get());
}

bool DeviceSession::Abilities(CameraAbilities& abilities, Error& error) {
  error.Clear();
  if (abilities_.has_value()) {
    abilities = abilities_.value();
    return true;
  }

  CameraAbilities fetched{};
  if (!CheckNativeResult(*api_, "gp_camera_get_abilities",
                         api_->camera_get_abilities(camera_.get(), &fetched), error)) {
    return false;
  }
  abilities_ = fetched;
  abilities = fetched;
  return true;
}

void DeviceSession::SeedAbilities(const CameraAbilities& abilities) {
  abilities_ = abilities;
}

} // namespace gpcam::gphoto
