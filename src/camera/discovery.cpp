#include "camera/discovery.hpp"

#include "gphoto/native_call.hpp"
#include "gphoto/native_handles.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

namespace gpcam::camera {

namespace {

using gphoto::CheckNativeResult;
using gphoto::CreateHandle;
using gphoto::Error;
using gphoto::NativeApi;
using gphoto::NativeHandle;
using gphoto::ReadNativeString;

bool LoadAbilities(const NativeApi& api, GPContext* context,
                   NativeHandle<CameraAbilitiesList>& abilities, Error& error) {
  return CreateHandle(api, abilities, error) &&
         CheckNativeResult(api, "gp_abilities_list_load",
                           api.abilities_list_load(abilities.get(), context), error);
}

bool NewContext(const NativeApi& api, NativeHandle<GPContext>& context, Error& error) {
  GPContext* raw = api.context_new();
  if (raw == nullptr) {
    error = gphoto::MakeLocalError(gphoto::ErrorCode::kNotInitialized,
                                   "gp_context_new returned no context");
    return false;
  }
  context = NativeHandle<GPContext>(&api, raw);
  return true;
}

} // namespace

bool ListCameras(gphoto::Gphoto2Library& library, std::vector<CameraDescriptor>& cameras,
                 Error& error) {
  cameras.clear();
  if (!library.Acquire(error)) {
    return false;
  }
  const NativeApi& api = library.api();
  core::logging::Logger logger = library.logger().WithComponent("discovery");

  NativeHandle<GPContext> context;
  NativeHandle<CameraList> detected;
  NativeHandle<GPPortInfoList> ports;
  NativeHandle<CameraAbilitiesList> abilities;
  if (!NewContext(api, context, error) || !CreateHandle(api, detected, error) ||
      !CreateHandle(api, ports, error) ||
      !CheckNativeResult(api, "gp_port_info_list_load", api.port_info_list_load(ports.get()),
                         error) ||
      !LoadAbilities(api, context.get(), abilities, error) ||
      !CheckNativeResult(api, "gp_abilities_list_detect",
                         api.abilities_list_detect(abilities.get(), ports.get(), detected.get(),
                                                   context.get()),
                         error)) {
    return false;
  }

  const int count = api.list_count(detected.get());
  for (int index = 0; index < count; ++index) {
    CameraDescriptor descriptor;
    if (!ReadNativeString(
            api, "gp_list_get_name",
            [&](const char** out) { return api.list_get_name(detected.get(), index, out); },
            descriptor.model, error) ||
        !ReadNativeString(
            api, "gp_list_get_value",
            [&](const char** out) { return api.list_get_value(detected.get(), index, out); },
            descriptor.port, error)) {
      return false;
    }

    std::string port_error;
    if (!ParseUsbPort(descriptor.port, descriptor.address, port_error)) {
      logger.Debug("skipping non-usb device", {{"model", descriptor.model},
                                               {"port", descriptor.port}});
      continue;
    }

    const int model_index =
        api.abilities_list_lookup_model(abilities.get(), descriptor.model.c_str());
    if (model_index < GP_OK) {
      logger.Debug("no abilities for detected model", {{"model", descriptor.model}});
      continue;
    }
    if (!CheckNativeResult(api, "gp_abilities_list_get_abilities",
                           api.abilities_list_get_abilities(abilities.get(), model_index,
                                                            &descriptor.abilities),
                           error)) {
      return false;
    }
    if (descriptor.abilities.device_type != GP_DEVICE_STILL_CAMERA) {
      continue;
    }
    cameras.push_back(std::move(descriptor));
  }
  return true;
}

bool SupportedCameras(gphoto::Gphoto2Library& library,
                      std::map<std::string, std::vector<std::string>>& drivers, Error& error) {
  drivers.clear();
  if (!library.Acquire(error)) {
    return false;
  }
  const NativeApi& api = library.api();

  NativeHandle<GPContext> context;
  NativeHandle<CameraAbilitiesList> abilities;
  if (!NewContext(api, context, error) || !LoadAbilities(api, context.get(), abilities, error)) {
    return false;
  }

  const int count = api.abilities_list_count(abilities.get());
  for (int index = 0; index < count; ++index) {
    CameraAbilities entry{};
    if (!CheckNativeResult(api, "gp_abilities_list_get_abilities",
                           api.abilities_list_get_abilities(abilities.get(), index, &entry),
                           error)) {
      return false;
    }
    if (entry.device_type != GP_DEVICE_STILL_CAMERA) {
      continue;
    }
    const std::string driver = std::filesystem::path(entry.library).filename().string();
    drivers[driver].emplace_back(entry.model);
  }

  for (auto& [driver, models] : drivers) {
    std::sort(models.begin(), models.end());
  }
  return true;
}

CameraOptions OptionsFor(const CameraDescriptor& descriptor, CameraOptions base) {
  base.port = FormatUsbPort(descriptor.address);
  base.lazy = true;
  return base;
}

} // namespace gpcam::camera
