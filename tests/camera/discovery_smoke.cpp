#include "../common/assertions.hpp"
#include "../common/fake_camera.hpp"
#include "camera/discovery.hpp"
#include "core/logging/logger.hpp"
#include "gphoto/gphoto2_library.hpp"

#include <cstring>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct KnownModel {
  const char* model;
  const char* library;
  CameraDriverStatus status;
  GphotoDeviceType device_type;
};

const std::vector<KnownModel>& KnownModels() {
  static const std::vector<KnownModel> models = {
      {"Canon EOS 100D", "/usr/lib/libgphoto2/2.5.31/ptp2.so", GP_DRIVER_STATUS_PRODUCTION,
       GP_DEVICE_STILL_CAMERA},
      {"Nikon DSC D750", "/usr/lib/libgphoto2/2.5.31/ptp2.so", GP_DRIVER_STATUS_PRODUCTION,
       GP_DEVICE_STILL_CAMERA},
      {"Generic Audio Player", "/usr/lib/libgphoto2/2.5.31/ptp2.so",
       GP_DRIVER_STATUS_PRODUCTION, GP_DEVICE_AUDIO_PLAYER},
      {"Kodak DC240", "/usr/lib/libgphoto2/2.5.31/kodak_dc240.so", GP_DRIVER_STATUS_PRODUCTION,
       GP_DEVICE_STILL_CAMERA},
  };
  return models;
}

// Abilities and port lists are served from the table above instead of the
// installed camlibs and iolibs.
gpcam::gphoto::NativeApi MakeDiscoveryApi(gpcam::tests::common::FakeCamera& fake) {
  gpcam::gphoto::NativeApi api = gpcam::tests::common::MakeFakeNativeApi(fake);
  api.port_info_list_load = [](GPPortInfoList*) { return GP_OK; };
  api.abilities_list_load = [](CameraAbilitiesList*, GPContext*) { return GP_OK; };
  api.abilities_list_detect = [](CameraAbilitiesList*, GPPortInfoList*, CameraList* list,
                                 GPContext*) {
    (void)gp_list_append(list, "Canon EOS 100D", "usb:001,004");
    (void)gp_list_append(list, "Serial Camera", "serial:/dev/ttyS0");
    (void)gp_list_append(list, "Generic Audio Player", "usb:002,003");
    (void)gp_list_append(list, "Mystery Device", "usb:002,009");
    return GP_OK;
  };
  api.abilities_list_count = [](CameraAbilitiesList*) {
    return static_cast<int>(KnownModels().size());
  };
  api.abilities_list_lookup_model = [](CameraAbilitiesList*, const char* model) {
    const auto& models = KnownModels();
    for (std::size_t index = 0; index < models.size(); ++index) {
      if (std::strcmp(models[index].model, model) == 0) {
        return static_cast<int>(index);
      }
    }
    return GP_ERROR_MODEL_NOT_FOUND;
  };
  api.abilities_list_get_abilities = [](CameraAbilitiesList*, int index,
                                        CameraAbilities* abilities) {
    const auto& models = KnownModels();
    if (index < 0 || index >= static_cast<int>(models.size())) {
      return GP_ERROR_BAD_PARAMETERS;
    }
    *abilities = CameraAbilities{};
    std::strncpy(abilities->model, models[index].model, sizeof(abilities->model) - 1U);
    std::strncpy(abilities->library, models[index].library, sizeof(abilities->library) - 1U);
    abilities->status = models[index].status;
    abilities->device_type = models[index].device_type;
    return GP_OK;
  };
  return api;
}

} // namespace

int main() {
  using gpcam::camera::CameraDescriptor;
  using gpcam::camera::CameraOptions;
  using gpcam::camera::ListCameras;
  using gpcam::camera::OptionsFor;
  using gpcam::camera::SupportedCameras;
  using gpcam::core::logging::LogLevel;
  using gpcam::core::logging::Logger;
  using gpcam::gphoto::Error;
  using gpcam::gphoto::Gphoto2Library;
  using gpcam::tests::common::Fail;
  using gpcam::tests::common::FakeCamera;

  FakeCamera fake;
  std::ostringstream log_output;
  Gphoto2Library library(MakeDiscoveryApi(fake), Logger(LogLevel::kDebug, log_output));

  {
    std::vector<CameraDescriptor> cameras;
    Error error;
    if (!ListCameras(library, cameras, error)) {
      Fail("camera listing failed: " + gpcam::gphoto::FormatError(error));
    }
    if (cameras.size() != 1U) {
      Fail("only usb still cameras with known abilities should be listed");
    }
    const CameraDescriptor& canon = cameras.front();
    if (canon.model != "Canon EOS 100D" || canon.port != "usb:001,004" ||
        canon.address.bus != 1 || canon.address.device != 4 ||
        std::string(canon.abilities.model) != "Canon EOS 100D") {
      Fail("detected camera descriptor is incomplete");
    }
    if (fake.init_calls != 0) {
      Fail("listing cameras must not open them");
    }

    CameraOptions base;
    base.chunk_size = 1024U;
    const CameraOptions options = OptionsFor(canon, base);
    if (options.port != std::string("usb:001,004") || !options.lazy ||
        options.chunk_size != 1024U) {
      Fail("descriptor options should target the detected port lazily");
    }
    gpcam::tests::common::AssertContains(log_output.str(), "skipping non-usb device");
  }

  {
    std::map<std::string, std::vector<std::string>> drivers;
    Error error;
    if (!SupportedCameras(library, drivers, error)) {
      Fail("supported camera listing failed: " + gpcam::gphoto::FormatError(error));
    }
    const std::map<std::string, std::vector<std::string>> expected = {
        {"kodak_dc240.so", {"Kodak DC240"}},
        {"ptp2.so", {"Canon EOS 100D", "Nikon DSC D750"}},
    };
    if (drivers != expected) {
      Fail("supported cameras should be grouped by driver with still cameras only");
    }
  }

  return 0;
}
