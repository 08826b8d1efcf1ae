#pragma once

#include "camera/camera_options.hpp"
#include "gphoto/error_mapper.hpp"
#include "gphoto/gphoto2_library.hpp"

#include <map>
#include <string>
#include <vector>

namespace gpcam::camera {

// One attached still camera found by libgphoto2 autodetection.
struct CameraDescriptor {
  std::string model;
  // "usb:BBB,DDD" as reported by the port list.
  std::string port;
  UsbAddress address;
  CameraAbilities abilities{};
};

// Loads the port and abilities lists, runs detection and keeps USB entries
// whose driver reports a still camera.
bool ListCameras(gphoto::Gphoto2Library& library, std::vector<CameraDescriptor>& cameras,
                 gphoto::Error& error);

// Driver library basename -> sorted model names, for every still-camera model
// libgphoto2 knows about.
bool SupportedCameras(gphoto::Gphoto2Library& library,
                      std::map<std::string, std::vector<std::string>>& drivers,
                      gphoto::Error& error);

// Options that open the camera at `descriptor` lazily.
CameraOptions OptionsFor(const CameraDescriptor& descriptor, CameraOptions base);

} // namespace gpcam::camera
