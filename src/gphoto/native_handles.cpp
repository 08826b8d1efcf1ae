#include "gphoto/native_handles.hpp"

#include "gphoto/native_call.hpp"

#include <array>
#include <string>

namespace gpcam::gphoto {

namespace {

using ConstructFn = int (*)(const NativeApi& api, void*& object);

struct ConstructorEntry {
  std::string_view type_name;
  std::string_view call_name;
  ConstructFn construct = nullptr;
};

template <typename T, typename Member>
int ConstructInto(const NativeApi& api, Member member, void*& object) {
  T* raw = nullptr;
  const int rc = (api.*member)(&raw);
  object = raw;
  return rc;
}

constexpr std::array<ConstructorEntry, 5> kConstructors = {{
    {"Camera", "gp_camera_new",
     [](const NativeApi& api, void*& object) {
       return ConstructInto<Camera>(api, &NativeApi::camera_new, object);
     }},
    {"CameraList", "gp_list_new",
     [](const NativeApi& api, void*& object) {
       return ConstructInto<CameraList>(api, &NativeApi::list_new, object);
     }},
    {"CameraFile", "gp_file_new",
     [](const NativeApi& api, void*& object) {
       return ConstructInto<CameraFile>(api, &NativeApi::file_new, object);
     }},
    {"GPPortInfoList", "gp_port_info_list_new",
     [](const NativeApi& api, void*& object) {
       return ConstructInto<GPPortInfoList>(api, &NativeApi::port_info_list_new, object);
     }},
    {"CameraAbilitiesList", "gp_abilities_list_new",
     [](const NativeApi& api, void*& object) {
       return ConstructInto<CameraAbilitiesList>(api, &NativeApi::abilities_list_new, object);
     }},
}};

} // namespace

bool CreateNativeObject(const NativeApi& api, std::string_view type_name, void*& object,
                        Error& error) {
  object = nullptr;
  for (const ConstructorEntry& entry : kConstructors) {
    if (entry.type_name != type_name) {
      continue;
    }
    return CheckNativeResult(api, entry.call_name, entry.construct(api, object), error);
  }

  error = MakeLocalError(ErrorCode::kUnknownHandleType,
                         "no native constructor registered for type '" + std::string(type_name) +
                             "'");
  return false;
}

bool CreateFileFromDescriptor(const NativeApi& api, const int fd,
                              NativeHandle<CameraFile>& handle, Error& error) {
  CameraFile* raw = nullptr;
  if (!CheckNativeResult(api, "gp_file_new_from_fd", api.file_new_from_fd(&raw, fd), error)) {
    return false;
  }
  handle = NativeHandle<CameraFile>(&api, raw);
  return true;
}

} // namespace gpcam::gphoto
