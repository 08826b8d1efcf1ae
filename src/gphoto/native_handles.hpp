#pragma once

#include "gphoto/error_mapper.hpp"
#include "gphoto/native_api.hpp"

#include <string_view>
#include <utility>

namespace gpcam::gphoto {

template <typename T>
struct NativeHandleTraits;

template <>
struct NativeHandleTraits<Camera> {
  static constexpr std::string_view kTypeName = "Camera";
  static void Free(const NativeApi& api, Camera* raw) {
    (void)api.camera_unref(raw);
  }
};

template <>
struct NativeHandleTraits<CameraList> {
  static constexpr std::string_view kTypeName = "CameraList";
  static void Free(const NativeApi& api, CameraList* raw) {
    (void)api.list_free(raw);
  }
};

template <>
struct NativeHandleTraits<CameraFile> {
  static constexpr std::string_view kTypeName = "CameraFile";
  static void Free(const NativeApi& api, CameraFile* raw) {
    (void)api.file_free(raw);
  }
};

template <>
struct NativeHandleTraits<GPPortInfoList> {
  static constexpr std::string_view kTypeName = "GPPortInfoList";
  static void Free(const NativeApi& api, GPPortInfoList* raw) {
    (void)api.port_info_list_free(raw);
  }
};

template <>
struct NativeHandleTraits<CameraAbilitiesList> {
  static constexpr std::string_view kTypeName = "CameraAbilitiesList";
  static void Free(const NativeApi& api, CameraAbilitiesList* raw) {
    (void)api.abilities_list_free(raw);
  }
};

// Root widgets come out of `gp_camera_get_config`; there is no constructor
// entry for them.
template <>
struct NativeHandleTraits<CameraWidget> {
  static constexpr std::string_view kTypeName = "CameraWidget";
  static void Free(const NativeApi& api, CameraWidget* raw) {
    (void)api.widget_free(raw);
  }
};

template <>
struct NativeHandleTraits<GPContext> {
  static constexpr std::string_view kTypeName = "GPContext";
  static void Free(const NativeApi& api, GPContext* raw) {
    api.context_unref(raw);
  }
};

// Move-only exclusive owner of one libgphoto2 object. The destructor releases
// through the matching native free/unref entry of the table it was created
// with, so every exit path (including early returns mid-traversal) frees it.
template <typename T>
class NativeHandle {
public:
  NativeHandle() = default;
  NativeHandle(const NativeApi* api, T* raw) : api_(api), raw_(raw) {}

  ~NativeHandle() {
    Reset();
  }

  NativeHandle(const NativeHandle&) = delete;
  NativeHandle& operator=(const NativeHandle&) = delete;

  NativeHandle(NativeHandle&& other) noexcept
      : api_(std::exchange(other.api_, nullptr)), raw_(std::exchange(other.raw_, nullptr)) {}

  NativeHandle& operator=(NativeHandle&& other) noexcept {
    if (this == &other) {
      return *this;
    }
    Reset();
    api_ = std::exchange(other.api_, nullptr);
    raw_ = std::exchange(other.raw_, nullptr);
    return *this;
  }

  T* get() const {
    return raw_;
  }

  explicit operator bool() const {
    return raw_ != nullptr;
  }

  void Reset() {
    if (raw_ != nullptr && api_ != nullptr) {
      NativeHandleTraits<T>::Free(*api_, raw_);
    }
    raw_ = nullptr;
  }

private:
  const NativeApi* api_ = nullptr;
  T* raw_ = nullptr;
};

// Name -> constructor factory. Looks `type_name` up in a static table
// (Camera, CameraList, CameraFile, GPPortInfoList, CameraAbilitiesList), runs
// the constructor through `CheckNativeResult` and hands back the raw object.
// Unregistered names fail with `kUnknownHandleType`.
bool CreateNativeObject(const NativeApi& api, std::string_view type_name, void*& object,
                        Error& error);

template <typename T>
bool CreateHandle(const NativeApi& api, NativeHandle<T>& handle, Error& error) {
  void* raw = nullptr;
  if (!CreateNativeObject(api, NativeHandleTraits<T>::kTypeName, raw, error)) {
    return false;
  }
  handle = NativeHandle<T>(&api, static_cast<T*>(raw));
  return true;
}

// Wraps a CameraFile bound to an already open descriptor (uploads/saves).
bool CreateFileFromDescriptor(const NativeApi& api, int fd, NativeHandle<CameraFile>& handle,
                              Error& error);

} // namespace gpcam::gphoto
