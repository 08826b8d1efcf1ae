#pragma once

#include <cstdint>
#include <functional>

#include <gphoto2/gphoto2-port-log.h>
#include <gphoto2/gphoto2-version.h>
#include <gphoto2/gphoto2.h>

namespace gpcam::gphoto {

// The libgphoto2 entry points this project calls, as an injectable table.
//
// `DefaultNativeApi()` binds every member to the linked library. Tests start
// from the default table and replace the camera-side members with fakes,
// which keeps the in-memory widget, list and file implementations real while
// no device is attached.
struct NativeApi {
  // Library-level
  std::function<GPContext*()> context_new;
  std::function<void(GPContext*)> context_unref;
  std::function<int(GPLogLevel, GPLogFunc, void*)> log_add_func;
  std::function<int(int)> log_remove_func;
  std::function<const char*(int)> result_as_string;
  std::function<const char**(GPVersionVerbosity)> library_version;

  // Camera
  std::function<int(Camera**)> camera_new;
  std::function<int(Camera*)> camera_unref;
  std::function<int(Camera*, GPContext*)> camera_init;
  std::function<int(Camera*, GPContext*)> camera_exit;
  std::function<int(Camera*, GPPortInfo)> camera_set_port_info;
  std::function<int(Camera*, CameraAbilities*)> camera_get_abilities;
  std::function<int(Camera*, CameraWidget**, GPContext*)> camera_get_config;
  std::function<int(Camera*, CameraWidget*, GPContext*)> camera_set_config;
  std::function<int(Camera*, GPContext*)> camera_trigger_capture;
  std::function<int(Camera*, int, CameraEventType*, void**, GPContext*)> camera_wait_for_event;
  std::function<int(Camera*, CameraFile*, GPContext*)> camera_capture_preview;
  std::function<int(Camera*, CameraStorageInformation**, int*, GPContext*)>
      camera_get_storageinfo;

  // Remote file system
  std::function<int(Camera*, const char*, CameraList*, GPContext*)> camera_folder_list_files;
  std::function<int(Camera*, const char*, CameraList*, GPContext*)> camera_folder_list_folders;
  std::function<int(Camera*, const char*, const char*, GPContext*)> camera_folder_make_dir;
  std::function<int(Camera*, const char*, const char*, GPContext*)> camera_folder_remove_dir;
  std::function<int(Camera*, const char*, const char*, CameraFileType, CameraFile*, GPContext*)>
      camera_folder_put_file;
  std::function<int(Camera*, const char*, const char*, CameraFileInfo*, GPContext*)>
      camera_file_get_info;
  std::function<int(Camera*, const char*, const char*, CameraFileType, CameraFile*, GPContext*)>
      camera_file_get;
  std::function<int(Camera*, const char*, const char*, CameraFileType, std::uint64_t, char*,
                    std::uint64_t*, GPContext*)>
      camera_file_read;
  std::function<int(Camera*, const char*, const char*, GPContext*)> camera_file_delete;

  // CameraFile
  std::function<int(CameraFile**)> file_new;
  std::function<int(CameraFile**, int)> file_new_from_fd;
  std::function<int(CameraFile*)> file_free;
  std::function<int(CameraFile*, const char**, unsigned long*)> file_get_data_and_size;

  // CameraList
  std::function<int(CameraList**)> list_new;
  std::function<int(CameraList*)> list_free;
  std::function<int(CameraList*)> list_count;
  std::function<int(CameraList*, int, const char**)> list_get_name;
  std::function<int(CameraList*, int, const char**)> list_get_value;

  // Ports
  std::function<int(GPPortInfoList**)> port_info_list_new;
  std::function<int(GPPortInfoList*)> port_info_list_free;
  std::function<int(GPPortInfoList*)> port_info_list_load;
  std::function<int(GPPortInfoList*, const char*)> port_info_list_lookup_path;
  std::function<int(GPPortInfoList*, int, GPPortInfo*)> port_info_list_get_info;

  // Abilities
  std::function<int(CameraAbilitiesList**)> abilities_list_new;
  std::function<int(CameraAbilitiesList*)> abilities_list_free;
  std::function<int(CameraAbilitiesList*, GPContext*)> abilities_list_load;
  std::function<int(CameraAbilitiesList*, GPPortInfoList*, CameraList*, GPContext*)>
      abilities_list_detect;
  std::function<int(CameraAbilitiesList*)> abilities_list_count;
  std::function<int(CameraAbilitiesList*, const char*)> abilities_list_lookup_model;
  std::function<int(CameraAbilitiesList*, int, CameraAbilities*)> abilities_list_get_abilities;

  // Configuration widgets
  std::function<int(CameraWidget*)> widget_free;
  std::function<int(CameraWidget*)> widget_count_children;
  std::function<int(CameraWidget*, int, CameraWidget**)> widget_get_child;
  std::function<int(CameraWidget*, const char**)> widget_get_name;
  std::function<int(CameraWidget*, const char**)> widget_get_label;
  std::function<int(CameraWidget*, const char**)> widget_get_info;
  std::function<int(CameraWidget*, CameraWidgetType*)> widget_get_type;
  std::function<int(CameraWidget*, void*)> widget_get_value;
  std::function<int(CameraWidget*, const void*)> widget_set_value;
  std::function<int(CameraWidget*)> widget_count_choices;
  std::function<int(CameraWidget*, int, const char**)> widget_get_choice;
  std::function<int(CameraWidget*, float*, float*, float*)> widget_get_range;
  std::function<int(CameraWidget*, int*)> widget_get_readonly;
};

NativeApi DefaultNativeApi();

} // namespace gpcam::gphoto
