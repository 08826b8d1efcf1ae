#include "gphoto/native_api.hpp"

namespace gpcam::gphoto {

NativeApi DefaultNativeApi() {
  NativeApi api;

  api.context_new = &gp_context_new;
  api.context_unref = &gp_context_unref;
  api.log_add_func = &gp_log_add_func;
  api.log_remove_func = &gp_log_remove_func;
  api.result_as_string = &gp_result_as_string;
  api.library_version = &gp_library_version;

  api.camera_new = &gp_camera_new;
  api.camera_unref = &gp_camera_unref;
  api.camera_init = &gp_camera_init;
  api.camera_exit = &gp_camera_exit;
  api.camera_set_port_info = &gp_camera_set_port_info;
  api.camera_get_abilities = &gp_camera_get_abilities;
  api.camera_get_config = &gp_camera_get_config;
  api.camera_set_config = &gp_camera_set_config;
  api.camera_trigger_capture = &gp_camera_trigger_capture;
  api.camera_wait_for_event = &gp_camera_wait_for_event;
  api.camera_capture_preview = &gp_camera_capture_preview;
  api.camera_get_storageinfo = &gp_camera_get_storageinfo;

  api.camera_folder_list_files = &gp_camera_folder_list_files;
  api.camera_folder_list_folders = &gp_camera_folder_list_folders;
  api.camera_folder_make_dir = &gp_camera_folder_make_dir;
  api.camera_folder_remove_dir = &gp_camera_folder_remove_dir;
  api.camera_folder_put_file = &gp_camera_folder_put_file;
  api.camera_file_get_info = &gp_camera_file_get_info;
  api.camera_file_get = &gp_camera_file_get;
  api.camera_file_read = &gp_camera_file_read;
  api.camera_file_delete = &gp_camera_file_delete;

  api.file_new = &gp_file_new;
  api.file_new_from_fd = &gp_file_new_from_fd;
  api.file_free = &gp_file_free;
  api.file_get_data_and_size = &gp_file_get_data_and_size;

  api.list_new = &gp_list_new;
  api.list_free = &gp_list_free;
  api.list_count = &gp_list_count;
  api.list_get_name = &gp_list_get_name;
  api.list_get_value = &gp_list_get_value;

  api.port_info_list_new = &gp_port_info_list_new;
  api.port_info_list_free = &gp_port_info_list_free;
  api.port_info_list_load = &gp_port_info_list_load;
  api.port_info_list_lookup_path = &gp_port_info_list_lookup_path;
  api.port_info_list_get_info = &gp_port_info_list_get_info;

  api.abilities_list_new = &gp_abilities_list_new;
  api.abilities_list_free = &gp_abilities_list_free;
  api.abilities_list_load = &gp_abilities_list_load;
  api.abilities_list_detect = &gp_abilities_list_detect;
  api.abilities_list_count = &gp_abilities_list_count;
  api.abilities_list_lookup_model = &gp_abilities_list_lookup_model;
  api.abilities_list_get_abilities = &gp_abilities_list_get_abilities;

  api.widget_free = &gp_widget_free;
  api.widget_count_children = &gp_widget_count_children;
  api.widget_get_child = &gp_widget_get_child;
  api.widget_get_name = &gp_widget_get_name;
  api.widget_get_label = &gp_widget_get_label;
  api.widget_get_info = &gp_widget_get_info;
  api.widget_get_type = &gp_widget_get_type;
  api.widget_get_value = &gp_widget_get_value;
  api.widget_set_value = &gp_widget_set_value;
  api.widget_count_choices = &gp_widget_count_choices;
  api.widget_get_choice = &gp_widget_get_choice;
  api.widget_get_range = &gp_widget_get_range;
  api.widget_get_readonly = &gp_widget_get_readonly;

  return api;
}

} // namespace gpcam::gphoto
