#include "gphoto/native_call.hpp"

#include <algorithm>
#include <array>

namespace gpcam::gphoto {

namespace {

constexpr std::array<std::string_view, 12> kStatusExemptCalls = {
    "gp_log_add_func",
    "gp_log_remove_func",
    "gp_context_new",
    "gp_list_count",
    "gp_result_as_string",
    "gp_library_version",
    "gp_port_info_list_lookup_path",
    "gp_port_info_list_count",
    "gp_abilities_list_lookup_model",
    "gp_abilities_list_count",
    "gp_widget_count_children",
    "gp_widget_count_choices",
};

} // namespace

bool IsStatusExempt(std::string_view call_name) {
  return std::find(kStatusExemptCalls.begin(), kStatusExemptCalls.end(), call_name) !=
         kStatusExemptCalls.end();
}

Error TranslateNativeResult(const NativeApi& api, const int rc) {
  const char* resolved = api.result_as_string ? api.result_as_string(rc) : nullptr;
  return MapNativeError(rc, resolved == nullptr ? std::string_view() : std::string_view(resolved));
}

bool CheckNativeResult(const NativeApi& api, std::string_view call_name, const int rc,
                       Error& error) {
  if (IsStatusExempt(call_name) || rc >= GP_OK) {
    error.Clear();
    return true;
  }

  error = TranslateNativeResult(api, rc);
  return false;
}

} // namespace gpcam::gphoto
