#pragma once

#include "gphoto/error_mapper.hpp"
#include "gphoto/native_api.hpp"

#include <string>
#include <string_view>

namespace gpcam::gphoto {

// True for entry points whose integer result is a count, index or id rather
// than a status code (`gp_list_count`, `gp_port_info_list_lookup_path`, ...).
bool IsStatusExempt(std::string_view call_name);

// Interprets `rc` as returned by `call_name`.
//
// - exempt calls always succeed; the integer is semantic output and the
//   caller branches on it
// - `rc >= 0` succeeds and clears `error`
// - `rc < 0` fills `error` through `MapNativeError`, using the library's own
//   text for codes without a fixed kind
bool CheckNativeResult(const NativeApi& api, std::string_view call_name, int rc, Error& error);

// Builds the translated error for a negative `rc` without the exemption check.
Error TranslateNativeResult(const NativeApi& api, int rc);

// Reads a `const char*` out-parameter and copies it. A null pointer from the
// library yields an empty string.
template <typename Getter>
bool ReadNativeString(const NativeApi& api, std::string_view call_name, Getter&& getter,
                      std::string& value, Error& error) {
  const char* raw = nullptr;
  if (!CheckNativeResult(api, call_name, getter(&raw), error)) {
    return false;
  }
  value = raw == nullptr ? std::string() : std::string(raw);
  return true;
}

} // namespace gpcam::gphoto
