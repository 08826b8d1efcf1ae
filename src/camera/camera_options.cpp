#include "camera/camera_options.hpp"

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace gpcam::camera {

namespace {

template <typename T>
bool ParseUnsigned(std::string_view raw, T& value) {
  if (raw.empty()) {
    return false;
  }
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

bool ParsePositiveMillis(std::string_view name, std::string_view raw,
                         std::chrono::milliseconds& value, std::string& error) {
  std::uint32_t parsed = 0;
  if (!ParseUnsigned(raw, parsed) || parsed == 0U) {
    error = std::string(name) + " must be a positive integer (milliseconds), got '" +
            std::string(raw) + "'";
    return false;
  }
  value = std::chrono::milliseconds(parsed);
  return true;
}

} // namespace

bool ParseUsbPort(std::string_view port, UsbAddress& address, std::string& error) {
  constexpr std::string_view kPrefix = "usb:";
  if (port.substr(0, kPrefix.size()) != kPrefix) {
    error = "port '" + std::string(port) + "' is not of the form usb:BBB,DDD";
    return false;
  }
  const std::string_view numbers = port.substr(kPrefix.size());
  const std::size_t comma = numbers.find(',');
  if (comma == std::string_view::npos) {
    error = "port '" + std::string(port) + "' is not of the form usb:BBB,DDD";
    return false;
  }

  UsbAddress parsed;
  if (!ParseUnsigned(numbers.substr(0, comma), parsed.bus) ||
      !ParseUnsigned(numbers.substr(comma + 1U), parsed.device)) {
    error = "port '" + std::string(port) + "' has a non-numeric bus or device";
    return false;
  }
  address = parsed;
  return true;
}

std::string FormatUsbPort(const UsbAddress& address) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "usb:%03d,%03d", address.bus, address.device);
  return buffer;
}

bool ApplyEnvironmentOverrides(CameraOptions& options, const EnvLookup& lookup,
                               std::string& error) {
  error.clear();

  if (const char* port = lookup("GPCAM_PORT"); port != nullptr && *port != '\0') {
    UsbAddress address;
    std::string port_error;
    if (!ParseUsbPort(port, address, port_error)) {
      error = "GPCAM_PORT: " + port_error;
      return false;
    }
    options.port = FormatUsbPort(address);
  }

  if (const char* raw = lookup("GPCAM_EVENT_TIMEOUT_MS"); raw != nullptr) {
    if (!ParsePositiveMillis("GPCAM_EVENT_TIMEOUT_MS", raw, options.event_timeout, error)) {
      return false;
    }
  }

  if (const char* raw = lookup("GPCAM_CAPTURE_TIMEOUT_MS"); raw != nullptr) {
    std::chrono::milliseconds capture_timeout{0};
    if (!ParsePositiveMillis("GPCAM_CAPTURE_TIMEOUT_MS", raw, capture_timeout, error)) {
      return false;
    }
    options.capture_timeout = capture_timeout;
  }

  if (const char* raw = lookup("GPCAM_CHUNK_SIZE"); raw != nullptr) {
    std::size_t chunk_size = 0;
    if (!ParseUnsigned(std::string_view(raw), chunk_size) || chunk_size == 0U) {
      error = "GPCAM_CHUNK_SIZE must be a positive integer (bytes), got '" + std::string(raw) +
              "'";
      return false;
    }
    options.chunk_size = chunk_size;
  }
  return true;
}

bool ApplyEnvironmentOverrides(CameraOptions& options, std::string& error) {
  return ApplyEnvironmentOverrides(
      options, [](const char* name) { return static_cast<const char*>(std::getenv(name)); },
      error);
}

} // namespace gpcam::camera
