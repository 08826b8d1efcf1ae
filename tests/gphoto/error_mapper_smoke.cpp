#include "../common/assertions.hpp"
#include "gphoto/error_mapper.hpp"

#include <gphoto2/gphoto2-port-result.h>
#include <gphoto2/gphoto2-result.h>

#include <string>

int main() {
  using gpcam::gphoto::Error;
  using gpcam::gphoto::ErrorCode;
  using gpcam::gphoto::FormatError;
  using gpcam::gphoto::IsCameraIoError;
  using gpcam::gphoto::IsLocalError;
  using gpcam::gphoto::MakeLocalError;
  using gpcam::gphoto::MapNativeError;
  using gpcam::gphoto::ToStableErrorCode;
  using gpcam::tests::common::AssertContains;
  using gpcam::tests::common::AssertNotContains;
  using gpcam::tests::common::Fail;

  {
    const Error mapped = MapNativeError(GP_ERROR_FILE_NOT_FOUND, "ignored");
    if (mapped.code != ErrorCode::kFileNotFound) {
      Fail("file-not-found should map to kFileNotFound");
    }
    if (mapped.native_code != GP_ERROR_FILE_NOT_FOUND) {
      Fail("native code should be preserved");
    }
    if (mapped.message != "File not found.") {
      Fail("fixed mappings should use their own message");
    }
    if (!IsCameraIoError(mapped.code) || IsLocalError(mapped.code)) {
      Fail("file-not-found belongs to the camera IO family");
    }
  }

  {
    const Error mapped = MapNativeError(GP_ERROR_MODEL_NOT_FOUND, "");
    if (mapped.code != ErrorCode::kUnsupportedDevice) {
      Fail("model-not-found should map to kUnsupportedDevice");
    }
    if (ToStableErrorCode(mapped.code) != "GP_UNSUPPORTED_DEVICE") {
      Fail("unexpected stable code for unsupported device");
    }
  }

  {
    const Error mapped = MapNativeError(GP_ERROR_CAMERA_BUSY, "");
    if (mapped.code != ErrorCode::kCameraBusy || IsCameraIoError(mapped.code)) {
      Fail("camera busy should map to kCameraBusy outside the IO family");
    }
  }

  {
    const Error mapped = MapNativeError(GP_ERROR_CANCEL, "");
    if (mapped.code != ErrorCode::kOperationCancelled) {
      Fail("cancel should map to kOperationCancelled");
    }
  }

  {
    // Codes without a dedicated mapping keep the text libgphoto2 resolved.
    const Error mapped = MapNativeError(GP_ERROR_IO_USB_CLAIM, "Could not claim the USB device");
    if (mapped.code != ErrorCode::kGeneric) {
      Fail("unmapped codes should fall back to kGeneric");
    }
    if (mapped.native_code != GP_ERROR_IO_USB_CLAIM) {
      Fail("generic errors should keep the native code");
    }
    if (mapped.message != "Could not claim the USB device") {
      Fail("generic errors should carry the resolved message");
    }
  }

  {
    const Error mapped = MapNativeError(-4242, "");
    AssertContains(mapped.message, "-4242");
  }

  {
    const std::string formatted = FormatError(MapNativeError(GP_ERROR_NO_SPACE, ""));
    AssertContains(formatted, "GP_NO_SPACE: Not enough space.");
    AssertContains(formatted, "(native " + std::to_string(GP_ERROR_NO_SPACE) + ")");
  }

  {
    const Error local = MakeLocalError(ErrorCode::kReadOnly, "setting 'iso' is read-only");
    if (!IsLocalError(local.code) || local.native_code != 0) {
      Fail("local errors carry no native code");
    }
    const std::string formatted = FormatError(local);
    AssertContains(formatted, "GPCAM_READ_ONLY: setting 'iso' is read-only");
    AssertNotContains(formatted, "native");
  }

  {
    Error error = MakeLocalError(ErrorCode::kInvalidValue, "bad");
    if (error.ok()) {
      Fail("an error with a code should not be ok");
    }
    error.Clear();
    if (!error.ok() || !error.message.empty()) {
      Fail("Clear should reset the error");
    }
  }

  return 0;
}
