#pragma once

#include <string>
#include <string_view>

namespace gpcam::gphoto {

// Closed classification for every failure the binding reports.
//
// The first block mirrors libgphoto2 result codes one-to-one; `kGeneric`
// catches every other negative code. The second block is raised locally,
// before any native call is attempted.
enum class ErrorCode {
  kNone = 0,

  kCorruptedData,
  kFileExists,
  kFileNotFound,
  kDirectoryNotFound,
  kDirectoryExists,
  kNoSpace,
  kUnsupportedDevice,
  kCameraBusy,
  kInvalidPath,
  kOperationCancelled,
  kCameraError,
  kOsFailure,
  kGeneric,

  kReadOnly,
  kInvalidValue,
  kUnsupportedFileType,
  kNotInitialized,
  kCaptureInProgress,
  kUnknownHandleType,
  kLocalIo,
};

struct Error {
  ErrorCode code = ErrorCode::kNone;
  // libgphoto2 result code; 0 for locally raised errors.
  int native_code = 0;
  std::string message;

  bool ok() const {
    return code == ErrorCode::kNone;
  }

  void Clear() {
    code = ErrorCode::kNone;
    native_code = 0;
    message.clear();
  }
};

std::string_view ToStableErrorCode(ErrorCode code);

// True for the IO-on-the-camera family (corrupted data, file/directory exists
// or missing, no space).
bool IsCameraIoError(ErrorCode code);

// True for codes that never originate in libgphoto2.
bool IsLocalError(ErrorCode code);

// Translates a negative libgphoto2 result code. `resolved_message` is the text
// libgphoto2 reports for the code (`gp_result_as_string`); it becomes the
// message of `kGeneric` errors and is ignored for codes with a fixed message.
Error MapNativeError(int native_code, std::string_view resolved_message);

Error MakeLocalError(ErrorCode code, std::string message);

// Single-line rendering:
//   "<STABLE_CODE>: <message> (native <code>)"
// The native suffix is omitted for local errors.
std::string FormatError(const Error& error);

} // namespace gpcam::gphoto
