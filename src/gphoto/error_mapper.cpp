#include "gphoto/error_mapper.hpp"

#include <string>
#include <utility>

#include <gphoto2/gphoto2-port-result.h>
#include <gphoto2/gphoto2-result.h>

namespace gpcam::gphoto {

namespace {

struct FixedMapping {
  ErrorCode code = ErrorCode::kGeneric;
  const char* message = nullptr;
};

bool LookupFixedMapping(const int native_code, FixedMapping& mapping) {
  switch (native_code) {
  case GP_ERROR_CORRUPTED_DATA:
    mapping = {ErrorCode::kCorruptedData, "Corrupted data received."};
    return true;
  case GP_ERROR_FILE_EXISTS:
    mapping = {ErrorCode::kFileExists, "File already exists."};
    return true;
  case GP_ERROR_FILE_NOT_FOUND:
    mapping = {ErrorCode::kFileNotFound, "File not found."};
    return true;
  case GP_ERROR_DIRECTORY_NOT_FOUND:
    mapping = {ErrorCode::kDirectoryNotFound, "Directory not found."};
    return true;
  case GP_ERROR_DIRECTORY_EXISTS:
    mapping = {ErrorCode::kDirectoryExists, "Directory already exists."};
    return true;
  case GP_ERROR_NO_SPACE:
    mapping = {ErrorCode::kNoSpace, "Not enough space."};
    return true;
  case GP_ERROR_MODEL_NOT_FOUND:
    mapping = {ErrorCode::kUnsupportedDevice, "Specified camera model was not found."};
    return true;
  case GP_ERROR_CAMERA_BUSY:
    mapping = {ErrorCode::kCameraBusy, "Camera I/O or a command is in progress."};
    return true;
  case GP_ERROR_PATH_NOT_ABSOLUTE:
    mapping = {ErrorCode::kInvalidPath, "Specified path is not absolute."};
    return true;
  case GP_ERROR_CANCEL:
    mapping = {ErrorCode::kOperationCancelled, "Operation was cancelled."};
    return true;
  case GP_ERROR_CAMERA_ERROR:
    mapping = {ErrorCode::kCameraError, "Unspecified camera error."};
    return true;
  case GP_ERROR_OS_FAILURE:
    mapping = {ErrorCode::kOsFailure, "Unspecified failure of the operating system."};
    return true;
  default:
    return false;
  }
}

} // namespace

std::string_view ToStableErrorCode(const ErrorCode code) {
  switch (code) {
  case ErrorCode::kNone:
    return "GP_OK";
  case ErrorCode::kCorruptedData:
    return "GP_CORRUPTED_DATA";
  case ErrorCode::kFileExists:
    return "GP_FILE_EXISTS";
  case ErrorCode::kFileNotFound:
    return "GP_FILE_NOT_FOUND";
  case ErrorCode::kDirectoryNotFound:
    return "GP_DIRECTORY_NOT_FOUND";
  case ErrorCode::kDirectoryExists:
    return "GP_DIRECTORY_EXISTS";
  case ErrorCode::kNoSpace:
    return "GP_NO_SPACE";
  case ErrorCode::kUnsupportedDevice:
    return "GP_UNSUPPORTED_DEVICE";
  case ErrorCode::kCameraBusy:
    return "GP_CAMERA_BUSY";
  case ErrorCode::kInvalidPath:
    return "GP_INVALID_PATH";
  case ErrorCode::kOperationCancelled:
    return "GP_OPERATION_CANCELLED";
  case ErrorCode::kCameraError:
    return "GP_CAMERA_ERROR";
  case ErrorCode::kOsFailure:
    return "GP_OS_FAILURE";
  case ErrorCode::kReadOnly:
    return "GPCAM_READ_ONLY";
  case ErrorCode::kInvalidValue:
    return "GPCAM_INVALID_VALUE";
  case ErrorCode::kUnsupportedFileType:
    return "GPCAM_UNSUPPORTED_FILE_TYPE";
  case ErrorCode::kNotInitialized:
    return "GPCAM_NOT_INITIALIZED";
  case ErrorCode::kCaptureInProgress:
    return "GPCAM_CAPTURE_IN_PROGRESS";
  case ErrorCode::kUnknownHandleType:
    return "GPCAM_UNKNOWN_HANDLE_TYPE";
  case ErrorCode::kLocalIo:
    return "GPCAM_LOCAL_IO";
  case ErrorCode::kGeneric:
  default:
    return "GP_ERROR";
  }
}

bool IsCameraIoError(const ErrorCode code) {
  switch (code) {
  case ErrorCode::kCorruptedData:
  case ErrorCode::kFileExists:
  case ErrorCode::kFileNotFound:
  case ErrorCode::kDirectoryNotFound:
  case ErrorCode::kDirectoryExists:
  case ErrorCode::kNoSpace:
    return true;
  default:
    return false;
  }
}

bool IsLocalError(const ErrorCode code) {
  switch (code) {
  case ErrorCode::kReadOnly:
  case ErrorCode::kInvalidValue:
  case ErrorCode::kUnsupportedFileType:
  case ErrorCode::kNotInitialized:
  case ErrorCode::kCaptureInProgress:
  case ErrorCode::kUnknownHandleType:
  case ErrorCode::kLocalIo:
    return true;
  default:
    return false;
  }
}

Error MapNativeError(const int native_code, std::string_view resolved_message) {
  Error mapped;
  mapped.native_code = native_code;

  FixedMapping fixed;
  if (LookupFixedMapping(native_code, fixed)) {
    mapped.code = fixed.code;
    mapped.message = fixed.message;
    return mapped;
  }

  mapped.code = ErrorCode::kGeneric;
  mapped.message = resolved_message.empty()
                       ? "libgphoto2 error " + std::to_string(native_code)
                       : std::string(resolved_message);
  return mapped;
}

Error MakeLocalError(const ErrorCode code, std::string message) {
  Error error;
  error.code = code;
  error.message = std::move(message);
  return error;
}

std::string FormatError(const Error& error) {
  std::string formatted = std::string(ToStableErrorCode(error.code)) + ": " + error.message;
  if (!IsLocalError(error.code) && error.native_code != 0) {
    formatted += " (native " + std::to_string(error.native_code) + ")";
  }
  return formatted;
}

} // namespace gpcam::gphoto
