#pragma once

namespace gpcam::core::errors {

// Process-exit contract for `gpcam`.
//
// 0/1/2 keep their conventional meanings (success, command failure, usage).
// The 2x range classifies camera-side conditions scripts commonly branch on.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kCameraNotFound = 20,
  kCameraBusy = 21,
  kInvalidValue = 22,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace gpcam::core::errors
