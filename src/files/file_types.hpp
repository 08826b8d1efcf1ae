#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <gphoto2/gphoto2-camera.h>
#include <gphoto2/gphoto2-file.h>

namespace gpcam::files {

// Views a driver can produce for one remote file.
enum class FileType {
  kNormal = 0,
  kPreview,
  kRaw,
  kAudio,
  kExif,
  kMetadata,
};

std::string_view ToString(FileType type);

// Accepts the names produced by `ToString` ("normal", "preview", ...).
bool ParseFileType(std::string_view raw, FileType& type);

CameraFileType ToNativeFileType(FileType type);

// Advertised file operation a transfer of `type` depends on, or
// `GP_FILE_OPERATION_NONE` for types every driver serves.
CameraFileOperation RequiredFileOperation(FileType type);

bool IsFileTypeSupported(FileType type, int file_operations);

// Stable names of the bits set in an abilities bitfield.
std::vector<std::string> FileOperationNames(int file_operations);
std::vector<std::string> FolderOperationNames(int folder_operations);

} // namespace gpcam::files
