#include "files/file_types.hpp"

#include <array>
#include <utility>

namespace gpcam::files {

namespace {

struct FlagName {
  int bit = 0;
  std::string_view name;
};

constexpr std::array<FlagName, 5> kFileOperationNames = {{
    {GP_FILE_OPERATION_DELETE, "remove"},
    {GP_FILE_OPERATION_PREVIEW, "extract_preview"},
    {GP_FILE_OPERATION_RAW, "extract_raw"},
    {GP_FILE_OPERATION_AUDIO, "extract_audio"},
    {GP_FILE_OPERATION_EXIF, "extract_exif"},
}};

constexpr std::array<FlagName, 4> kFolderOperationNames = {{
    {GP_FOLDER_OPERATION_REMOVE_DIR, "remove"},
    {GP_FOLDER_OPERATION_MAKE_DIR, "create"},
    {GP_FOLDER_OPERATION_DELETE_ALL, "delete_all"},
    {GP_FOLDER_OPERATION_PUT_FILE, "upload"},
}};

template <std::size_t N>
std::vector<std::string> NamesOfSetBits(const std::array<FlagName, N>& table, const int flags) {
  std::vector<std::string> names;
  for (const FlagName& entry : table) {
    if ((flags & entry.bit) != 0) {
      names.emplace_back(entry.name);
    }
  }
  return names;
}

} // namespace

std::string_view ToString(const FileType type) {
  switch (type) {
  case FileType::kNormal:
    return "normal";
  case FileType::kPreview:
    return "preview";
  case FileType::kRaw:
    return "raw";
  case FileType::kAudio:
    return "audio";
  case FileType::kExif:
    return "exif";
  case FileType::kMetadata:
    return "metadata";
  }
  return "normal";
}

bool ParseFileType(std::string_view raw, FileType& type) {
  constexpr std::array<FileType, 6> kAll = {FileType::kNormal, FileType::kPreview,
                                            FileType::kRaw,    FileType::kAudio,
                                            FileType::kExif,   FileType::kMetadata};
  for (const FileType candidate : kAll) {
    if (ToString(candidate) == raw) {
      type = candidate;
      return true;
    }
  }
  return false;
}

CameraFileType ToNativeFileType(const FileType type) {
  switch (type) {
  case FileType::kNormal:
    return GP_FILE_TYPE_NORMAL;
  case FileType::kPreview:
    return GP_FILE_TYPE_PREVIEW;
  case FileType::kRaw:
    return GP_FILE_TYPE_RAW;
  case FileType::kAudio:
    return GP_FILE_TYPE_AUDIO;
  case FileType::kExif:
    return GP_FILE_TYPE_EXIF;
  case FileType::kMetadata:
    return GP_FILE_TYPE_METADATA;
  }
  return GP_FILE_TYPE_NORMAL;
}

CameraFileOperation RequiredFileOperation(const FileType type) {
  switch (type) {
  case FileType::kPreview:
    return GP_FILE_OPERATION_PREVIEW;
  case FileType::kRaw:
    return GP_FILE_OPERATION_RAW;
  case FileType::kAudio:
    return GP_FILE_OPERATION_AUDIO;
  case FileType::kExif:
    return GP_FILE_OPERATION_EXIF;
  case FileType::kNormal:
  case FileType::kMetadata:
    break;
  }
  return GP_FILE_OPERATION_NONE;
}

bool IsFileTypeSupported(const FileType type, const int file_operations) {
  const CameraFileOperation required = RequiredFileOperation(type);
  return required == GP_FILE_OPERATION_NONE || (file_operations & required) != 0;
}

std::vector<std::string> FileOperationNames(const int file_operations) {
  return NamesOfSetBits(kFileOperationNames, file_operations);
}

std::vector<std::string> FolderOperationNames(const int folder_operations) {
  return NamesOfSetBits(kFolderOperationNames, folder_operations);
}

} // namespace gpcam::files
