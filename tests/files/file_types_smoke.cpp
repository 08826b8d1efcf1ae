#include "../common/assertions.hpp"
#include "files/file_types.hpp"
#include "files/one_shot_sequence.hpp"

#include <string>
#include <vector>

int main() {
  using gpcam::files::FileOperationNames;
  using gpcam::files::FileType;
  using gpcam::files::FolderOperationNames;
  using gpcam::files::IsFileTypeSupported;
  using gpcam::files::OneShotSequence;
  using gpcam::files::ParseFileType;
  using gpcam::files::RequiredFileOperation;
  using gpcam::files::ToNativeFileType;
  using gpcam::files::ToString;
  using gpcam::tests::common::Fail;

  for (const FileType type : {FileType::kNormal, FileType::kPreview, FileType::kRaw,
                              FileType::kAudio, FileType::kExif, FileType::kMetadata}) {
    FileType parsed = FileType::kNormal;
    if (!ParseFileType(ToString(type), parsed) || parsed != type) {
      Fail("file type names should parse back: " + std::string(ToString(type)));
    }
  }
  FileType ignored = FileType::kNormal;
  if (ParseFileType("thumbnail", ignored)) {
    Fail("unknown file type names should be rejected");
  }
  if (ToNativeFileType(FileType::kRaw) != GP_FILE_TYPE_RAW ||
      ToNativeFileType(FileType::kExif) != GP_FILE_TYPE_EXIF) {
    Fail("unexpected native file type mapping");
  }

  if (RequiredFileOperation(FileType::kNormal) != GP_FILE_OPERATION_NONE ||
      RequiredFileOperation(FileType::kMetadata) != GP_FILE_OPERATION_NONE) {
    Fail("normal and metadata transfers need no advertised operation");
  }
  const int preview_only = GP_FILE_OPERATION_PREVIEW;
  if (!IsFileTypeSupported(FileType::kPreview, preview_only) ||
      !IsFileTypeSupported(FileType::kNormal, 0) ||
      IsFileTypeSupported(FileType::kRaw, preview_only)) {
    Fail("file type support should follow the abilities bitfield");
  }

  const std::vector<std::string> file_ops =
      FileOperationNames(GP_FILE_OPERATION_DELETE | GP_FILE_OPERATION_EXIF);
  if (file_ops != std::vector<std::string>{"remove", "extract_exif"}) {
    Fail("unexpected file operation names");
  }
  const std::vector<std::string> folder_ops =
      FolderOperationNames(GP_FOLDER_OPERATION_MAKE_DIR | GP_FOLDER_OPERATION_PUT_FILE);
  if (folder_ops != std::vector<std::string>{"create", "upload"}) {
    Fail("unexpected folder operation names");
  }

  {
    OneShotSequence<int> sequence(std::vector<int>{1, 2, 3});
    int value = 0;
    if (!sequence.Next(value) || value != 1 || sequence.remaining() != 2U) {
      Fail("first element should come out first");
    }
    const std::vector<int> rest = sequence.Drain();
    if (rest != std::vector<int>{2, 3} || !sequence.exhausted()) {
      Fail("drain should hand out the rest exactly once");
    }
    if (sequence.Next(value) || !sequence.Drain().empty()) {
      Fail("an exhausted sequence stays empty");
    }
  }

  return 0;
}
