#include "files/remote_fs.hpp"

#include "gphoto/native_call.hpp"
#include "gphoto/native_handles.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

namespace gpcam::files {

namespace {

using gphoto::CheckNativeResult;
using gphoto::CreateFileFromDescriptor;
using gphoto::CreateHandle;
using gphoto::Error;
using gphoto::ErrorCode;
using gphoto::MakeLocalError;
using gphoto::NativeHandle;
using gphoto::ReadNativeString;
using gphoto::ScopedDeviceOperation;

bool RequireSession(const std::shared_ptr<gphoto::DeviceSession>& session, Error& error) {
  if (session) {
    return true;
  }
  error = MakeLocalError(ErrorCode::kNotInitialized, "remote path is not bound to a camera");
  return false;
}

std::string ParentPath(const std::string& path) {
  const std::size_t slash = path.rfind('/');
  if (slash == std::string::npos || slash == 0U) {
    return "/";
  }
  return path.substr(0, slash);
}

Error LocalIoError(const std::string& action, const std::filesystem::path& path) {
  return MakeLocalError(ErrorCode::kLocalIo, "failed to " + action + " '" + path.string() +
                                                 "': " + std::strerror(errno));
}

} // namespace

std::string JoinRemotePath(const std::string& folder, const std::string& name) {
  if (folder.empty() || folder == "/") {
    return "/" + name;
  }
  if (folder.back() == '/') {
    return folder + name;
  }
  return folder + "/" + name;
}

std::string FileInfo::PermissionsText() const {
  const int bits = permissions.value_or(GP_FILE_PERM_NONE);
  std::string text;
  text += (bits & GP_FILE_PERM_READ) != 0 ? 'r' : '-';
  text += (bits & GP_FILE_PERM_DELETE) != 0 ? 'w' : '-';
  return text;
}

Directory::Directory(std::shared_ptr<gphoto::DeviceSession> session, std::string path)
    : session_(std::move(session)), path_(std::move(path)) {
  if (path_.empty()) {
    path_ = "/";
  }
  while (path_.size() > 1U && path_.back() == '/') {
    path_.pop_back();
  }
}

Directory Directory::Root(std::shared_ptr<gphoto::DeviceSession> session) {
  return Directory(std::move(session), "/");
}

std::string Directory::name() const {
  if (IsRoot()) {
    return "";
  }
  return path_.substr(path_.rfind('/') + 1U);
}

Directory Directory::Parent() const {
  return Directory(session_, ParentPath(path_));
}

Directory Directory::Child(const std::string& name) const {
  return Directory(session_, JoinRemotePath(path_, name));
}

Directory Directory::Locate(const std::string& path) const {
  if (!path.empty() && path.front() == '/') {
    return Directory(session_, path);
  }
  return Directory(session_, JoinRemotePath(path_, path));
}

File Directory::FileNamed(const std::string& name) const {
  return File(session_, path_, name);
}

bool Directory::ListNames(const bool folders, std::vector<std::string>& names,
                          Error& error) const {
  names.clear();
  const gphoto::NativeApi& api = session_->api();

  NativeHandle<CameraList> list;
  if (!CreateHandle(api, list, error)) {
    return false;
  }

  const int rc = folders ? api.camera_folder_list_folders(session_->camera(), path_.c_str(),
                                                          list.get(), session_->context())
                         : api.camera_folder_list_files(session_->camera(), path_.c_str(),
                                                        list.get(), session_->context());
  if (!CheckNativeResult(api,
                         folders ? "gp_camera_folder_list_folders" : "gp_camera_folder_list_files",
                         rc, error)) {
    return false;
  }

  const int count = api.list_count(list.get());
  names.reserve(count > 0 ? static_cast<std::size_t>(count) : 0U);
  for (int index = 0; index < count; ++index) {
    std::string name;
    if (!ReadNativeString(
            api, "gp_list_get_name",
            [&](const char** out) { return api.list_get_name(list.get(), index, out); }, name,
            error)) {
      return false;
    }
    names.push_back(std::move(name));
  }
  return true;
}

bool Directory::Files(OneShotSequence<File>& files, Error& error) const {
  if (!RequireSession(session_, error)) {
    return false;
  }
  ScopedDeviceOperation operation(*session_);

  std::vector<std::string> names;
  if (!ListNames(false, names, error)) {
    return false;
  }
  std::vector<File> listed;
  listed.reserve(names.size());
  for (std::string& name : names) {
    listed.emplace_back(session_, path_, std::move(name));
  }
  files = OneShotSequence<File>(std::move(listed));
  return true;
}

bool Directory::Directories(OneShotSequence<Directory>& directories, Error& error) const {
  if (!RequireSession(session_, error)) {
    return false;
  }
  ScopedDeviceOperation operation(*session_);

  std::vector<std::string> names;
  if (!ListNames(true, names, error)) {
    return false;
  }
  std::vector<Directory> listed;
  listed.reserve(names.size());
  for (const std::string& name : names) {
    listed.push_back(Child(name));
  }
  directories = OneShotSequence<Directory>(std::move(listed));
  return true;
}

bool Directory::Exists(bool& exists, Error& error) const {
  exists = false;
  error.Clear();
  if (IsRoot()) {
    exists = true;
    return true;
  }

  OneShotSequence<Directory> siblings;
  if (!Parent().Directories(siblings, error)) {
    return false;
  }
  Directory sibling;
  while (siblings.Next(sibling)) {
    if (sibling.path() == path_) {
      exists = true;
      break;
    }
  }
  return true;
}

bool Directory::Create(Error& error) const {
  if (!RequireSession(session_, error)) {
    return false;
  }
  if (IsRoot()) {
    error = MakeLocalError(ErrorCode::kDirectoryExists, "the root folder always exists");
    return false;
  }
  ScopedDeviceOperation operation(*session_);
  const gphoto::NativeApi& api = session_->api();
  const std::string parent = ParentPath(path_);
  const std::string folder_name = name();
  return CheckNativeResult(api, "gp_camera_folder_make_dir",
                           api.camera_folder_make_dir(session_->camera(), parent.c_str(),
                                                      folder_name.c_str(), session_->context()),
                           error);
}

bool Directory::Remove(Error& error) const {
  if (!RequireSession(session_, error)) {
    return false;
  }
  if (IsRoot()) {
    error = MakeLocalError(ErrorCode::kInvalidPath, "the root folder cannot be removed");
    return false;
  }
  ScopedDeviceOperation operation(*session_);
  const gphoto::NativeApi& api = session_->api();
  const std::string parent = ParentPath(path_);
  const std::string folder_name = name();
  return CheckNativeResult(api, "gp_camera_folder_remove_dir",
                           api.camera_folder_remove_dir(session_->camera(), parent.c_str(),
                                                        folder_name.c_str(), session_->context()),
                           error);
}

bool Directory::Upload(const std::filesystem::path& local_path, Error& error) const {
  if (!RequireSession(session_, error)) {
    return false;
  }
  const int fd = ::open(local_path.c_str(), O_RDONLY);
  if (fd < 0) {
    error = LocalIoError("open", local_path);
    return false;
  }

  ScopedDeviceOperation operation(*session_);
  const gphoto::NativeApi& api = session_->api();

  // On success the CameraFile owns the descriptor and closes it when freed.
  NativeHandle<CameraFile> file;
  if (!CreateFileFromDescriptor(api, fd, file, error)) {
    (void)::close(fd);
    return false;
  }

  const std::string file_name = local_path.filename().string();
  return CheckNativeResult(api, "gp_camera_folder_put_file",
                           api.camera_folder_put_file(session_->camera(), path_.c_str(),
                                                      file_name.c_str(), GP_FILE_TYPE_NORMAL,
                                                      file.get(), session_->context()),
                           error);
}

bool Directory::SupportedOperations(std::vector<std::string>& operations, Error& error) const {
  operations.clear();
  if (!RequireSession(session_, error)) {
    return false;
  }
  CameraAbilities abilities{};
  if (!session_->Abilities(abilities, error)) {
    return false;
  }
  operations = FolderOperationNames(abilities.folder_operations);
  return true;
}

File::File(std::shared_ptr<gphoto::DeviceSession> session, std::string folder, std::string name)
    : session_(std::move(session)), folder_(std::move(folder)), name_(std::move(name)) {
  if (folder_.empty()) {
    folder_ = "/";
  }
}

std::string File::path() const {
  return JoinRemotePath(folder_, name_);
}

bool File::FetchInfo(FileInfo& info, Error& error) const {
  info = FileInfo{};
  if (!RequireSession(session_, error)) {
    return false;
  }
  ScopedDeviceOperation operation(*session_);
  const gphoto::NativeApi& api = session_->api();

  CameraFileInfo native{};
  Error native_error;
  if (!CheckNativeResult(api, "gp_camera_file_get_info",
                         api.camera_file_get_info(session_->camera(), folder_.c_str(),
                                                  name_.c_str(), &native, session_->context()),
                         native_error)) {
    error = Error{
        .code = ErrorCode::kFileNotFound,
        .native_code = native_error.native_code,
        .message = "file info unavailable for '" + path() +
                   "', are you sure the file exists on the device? (" + native_error.message +
                   ")",
    };
    return false;
  }

  const CameraFileInfoFile& details = native.file;
  if ((details.fields & GP_FILE_INFO_SIZE) != 0) {
    info.size = static_cast<std::uint64_t>(details.size);
  }
  if ((details.fields & GP_FILE_INFO_TYPE) != 0) {
    info.mime_type = std::string(details.type);
  }
  if ((details.fields & GP_FILE_INFO_WIDTH) != 0) {
    info.width = details.width;
  }
  if ((details.fields & GP_FILE_INFO_HEIGHT) != 0) {
    info.height = details.height;
  }
  if ((details.fields & GP_FILE_INFO_PERMISSIONS) != 0) {
    info.permissions = static_cast<int>(details.permissions);
  }
  if ((details.fields & GP_FILE_INFO_MTIME) != 0) {
    info.modified = details.mtime;
  }
  return true;
}

bool File::CheckTypeSupported(const FileType type, Error& error) const {
  if (RequiredFileOperation(type) == GP_FILE_OPERATION_NONE) {
    return true;
  }
  CameraAbilities abilities{};
  if (!session_->Abilities(abilities, error)) {
    return false;
  }
  if (IsFileTypeSupported(type, abilities.file_operations)) {
    return true;
  }
  error = MakeLocalError(ErrorCode::kUnsupportedFileType,
                         "camera does not support '" + std::string(ToString(type)) +
                             "' transfers");
  return false;
}

bool File::Save(const std::filesystem::path& target_path, const FileType type,
                Error& error) const {
  if (!RequireSession(session_, error) || !CheckTypeSupported(type, error)) {
    return false;
  }
  const int fd = ::open(target_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    error = LocalIoError("create", target_path);
    return false;
  }

  ScopedDeviceOperation operation(*session_);
  const gphoto::NativeApi& api = session_->api();

  // A failed transfer must not leave an empty or partial target behind.
  const auto discard_target = [&target_path]() {
    std::error_code ec;
    std::filesystem::remove(target_path, ec);
  };

  NativeHandle<CameraFile> file;
  if (!CreateFileFromDescriptor(api, fd, file, error)) {
    (void)::close(fd);
    discard_target();
    return false;
  }
  if (!CheckNativeResult(api, "gp_camera_file_get",
                         api.camera_file_get(session_->camera(), folder_.c_str(), name_.c_str(),
                                             ToNativeFileType(type), file.get(),
                                             session_->context()),
                         error)) {
    discard_target();
    return false;
  }
  return true;
}

bool File::GetData(const FileType type, std::vector<std::uint8_t>& data, Error& error) const {
  data.clear();
  if (!RequireSession(session_, error) || !CheckTypeSupported(type, error)) {
    return false;
  }
  ScopedDeviceOperation operation(*session_);
  const gphoto::NativeApi& api = session_->api();

  NativeHandle<CameraFile> file;
  if (!CreateHandle(api, file, error)) {
    return false;
  }
  if (!CheckNativeResult(api, "gp_camera_file_get",
                         api.camera_file_get(session_->camera(), folder_.c_str(), name_.c_str(),
                                             ToNativeFileType(type), file.get(),
                                             session_->context()),
                         error)) {
    return false;
  }

  const char* bytes = nullptr;
  unsigned long size = 0;
  if (!CheckNativeResult(api, "gp_file_get_data_and_size",
                         api.file_get_data_and_size(file.get(), &bytes, &size), error)) {
    return false;
  }
  if (bytes != nullptr && size > 0U) {
    const auto* begin = reinterpret_cast<const std::uint8_t*>(bytes);
    data.assign(begin, begin + size);
  }
  return true;
}

bool File::ReadChunks(const std::size_t chunk_size, const FileType type, const ChunkSink& sink,
                      Error& error) const {
  if (!RequireSession(session_, error)) {
    return false;
  }
  if (chunk_size == 0U || !sink) {
    error = MakeLocalError(ErrorCode::kInvalidValue,
                           "chunked reads need a positive chunk size and a sink");
    return false;
  }
  if (!CheckTypeSupported(type, error)) {
    return false;
  }

  FileInfo info;
  if (!FetchInfo(info, error)) {
    return false;
  }
  if (!info.size.has_value()) {
    error = MakeLocalError(ErrorCode::kInvalidValue,
                           "driver reported no size for '" + path() + "'");
    return false;
  }

  ScopedDeviceOperation operation(*session_);
  const gphoto::NativeApi& api = session_->api();

  const std::uint64_t total = info.size.value();
  std::vector<char> buffer(chunk_size);
  std::uint64_t offset = 0;
  while (offset < total) {
    std::uint64_t size = std::min<std::uint64_t>(chunk_size, total - offset);
    if (!CheckNativeResult(api, "gp_camera_file_read",
                           api.camera_file_read(session_->camera(), folder_.c_str(),
                                                name_.c_str(), ToNativeFileType(type), offset,
                                                buffer.data(), &size, session_->context()),
                           error)) {
      return false;
    }
    if (size == 0U) {
      error = MakeLocalError(ErrorCode::kCorruptedData,
                             "device returned no data at offset " + std::to_string(offset) +
                                 " of '" + path() + "'");
      return false;
    }
    sink(reinterpret_cast<const std::uint8_t*>(buffer.data()), static_cast<std::size_t>(size));
    offset += size;
  }
  return true;
}

bool File::Remove(Error& error) const {
  if (!RequireSession(session_, error)) {
    return false;
  }
  ScopedDeviceOperation operation(*session_);
  const gphoto::NativeApi& api = session_->api();
  return CheckNativeResult(api, "gp_camera_file_delete",
                           api.camera_file_delete(session_->camera(), folder_.c_str(),
                                                  name_.c_str(), session_->context()),
                           error);
}

bool File::SupportedOperations(std::vector<std::string>& operations, Error& error) const {
  operations.clear();
  if (!RequireSession(session_, error)) {
    return false;
  }
  CameraAbilities abilities{};
  if (!session_->Abilities(abilities, error)) {
    return false;
  }
  operations = FileOperationNames(abilities.file_operations);
  return true;
}

} // namespace gpcam::files
