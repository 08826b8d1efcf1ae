#pragma once

#include "files/file_types.hpp"
#include "files/one_shot_sequence.hpp"
#include "gphoto/device_session.hpp"
#include "gphoto/error_mapper.hpp"

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gpcam::files {

// Immutable snapshot from one `gp_camera_file_get_info` call. Fields the
// driver did not flag as valid stay unset.
struct FileInfo {
  std::optional<std::uint64_t> size;
  std::optional<std::string> mime_type;
  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;
  std::optional<int> permissions;
  std::optional<std::time_t> modified;

  // "rw", "r-", "-w" or "--" from the read (1) and delete (2) bits.
  std::string PermissionsText() const;
};

// Called once per chunk with the bytes read at that offset.
using ChunkSink = std::function<void(const std::uint8_t* data, std::size_t size)>;

class File;

// Lazy reference to a folder on the device. Nothing is read until one of the
// operations below is called; each operation releases the device connection
// when it returns.
class Directory {
public:
  Directory() = default;
  Directory(std::shared_ptr<gphoto::DeviceSession> session, std::string path);

  static Directory Root(std::shared_ptr<gphoto::DeviceSession> session);

  // Absolute, without trailing slash except for the root ("/").
  const std::string& path() const {
    return path_;
  }

  // Last path component; empty for the root.
  std::string name() const;

  bool IsRoot() const {
    return path_ == "/";
  }

  Directory Parent() const;
  Directory Child(const std::string& name) const;

  // Another folder on the same device; relative paths resolve against this one.
  Directory Locate(const std::string& path) const;

  File FileNamed(const std::string& name) const;

  bool Files(OneShotSequence<File>& files, gphoto::Error& error) const;
  bool Directories(OneShotSequence<Directory>& directories, gphoto::Error& error) const;

  // The root always exists; any other folder exists when its parent lists it.
  bool Exists(bool& exists, gphoto::Error& error) const;

  bool Create(gphoto::Error& error) const;
  bool Remove(gphoto::Error& error) const;

  // Copies a local file into this folder under its own file name.
  bool Upload(const std::filesystem::path& local_path, gphoto::Error& error) const;

  bool SupportedOperations(std::vector<std::string>& operations, gphoto::Error& error) const;

  bool operator==(const Directory& other) const {
    return path_ == other.path_ && session_ == other.session_;
  }

private:
  bool ListNames(bool folders, std::vector<std::string>& names, gphoto::Error& error) const;

  std::shared_ptr<gphoto::DeviceSession> session_;
  std::string path_ = "/";
};

// Lazy reference to a file on the device.
class File {
public:
  File() = default;
  File(std::shared_ptr<gphoto::DeviceSession> session, std::string folder, std::string name);

  const std::string& folder() const {
    return folder_;
  }
  const std::string& name() const {
    return name_;
  }
  std::string path() const;

  Directory Parent() const {
    return Directory(session_, folder_);
  }

  // A native failure is reported as `kFileNotFound` with the native code kept.
  bool FetchInfo(FileInfo& info, gphoto::Error& error) const;

  // Streams the file into `target_path` (created or truncated).
  bool Save(const std::filesystem::path& target_path, FileType type, gphoto::Error& error) const;

  bool GetData(FileType type, std::vector<std::uint8_t>& data, gphoto::Error& error) const;

  // Reads `chunk_size` bytes per native call until the size reported by
  // `FetchInfo` has been delivered.
  bool ReadChunks(std::size_t chunk_size, FileType type, const ChunkSink& sink,
                  gphoto::Error& error) const;

  bool Remove(gphoto::Error& error) const;

  bool SupportedOperations(std::vector<std::string>& operations, gphoto::Error& error) const;

  bool operator==(const File& other) const {
    return folder_ == other.folder_ && name_ == other.name_ && session_ == other.session_;
  }

private:
  // Rejects `type` before any transfer when the driver does not advertise it.
  bool CheckTypeSupported(FileType type, gphoto::Error& error) const;

  std::shared_ptr<gphoto::DeviceSession> session_;
  std::string folder_ = "/";
  std::string name_;
};

// Joins a folder path and one component without doubling the separator.
std::string JoinRemotePath(const std::string& folder, const std::string& name);

} // namespace gpcam::files
