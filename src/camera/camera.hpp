#pragma once

#include "camera/camera_options.hpp"
#include "camera/event_wait.hpp"
#include "config/widget_tree.hpp"
#include "core/logging/logger.hpp"
#include "files/remote_fs.hpp"
#include "gphoto/device_session.hpp"
#include "gphoto/error_mapper.hpp"
#include "gphoto/gphoto2_library.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gpcam::camera {

enum class CameraState {
  kUninitialized = 0,
  kInitialized,
  kCapturing,
};

const char* ToString(CameraState state);

struct UsbInformation {
  int vendor = 0;
  int product = 0;
  int device_class = 0;
  int subclass = 0;
  int protocol = 0;
};

// One entry of `gp_camera_get_storageinfo`. Fields the driver did not flag as
// valid stay unset.
struct StorageInfo {
  std::optional<std::string> base_directory;
  std::optional<std::string> label;
  std::optional<std::string> description;
  // fixed_rom, removable_rom, fixed_ram, removable_ram or unknown.
  std::optional<std::string> type;
  // read-write, read-only or read-delete.
  std::optional<std::string> access;
  std::optional<std::uint64_t> capacity_kb;
  std::optional<std::uint64_t> free_kb;
  std::optional<std::uint64_t> free_images;
};

std::string_view StorageTypeName(CameraStorageType type);
std::optional<std::string_view> StorageAccessName(CameraStorageAccessType access);

// Stable names of the bits set in `CameraAbilities::operations`.
std::vector<std::string> CameraOperationNames(int operations);

struct CaptureOptions {
  // Keep the image on the memory card and return a File reference instead of
  // downloading and deleting it.
  bool to_camera_storage = false;
};

struct CaptureResult {
  // Set for storage captures.
  std::optional<files::File> file;
  // Image bytes of volatile captures.
  std::vector<std::uint8_t> data;
};

struct CaptureOutcome {
  bool ok = false;
  CaptureResult result;
  gphoto::Error error;
};

// Facade over one device.
//
// Every public operation first checks the state: an operation during a
// capture fails with `kCaptureInProgress`; an uninitialized camera is
// initialized on demand in lazy mode and reports `kNotInitialized` otherwise.
// After each operation the device connection is released so other processes
// can use the camera.
//
// Not safe for unsynchronized concurrent use, apart from the capture state
// check. `library` must outlive the camera, and the camera must outlive
// futures returned by `CaptureAsync` and trees returned by `ReadConfig`.
class Camera final : public config::IConfigCommitter {
public:
  // Abilities already known from discovery skip the driver query.
  Camera(gphoto::Gphoto2Library& library, CameraOptions options,
         std::optional<CameraAbilities> known_abilities = std::nullopt);
  ~Camera() override;

  Camera(const Camera&) = delete;
  Camera& operator=(const Camera&) = delete;

  // Opens the device and reports the raw libgphoto2 failure (e.g.
  // `kUnsupportedDevice` when autodetection finds nothing). Idempotent.
  bool Initialize(gphoto::Error& error);

  CameraState state() const {
    return state_.load(std::memory_order_acquire);
  }

  const CameraOptions& options() const {
    return options_;
  }

  bool ReadConfig(config::ConfigTree& tree, gphoto::Error& error);

  // Convenience: read the tree, validate and set `path`, commit.
  bool SetConfigValue(std::string_view path, const config::SettableValue& value,
                      gphoto::Error& error);

  bool Capture(const CaptureOptions& options, CaptureResult& result, gphoto::Error& error);

  // Runs the capture on a worker thread. State checks happen before the
  // thread starts; a rejected call yields an already-satisfied future.
  std::future<CaptureOutcome> CaptureAsync(CaptureOptions options);

  bool WaitForEvent(const EventWaitOptions& options, EventWaitResult& result,
                    gphoto::Error& error);

  bool CapturePreview(std::vector<std::uint8_t>& image, gphoto::Error& error);

  bool CaptureVideo(std::chrono::milliseconds duration, files::File& video,
                    gphoto::Error& error);

  bool ReadStorageInfo(std::vector<StorageInfo>& storages, gphoto::Error& error);

  bool Filesystem(files::Directory& root, gphoto::Error& error);

  // Depth-first; directories start with the root.
  bool ListAllFiles(std::vector<files::File>& found, gphoto::Error& error);
  bool ListAllDirectories(std::vector<files::Directory>& found, gphoto::Error& error);

  bool ModelName(std::string& model, gphoto::Error& error);
  bool UsbInfo(UsbInformation& usb, gphoto::Error& error);
  bool SupportedOperations(std::vector<std::string>& operations, gphoto::Error& error);

  // Commit path of trees returned by `ReadConfig`: state-checked like every
  // other public operation, and the device is released afterwards.
  bool CommitConfig(CameraWidget* root, gphoto::Error& error) override;

  core::logging::Logger& logger() {
    return logger_;
  }

private:
  // Commit path of trees read inside an operation that already holds the
  // device (capture target switch, movie toggle, `SetConfigValue`).
  class DeviceCommitter final : public config::IConfigCommitter {
  public:
    explicit DeviceCommitter(Camera& camera) : camera_(camera) {}

    bool CommitConfig(CameraWidget* root, gphoto::Error& error) override {
      return camera_.CommitUnchecked(root, error);
    }

  private:
    Camera& camera_;
  };

  // State check run at the start of every public operation.
  bool EnsureReady(gphoto::Error& error);

  // Moves kInitialized -> kCapturing or explains why not.
  bool BeginCapture(gphoto::Error& error);
  void EndCapture();

  bool CommitUnchecked(CameraWidget* root, gphoto::Error& error);
  // Items of `tree` commit through `committer`.
  bool ReadConfigUnchecked(config::IConfigCommitter* committer, config::ConfigTree& tree,
                           gphoto::Error& error);
  bool RunCapture(const CaptureOptions& options, CaptureResult& result, gphoto::Error& error);
  bool SelectCaptureTarget(const std::string& target, gphoto::Error& error);
  bool WaitForEventUnchecked(const EventWaitOptions& options, EventWaitResult& result,
                             gphoto::Error& error);
  bool CollectDirectories(const files::Directory& directory,
                          std::vector<files::Directory>& found, gphoto::Error& error);

  bool OpenSession(gphoto::Error& error);
  bool SelectPort(::Camera* device, gphoto::Error& error);

  friend class VideoCapture;

  gphoto::Gphoto2Library& library_;
  CameraOptions options_;
  core::logging::Logger logger_;
  std::optional<CameraAbilities> known_abilities_;
  DeviceCommitter device_committer_{*this};

  std::shared_ptr<gphoto::DeviceSession> session_;
  std::atomic<CameraState> state_{CameraState::kUninitialized};
  std::optional<gphoto::Error> eager_init_error_;
};

} // namespace gpcam::camera
