#include "camera/camera.hpp"

#include "camera/video_capture.hpp"
#include "gphoto/native_call.hpp"
#include "gphoto/native_handles.hpp"

#include <array>
#include <cstdlib>
#include <thread>
#include <utility>
#include <variant>

namespace gpcam::camera {

namespace {

using gphoto::CheckNativeResult;
using gphoto::Error;
using gphoto::ErrorCode;
using gphoto::MakeLocalError;
using gphoto::ScopedDeviceOperation;

constexpr std::string_view kCaptureTargetPath = "settings/capturetarget";

struct FreeDeleter {
  void operator()(CameraStorageInformation* infos) const {
    std::free(infos);
  }
};

struct OperationName {
  int bit = 0;
  std::string_view name;
};

constexpr std::array<OperationName, 6> kCameraOperationNames = {{
    {GP_OPERATION_CAPTURE_IMAGE, "capture_image"},
    {GP_OPERATION_CAPTURE_VIDEO, "capture_video"},
    {GP_OPERATION_CAPTURE_AUDIO, "capture_audio"},
    {GP_OPERATION_CAPTURE_PREVIEW, "capture_preview"},
    {GP_OPERATION_CONFIG, "update_config"},
    {GP_OPERATION_TRIGGER_CAPTURE, "trigger_capture"},
}};

} // namespace

const char* ToString(const CameraState state) {
  switch (state) {
  case CameraState::kUninitialized:
    return "uninitialized";
  case CameraState::kInitialized:
    return "initialized";
  case CameraState::kCapturing:
    return "capturing";
  }
  return "uninitialized";
}

std::string_view StorageTypeName(const CameraStorageType type) {
  switch (type) {
  case GP_STORAGEINFO_ST_FIXED_ROM:
    return "fixed_rom";
  case GP_STORAGEINFO_ST_REMOVABLE_ROM:
    return "removable_rom";
  case GP_STORAGEINFO_ST_FIXED_RAM:
    return "fixed_ram";
  case GP_STORAGEINFO_ST_REMOVABLE_RAM:
    return "removable_ram";
  case GP_STORAGEINFO_ST_UNKNOWN:
  default:
    return "unknown";
  }
}

std::optional<std::string_view> StorageAccessName(const CameraStorageAccessType access) {
  switch (access) {
  case GP_STORAGEINFO_AC_READWRITE:
    return "read-write";
  case GP_STORAGEINFO_AC_READONLY:
    return "read-only";
  case GP_STORAGEINFO_AC_READONLY_WITH_DELETE:
    return "read-delete";
  default:
    return std::nullopt;
  }
}

std::vector<std::string> CameraOperationNames(const int operations) {
  std::vector<std::string> names;
  for (const OperationName& entry : kCameraOperationNames) {
    if ((operations & entry.bit) != 0) {
      names.emplace_back(entry.name);
    }
  }
  return names;
}

Camera::Camera(gphoto::Gphoto2Library& library, CameraOptions options,
               std::optional<CameraAbilities> known_abilities)
    : library_(library), options_(std::move(options)),
      logger_(library.logger().WithComponent("camera")),
      known_abilities_(std::move(known_abilities)) {
  if (options_.port.has_value()) {
    logger_.SetSession(options_.port.value());
  }
  if (!options_.lazy) {
    Error error;
    if (!Initialize(error)) {
      logger_.Warn("eager camera initialization failed", {{"error", gphoto::FormatError(error)}});
      eager_init_error_ = error;
    }
  }
}

Camera::~Camera() = default;

bool Camera::Initialize(Error& error) {
  error.Clear();
  if (state() != CameraState::kUninitialized) {
    return true;
  }
  if (!library_.Acquire(error) || !OpenSession(error)) {
    return false;
  }
  eager_init_error_.reset();
  state_.store(CameraState::kInitialized, std::memory_order_release);
  return true;
}

bool Camera::OpenSession(Error& error) {
  const gphoto::NativeApi& api = library_.api();

  GPContext* raw_context = api.context_new();
  if (raw_context == nullptr) {
    error = MakeLocalError(ErrorCode::kNotInitialized, "gp_context_new returned no context");
    return false;
  }
  gphoto::NativeHandle<GPContext> context(&api, raw_context);

  gphoto::NativeHandle<::Camera> device;
  if (!gphoto::CreateHandle(api, device, error)) {
    return false;
  }
  if (options_.port.has_value() && !SelectPort(device.get(), error)) {
    return false;
  }

  if (!CheckNativeResult(api, "gp_camera_init", api.camera_init(device.get(), context.get()),
                         error)) {
    if (error.code == ErrorCode::kUnsupportedDevice && !options_.port.has_value()) {
      error.message = "could not find any supported devices";
    }
    return false;
  }

  session_ = std::make_shared<gphoto::DeviceSession>(api, std::move(context), std::move(device));
  if (known_abilities_.has_value()) {
    session_->SeedAbilities(known_abilities_.value());
  }
  logger_.Info("camera initialized", {{"port", options_.port.value_or("auto")}});
  return true;
}

bool Camera::SelectPort(::Camera* device, Error& error) {
  const gphoto::NativeApi& api = library_.api();

  UsbAddress address;
  std::string parse_error;
  if (!ParseUsbPort(options_.port.value(), address, parse_error)) {
    error = MakeLocalError(ErrorCode::kInvalidValue, parse_error);
    return false;
  }
  const std::string port = FormatUsbPort(address);

  gphoto::NativeHandle<GPPortInfoList> ports;
  if (!gphoto::CreateHandle(api, ports, error) ||
      !CheckNativeResult(api, "gp_port_info_list_load", api.port_info_list_load(ports.get()),
                         error)) {
    return false;
  }

  // The lookup result is an index when non-negative and a status otherwise.
  const int index = api.port_info_list_lookup_path(ports.get(), port.c_str());
  if (index < GP_OK) {
    error = gphoto::TranslateNativeResult(api, index);
    logger_.Warn("port lookup failed", {{"port", port}, {"error", gphoto::FormatError(error)}});
    return false;
  }

  GPPortInfo info = nullptr;
  return CheckNativeResult(api, "gp_port_info_list_get_info",
                           api.port_info_list_get_info(ports.get(), index, &info), error) &&
         CheckNativeResult(api, "gp_camera_set_port_info", api.camera_set_port_info(device, info),
                           error);
}

bool Camera::EnsureReady(Error& error) {
  error.Clear();
  const CameraState current = state();
  if (current == CameraState::kCapturing) {
    error = MakeLocalError(ErrorCode::kCaptureInProgress, "a capture is running on this camera");
    return false;
  }
  if (current == CameraState::kInitialized) {
    return true;
  }

  if (eager_init_error_.has_value()) {
    error = Error{
        .code = ErrorCode::kNotInitialized,
        .native_code = eager_init_error_->native_code,
        .message = "camera failed to initialize: " + gphoto::FormatError(*eager_init_error_),
    };
    return false;
  }

  Error init_error;
  if (!Initialize(init_error)) {
    error = Error{
        .code = ErrorCode::kNotInitialized,
        .native_code = init_error.native_code,
        .message = "camera initialization failed: " + gphoto::FormatError(init_error),
    };
    return false;
  }
  return true;
}

bool Camera::BeginCapture(Error& error) {
  if (!EnsureReady(error)) {
    return false;
  }
  CameraState expected = CameraState::kInitialized;
  if (!state_.compare_exchange_strong(expected, CameraState::kCapturing,
                                      std::memory_order_acq_rel)) {
    error = MakeLocalError(ErrorCode::kCaptureInProgress, "a capture is running on this camera");
    return false;
  }
  return true;
}

void Camera::EndCapture() {
  state_.store(CameraState::kInitialized, std::memory_order_release);
}

bool Camera::CommitConfig(CameraWidget* root, Error& error) {
  if (!EnsureReady(error)) {
    return false;
  }
  ScopedDeviceOperation operation(*session_);
  return CommitUnchecked(root, error);
}

bool Camera::CommitUnchecked(CameraWidget* root, Error& error) {
  if (!session_) {
    error = MakeLocalError(ErrorCode::kNotInitialized, "camera is not initialized");
    return false;
  }
  const gphoto::NativeApi& api = session_->api();
  return CheckNativeResult(api, "gp_camera_set_config",
                           api.camera_set_config(session_->camera(), root, session_->context()),
                           error);
}

bool Camera::ReadConfigUnchecked(config::IConfigCommitter* committer, config::ConfigTree& tree,
                                 Error& error) {
  const gphoto::NativeApi& api = session_->api();
  CameraWidget* root = nullptr;
  if (!CheckNativeResult(api, "gp_camera_get_config",
                         api.camera_get_config(session_->camera(), &root, session_->context()),
                         error)) {
    return false;
  }
  return config::BuildConfigTree(api, root, committer, tree, error);
}

bool Camera::ReadConfig(config::ConfigTree& tree, Error& error) {
  if (!EnsureReady(error)) {
    return false;
  }
  ScopedDeviceOperation operation(*session_);
  return ReadConfigUnchecked(this, tree, error);
}

bool Camera::SetConfigValue(std::string_view path, const config::SettableValue& value,
                            Error& error) {
  if (!EnsureReady(error)) {
    return false;
  }
  ScopedDeviceOperation operation(*session_);

  config::ConfigTree tree;
  if (!ReadConfigUnchecked(&device_committer_, tree, error)) {
    return false;
  }
  config::ConfigItem* item = tree.FindItem(path);
  if (item == nullptr) {
    error = MakeLocalError(ErrorCode::kInvalidValue, "no setting named '" + std::string(path) + "'");
    return false;
  }
  if (!item->Set(value, error)) {
    return false;
  }
  logger_.Info("setting changed", {{"path", path}, {"value", config::FormatWidgetValue(item->value())}});
  return true;
}

bool Camera::SelectCaptureTarget(const std::string& target, Error& error) {
  config::ConfigTree tree;
  if (!ReadConfigUnchecked(&device_committer_, tree, error)) {
    return false;
  }
  config::ConfigItem* item = tree.FindItem(kCaptureTargetPath);
  if (item == nullptr) {
    logger_.Debug("camera has no capture target setting", {{"wanted", target}});
    return true;
  }

  const std::string current = config::FormatWidgetValue(item->value());
  if (current == target) {
    return true;
  }
  if (!item->Set(config::SettableValue(target), error)) {
    return false;
  }
  logger_.Debug("capture target changed", {{"from", current}, {"to", target}});
  return true;
}

bool Camera::WaitForEventUnchecked(const EventWaitOptions& options, EventWaitResult& result,
                                   Error& error) {
  return WaitForCameraEvent(session_->api(), session_->camera(), session_->context(), options,
                            logger_, result, error);
}

bool Camera::WaitForEvent(const EventWaitOptions& options, EventWaitResult& result,
                          Error& error) {
  if (!EnsureReady(error)) {
    return false;
  }
  ScopedDeviceOperation operation(*session_);
  return WaitForEventUnchecked(options, result, error);
}

bool Camera::RunCapture(const CaptureOptions& options, CaptureResult& result, Error& error) {
  result = CaptureResult{};
  const gphoto::NativeApi& api = session_->api();

  const std::string& target =
      options.to_camera_storage ? options_.storage_target : options_.volatile_target;
  if (!SelectCaptureTarget(target, error)) {
    return false;
  }

  if (!CheckNativeResult(api, "gp_camera_trigger_capture",
                         api.camera_trigger_capture(session_->camera(), session_->context()),
                         error)) {
    return false;
  }

  EventWaitResult waited;
  const EventWaitOptions wait{
      .until = GP_EVENT_FILE_ADDED,
      .poll_timeout = options_.event_timeout,
      .max_duration = options_.capture_timeout,
  };
  if (!WaitForEventUnchecked(wait, waited, error)) {
    return false;
  }

  files::File captured(session_, waited.folder, waited.name);
  if (options.to_camera_storage) {
    logger_.Info("file written to storage", {{"path", captured.path()}});
    result.file = std::move(captured);
    return true;
  }

  if (!captured.GetData(files::FileType::kNormal, result.data, error)) {
    return false;
  }

  Error remove_error;
  if (!captured.Remove(remove_error)) {
    // Some drivers drop the RAM copy on download.
    if (!gphoto::IsCameraIoError(remove_error.code)) {
      error = remove_error;
      return false;
    }
    logger_.Debug("volatile capture already gone",
                  {{"path", captured.path()}, {"detail", gphoto::FormatError(remove_error)}});
  }
  return true;
}

bool Camera::Capture(const CaptureOptions& options, CaptureResult& result, Error& error) {
  if (!BeginCapture(error)) {
    return false;
  }
  bool captured = false;
  {
    ScopedDeviceOperation operation(*session_);
    captured = RunCapture(options, result, error);
  }
  EndCapture();
  return captured;
}

std::future<CaptureOutcome> Camera::CaptureAsync(CaptureOptions options) {
  Error error;
  if (!BeginCapture(error)) {
    std::promise<CaptureOutcome> rejected;
    rejected.set_value(CaptureOutcome{.ok = false, .error = error});
    return rejected.get_future();
  }

  return std::async(std::launch::async, [this, options]() {
    CaptureOutcome outcome;
    {
      ScopedDeviceOperation operation(*session_);
      outcome.ok = RunCapture(options, outcome.result, outcome.error);
    }
    EndCapture();
    return outcome;
  });
}

bool Camera::CapturePreview(std::vector<std::uint8_t>& image, Error& error) {
  image.clear();
  if (!EnsureReady(error)) {
    return false;
  }
  ScopedDeviceOperation operation(*session_);
  const gphoto::NativeApi& api = session_->api();

  gphoto::NativeHandle<CameraFile> file;
  if (!gphoto::CreateHandle(api, file, error) ||
      !CheckNativeResult(api, "gp_camera_capture_preview",
                         api.camera_capture_preview(session_->camera(), file.get(),
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
    image.assign(begin, begin + size);
  }
  return true;
}

bool Camera::CaptureVideo(const std::chrono::milliseconds duration, files::File& video,
                          Error& error) {
  VideoCapture recording(*this);
  if (!recording.Start(error)) {
    return false;
  }
  std::this_thread::sleep_for(duration);
  return recording.Stop(video, error);
}

bool Camera::ReadStorageInfo(std::vector<StorageInfo>& storages, Error& error) {
  storages.clear();
  if (!EnsureReady(error)) {
    return false;
  }
  ScopedDeviceOperation operation(*session_);
  const gphoto::NativeApi& api = session_->api();

  CameraStorageInformation* raw_infos = nullptr;
  int count = 0;
  if (!CheckNativeResult(api, "gp_camera_get_storageinfo",
                         api.camera_get_storageinfo(session_->camera(), &raw_infos, &count,
                                                    session_->context()),
                         error)) {
    return false;
  }
  const std::unique_ptr<CameraStorageInformation, FreeDeleter> infos(raw_infos);

  for (int index = 0; index < count && infos; ++index) {
    const CameraStorageInformation& native = infos.get()[index];
    StorageInfo storage;
    if ((native.fields & GP_STORAGEINFO_BASE) != 0) {
      storage.base_directory = std::string(native.basedir);
    }
    if ((native.fields & GP_STORAGEINFO_LABEL) != 0) {
      storage.label = std::string(native.label);
    }
    if ((native.fields & GP_STORAGEINFO_DESCRIPTION) != 0) {
      storage.description = std::string(native.description);
    }
    if ((native.fields & GP_STORAGEINFO_STORAGETYPE) != 0) {
      storage.type = std::string(StorageTypeName(native.type));
    }
    if ((native.fields & GP_STORAGEINFO_ACCESS) != 0) {
      if (const auto access = StorageAccessName(native.access); access.has_value()) {
        storage.access = std::string(access.value());
      }
    }
    if ((native.fields & GP_STORAGEINFO_MAXCAPACITY) != 0) {
      storage.capacity_kb = native.capacitykbytes;
    }
    if ((native.fields & GP_STORAGEINFO_FREESPACEKBYTES) != 0) {
      storage.free_kb = native.freekbytes;
    }
    if ((native.fields & GP_STORAGEINFO_FREESPACEIMAGES) != 0) {
      storage.free_images = native.freeimages;
    }
    storages.push_back(std::move(storage));
  }
  return true;
}

bool Camera::Filesystem(files::Directory& root, Error& error) {
  if (!EnsureReady(error)) {
    return false;
  }
  root = files::Directory::Root(session_);
  return true;
}

bool Camera::CollectDirectories(const files::Directory& directory,
                                std::vector<files::Directory>& found, Error& error) {
  files::OneShotSequence<files::Directory> children;
  if (!directory.Directories(children, error)) {
    return false;
  }
  for (files::Directory& child : children.Drain()) {
    found.push_back(child);
    if (!CollectDirectories(child, found, error)) {
      return false;
    }
  }
  return true;
}

bool Camera::ListAllDirectories(std::vector<files::Directory>& found, Error& error) {
  found.clear();
  files::Directory root;
  if (!Filesystem(root, error)) {
    return false;
  }
  found.push_back(root);
  return CollectDirectories(root, found, error);
}

bool Camera::ListAllFiles(std::vector<files::File>& found, Error& error) {
  found.clear();
  std::vector<files::Directory> directories;
  if (!ListAllDirectories(directories, error)) {
    return false;
  }
  for (const files::Directory& directory : directories) {
    files::OneShotSequence<files::File> listed;
    if (!directory.Files(listed, error)) {
      return false;
    }
    for (files::File& file : listed.Drain()) {
      found.push_back(std::move(file));
    }
  }
  return true;
}

bool Camera::ModelName(std::string& model, Error& error) {
  CameraAbilities abilities{};
  if (!EnsureReady(error) || !session_->Abilities(abilities, error)) {
    return false;
  }
  model = abilities.model;
  return true;
}

bool Camera::UsbInfo(UsbInformation& usb, Error& error) {
  CameraAbilities abilities{};
  if (!EnsureReady(error) || !session_->Abilities(abilities, error)) {
    return false;
  }
  usb = UsbInformation{
      .vendor = abilities.usb_vendor,
      .product = abilities.usb_product,
      .device_class = abilities.usb_class,
      .subclass = abilities.usb_subclass,
      .protocol = abilities.usb_protocol,
  };
  return true;
}

bool Camera::SupportedOperations(std::vector<std::string>& operations, Error& error) {
  operations.clear();
  CameraAbilities abilities{};
  if (!EnsureReady(error) || !session_->Abilities(abilities, error)) {
    return false;
  }
  operations = CameraOperationNames(abilities.operations);
  return true;
}

} // namespace gpcam::camera
