#include "gpcam/cli/router.hpp"

#include "camera/camera.hpp"
#include "camera/camera_options.hpp"
#include "camera/discovery.hpp"
#include "config/config_value.hpp"
#include "config/widget_tree.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "files/file_types.hpp"
#include "files/remote_fs.hpp"
#include "gphoto/error_mapper.hpp"
#include "gphoto/gphoto2_library.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace gpcam::cli {

namespace {

constexpr std::string_view kVersion = "0.1.0";
constexpr const char* kLogLevelEnv = "GPCAM_LOG_LEVEL";

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitCameraNotFound = core::errors::ToInt(core::errors::ExitCode::kCameraNotFound);
constexpr int kExitCameraBusy = core::errors::ToInt(core::errors::ExitCode::kCameraBusy);
constexpr int kExitInvalidValue = core::errors::ToInt(core::errors::ExitCode::kInvalidValue);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  gpcam <command> [--port usb:BBB,DDD] [--log-level <debug|info|warn|error>]\n"
      << "\n"
      << "commands:\n"
      << "  gpcam list\n"
      << "  gpcam supported\n"
      << "  gpcam config\n"
      << "  gpcam get <section/name>\n"
      << "  gpcam set <section/name> <value>\n"
      << "  gpcam status\n"
      << "  gpcam capture [--to-storage] [--out <file>]\n"
      << "  gpcam preview --out <file>\n"
      << "  gpcam ls [dir]\n"
      << "  gpcam download <path> --out <file> [--type <normal|preview|raw|audio|exif|metadata>]\n"
      << "  gpcam rm <path>\n"
      << "  gpcam storage\n"
      << "  gpcam version\n";
}

// Parsed flags and positionals of one subcommand invocation.
struct CommandLine {
  std::vector<std::string_view> positionals;
  std::optional<std::string> port;
  std::optional<core::logging::LogLevel> log_level;
  bool to_storage = false;
  std::optional<std::string> out;
  std::optional<files::FileType> type;
};

bool Allows(std::initializer_list<std::string_view> allowed, std::string_view flag) {
  return std::find(allowed.begin(), allowed.end(), flag) != allowed.end();
}

// `--port` and `--log-level` are accepted everywhere; command-specific flags
// only where `allowed` lists them. Unknown flags are usage errors.
bool ParseCommandLine(const std::vector<std::string_view>& args,
                      std::initializer_list<std::string_view> allowed, CommandLine& line,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    const bool has_value = i + 1 < args.size();

    if (token == "--port") {
      if (!has_value) {
        error = "missing value for --port";
        return false;
      }
      camera::UsbAddress address;
      if (!camera::ParseUsbPort(args[i + 1], address, error)) {
        return false;
      }
      line.port = camera::FormatUsbPort(address);
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (!has_value) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      line.log_level = parsed;
      ++i;
      continue;
    }
    if (token == "--to-storage" && Allows(allowed, token)) {
      line.to_storage = true;
      continue;
    }
    if (token == "--out" && Allows(allowed, token)) {
      if (!has_value) {
        error = "missing value for --out";
        return false;
      }
      line.out = std::string(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--type" && Allows(allowed, token)) {
      if (!has_value) {
        error = "missing value for --type";
        return false;
      }
      files::FileType type = files::FileType::kNormal;
      if (!files::ParseFileType(args[i + 1], type)) {
        error = "invalid --type '" + std::string(args[i + 1]) +
                "' (expected normal|preview|raw|audio|exif|metadata)";
        return false;
      }
      line.type = type;
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    line.positionals.push_back(token);
  }
  return true;
}

bool ExpectPositionals(std::string_view command, const CommandLine& line, std::size_t min_count,
                       std::size_t max_count, std::string_view shape, std::string& error) {
  if (line.positionals.size() >= min_count && line.positionals.size() <= max_count) {
    return true;
  }
  error = std::string(command) + " expects " + std::string(shape);
  return false;
}

// Environment first, then flags.
bool ResolveSettings(const CommandLine& line, core::logging::LogLevel& level,
                     camera::CameraOptions& options, std::string& error) {
  level = core::logging::LogLevel::kInfo;
  if (const char* raw = std::getenv(kLogLevelEnv); raw != nullptr) {
    if (!core::logging::ParseLogLevel(raw, level, error, kLogLevelEnv)) {
      return false;
    }
  }
  if (line.log_level.has_value()) {
    level = line.log_level.value();
  }

  if (!camera::ApplyEnvironmentOverrides(options, error)) {
    return false;
  }
  if (line.port.has_value()) {
    options.port = line.port;
  }
  // Initialization is driven explicitly so a missing camera maps to its own
  // exit code.
  options.lazy = true;
  return true;
}

int ExitCodeFor(const gphoto::Error& error) {
  switch (error.code) {
  case gphoto::ErrorCode::kUnsupportedDevice:
    return kExitCameraNotFound;
  case gphoto::ErrorCode::kCameraBusy:
    return kExitCameraBusy;
  case gphoto::ErrorCode::kInvalidValue:
  case gphoto::ErrorCode::kReadOnly:
    return kExitInvalidValue;
  default:
    return kExitFailure;
  }
}

int ReportFailure(std::string_view what, const gphoto::Error& error) {
  std::cerr << "error: " << what << ": " << gphoto::FormatError(error) << '\n';
  return ExitCodeFor(error);
}

bool WriteBytes(const fs::path& path, const std::vector<std::uint8_t>& data, std::string& error) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "failed to open output file: " + path.string();
    return false;
  }
  out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!out) {
    error = "failed to write output file: " + path.string();
    return false;
  }
  return true;
}

std::string DescribeItem(const config::ConfigItem& item) {
  std::string description = config::ToString(item.kind());
  if (const auto* range = std::get_if<config::RangeValue>(&item.value())) {
    description += ", " + config::FormatRange(range->range);
  }
  if (const auto* selection = std::get_if<config::SelectionValue>(&item.value())) {
    description += ", choices:";
    for (const std::string& choice : selection->choices) {
      description += " [" + choice + "]";
    }
  }
  return description;
}

std::string ItemPath(const config::ConfigItemRef& ref) {
  return ref.section.empty() ? ref.item->name() : ref.section + "/" + ref.item->name();
}

// Builds the library handle and an initialized camera, then runs `body`.
int WithCamera(const gphoto::NativeApi& api, const CommandLine& line,
               const std::function<int(camera::Camera&)>& body) {
  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  camera::CameraOptions options;
  std::string error;
  if (!ResolveSettings(line, level, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  gphoto::Gphoto2Library library(api, core::logging::Logger(level));
  gphoto::Error failure;
  if (!library.Acquire(failure)) {
    return ReportFailure("libgphoto2 initialization failed", failure);
  }
  camera::Camera device(library, options);
  if (!device.Initialize(failure)) {
    return ReportFailure("failed to open camera", failure);
  }
  return body(device);
}

bool SplitRemotePath(std::string_view path, std::string& folder, std::string& name,
                     std::string& error) {
  const std::size_t slash = path.rfind('/');
  if (slash == std::string_view::npos) {
    folder = "/";
    name = std::string(path);
  } else {
    folder = slash == 0 ? "/" : std::string(path.substr(0, slash));
    name = std::string(path.substr(slash + 1));
  }
  if (name.empty()) {
    error = "remote path must name a file: " + std::string(path);
    return false;
  }
  return true;
}

int CommandVersion(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "gpcam " << kVersion << '\n';
  gphoto::Gphoto2Library library(api, core::logging::Logger(core::logging::LogLevel::kWarn));
  gphoto::Error failure;
  if (!library.Acquire(failure)) {
    return ReportFailure("libgphoto2 initialization failed", failure);
  }
  std::cout << "libgphoto2 " << library.version().text << '\n';
  return kExitSuccess;
}

int CommandList(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  if (!ParseCommandLine(args, {}, line, error) ||
      !ExpectPositionals("list", line, 0, 0, "no arguments", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  camera::CameraOptions options;
  if (!ResolveSettings(line, level, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  gphoto::Gphoto2Library library(api, core::logging::Logger(level));
  std::vector<camera::CameraDescriptor> cameras;
  gphoto::Error failure;
  if (!camera::ListCameras(library, cameras, failure)) {
    return ReportFailure("camera detection failed", failure);
  }
  if (cameras.empty()) {
    std::cout << "no cameras detected\n";
    return kExitSuccess;
  }
  for (const camera::CameraDescriptor& descriptor : cameras) {
    std::cout << descriptor.model << '\t' << descriptor.port << '\n';
  }
  return kExitSuccess;
}

int CommandSupported(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  if (!ParseCommandLine(args, {}, line, error) ||
      !ExpectPositionals("supported", line, 0, 0, "no arguments", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  camera::CameraOptions options;
  if (!ResolveSettings(line, level, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  gphoto::Gphoto2Library library(api, core::logging::Logger(level));
  std::map<std::string, std::vector<std::string>> drivers;
  gphoto::Error failure;
  if (!camera::SupportedCameras(library, drivers, failure)) {
    return ReportFailure("failed to load camera abilities", failure);
  }
  for (const auto& [driver, models] : drivers) {
    std::cout << driver << " (" << models.size() << " models)\n";
    for (const std::string& model : models) {
      std::cout << "  " << model << '\n';
    }
  }
  return kExitSuccess;
}

int CommandConfig(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  if (!ParseCommandLine(args, {}, line, error) ||
      !ExpectPositionals("config", line, 0, 0, "no arguments", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  return WithCamera(api, line, [](camera::Camera& device) {
    config::ConfigTree tree;
    gphoto::Error failure;
    if (!device.ReadConfig(tree, failure)) {
      return ReportFailure("failed to read configuration", failure);
    }
    for (const config::ConfigItemRef& ref : config::CollectWritableSettings(tree)) {
      std::cout << ItemPath(ref) << " = " << config::FormatWidgetValue(ref.item->value()) << "  ("
                << DescribeItem(*ref.item) << ")\n";
    }
    return kExitSuccess;
  });
}

int CommandGet(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  if (!ParseCommandLine(args, {}, line, error) ||
      !ExpectPositionals("get", line, 1, 1, "exactly 1 argument: <section/name>", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  const std::string path(line.positionals.front());

  return WithCamera(api, line, [&path](camera::Camera& device) {
    config::ConfigTree tree;
    gphoto::Error failure;
    if (!device.ReadConfig(tree, failure)) {
      return ReportFailure("failed to read configuration", failure);
    }
    const config::ConfigItem* item = tree.FindItem(path);
    if (item == nullptr) {
      std::cerr << "error: no setting named '" << path << "'\n";
      return kExitInvalidValue;
    }
    std::cout << path << " = " << config::FormatWidgetValue(item->value()) << '\n';
    std::cout << "label: " << item->label() << '\n';
    if (!item->info().empty()) {
      std::cout << "info: " << item->info() << '\n';
    }
    std::cout << "type: " << DescribeItem(*item) << '\n';
    std::cout << "readonly: " << (item->readonly() ? "yes" : "no") << '\n';
    return kExitSuccess;
  });
}

int CommandSet(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  if (!ParseCommandLine(args, {}, line, error) ||
      !ExpectPositionals("set", line, 2, 2, "exactly 2 arguments: <section/name> <value>",
                         error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  const std::string path(line.positionals[0]);
  const std::string text(line.positionals[1]);

  return WithCamera(api, line, [&path, &text](camera::Camera& device) {
    config::ConfigTree tree;
    gphoto::Error failure;
    if (!device.ReadConfig(tree, failure)) {
      return ReportFailure("failed to read configuration", failure);
    }
    const config::ConfigItem* item = tree.FindItem(path);
    if (item == nullptr) {
      std::cerr << "error: no setting named '" << path << "'\n";
      return kExitInvalidValue;
    }

    config::SettableValue value;
    std::string parse_error;
    if (!config::ParseSettableValue(item->kind(), text, value, parse_error)) {
      std::cerr << "error: " << parse_error << '\n';
      return kExitInvalidValue;
    }
    if (!device.SetConfigValue(path, value, failure)) {
      return ReportFailure("failed to change '" + path + "'", failure);
    }
    std::cout << path << " = " << text << '\n';
    return kExitSuccess;
  });
}

int CommandStatus(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  if (!ParseCommandLine(args, {}, line, error) ||
      !ExpectPositionals("status", line, 0, 0, "no arguments", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  return WithCamera(api, line, [](camera::Camera& device) {
    std::string model;
    config::ConfigTree tree;
    gphoto::Error failure;
    if (!device.ModelName(model, failure)) {
      return ReportFailure("failed to read camera model", failure);
    }
    if (!device.ReadConfig(tree, failure)) {
      return ReportFailure("failed to read configuration", failure);
    }
    std::cout << "model: " << model << '\n';
    for (const config::ConfigItemRef& ref : config::CollectStatus(tree)) {
      std::cout << ref.item->label() << ": " << config::FormatWidgetValue(ref.item->value())
                << '\n';
    }
    return kExitSuccess;
  });
}

int CommandCapture(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  if (!ParseCommandLine(args, {"--to-storage", "--out"}, line, error) ||
      !ExpectPositionals("capture", line, 0, 0, "no positional arguments", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (line.to_storage && line.out.has_value()) {
    std::cerr << "error: --to-storage keeps the image on the camera and cannot be combined "
                 "with --out\n";
    return kExitUsage;
  }
  if (!line.to_storage && !line.out.has_value()) {
    std::cerr << "error: capture requires --out <file> unless --to-storage is given\n";
    return kExitUsage;
  }

  return WithCamera(api, line, [&line](camera::Camera& device) {
    camera::CaptureResult result;
    gphoto::Error failure;
    if (!device.Capture(camera::CaptureOptions{.to_camera_storage = line.to_storage}, result,
                        failure)) {
      return ReportFailure("capture failed", failure);
    }
    if (result.file.has_value()) {
      std::cout << "captured: " << result.file->path() << '\n';
      return kExitSuccess;
    }

    std::string write_error;
    if (!WriteBytes(line.out.value(), result.data, write_error)) {
      std::cerr << "error: " << write_error << '\n';
      return kExitFailure;
    }
    std::cout << "saved: " << line.out.value() << " (" << result.data.size() << " bytes)\n";
    return kExitSuccess;
  });
}

int CommandPreview(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  if (!ParseCommandLine(args, {"--out"}, line, error) ||
      !ExpectPositionals("preview", line, 0, 0, "no positional arguments", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (!line.out.has_value()) {
    std::cerr << "error: preview requires --out <file>\n";
    return kExitUsage;
  }

  return WithCamera(api, line, [&line](camera::Camera& device) {
    std::vector<std::uint8_t> image;
    gphoto::Error failure;
    if (!device.CapturePreview(image, failure)) {
      return ReportFailure("preview capture failed", failure);
    }
    std::string write_error;
    if (!WriteBytes(line.out.value(), image, write_error)) {
      std::cerr << "error: " << write_error << '\n';
      return kExitFailure;
    }
    std::cout << "saved: " << line.out.value() << " (" << image.size() << " bytes)\n";
    return kExitSuccess;
  });
}

int CommandLs(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  if (!ParseCommandLine(args, {}, line, error) ||
      !ExpectPositionals("ls", line, 0, 1, "at most 1 argument: [dir]", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  const std::string target = line.positionals.empty() ? "/" : std::string(line.positionals[0]);

  return WithCamera(api, line, [&target](camera::Camera& device) {
    files::Directory root;
    gphoto::Error failure;
    if (!device.Filesystem(root, failure)) {
      return ReportFailure("failed to open camera filesystem", failure);
    }
    const files::Directory directory = root.Locate(target);

    files::OneShotSequence<files::Directory> directories;
    files::OneShotSequence<files::File> entries;
    if (!directory.Directories(directories, failure) || !directory.Files(entries, failure)) {
      return ReportFailure("failed to list '" + directory.path() + "'", failure);
    }
    for (const files::Directory& child : directories.Drain()) {
      std::cout << child.name() << "/\n";
    }
    for (const files::File& file : entries.Drain()) {
      std::cout << file.name() << '\n';
    }
    return kExitSuccess;
  });
}

int CommandDownload(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  std::string folder;
  std::string name;
  if (!ParseCommandLine(args, {"--out", "--type"}, line, error) ||
      !ExpectPositionals("download", line, 1, 1, "exactly 1 argument: <path>", error) ||
      !SplitRemotePath(line.positionals.front(), folder, name, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (!line.out.has_value()) {
    std::cerr << "error: download requires --out <file>\n";
    return kExitUsage;
  }

  return WithCamera(api, line, [&](camera::Camera& device) {
    files::Directory root;
    gphoto::Error failure;
    if (!device.Filesystem(root, failure)) {
      return ReportFailure("failed to open camera filesystem", failure);
    }
    const files::File file = root.Locate(folder).FileNamed(name);
    const files::FileType type = line.type.value_or(files::FileType::kNormal);
    if (!file.Save(line.out.value(), type, failure)) {
      return ReportFailure("failed to download '" + file.path() + "'", failure);
    }
    std::cout << "saved: " << line.out.value() << '\n';
    return kExitSuccess;
  });
}

int CommandRm(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  std::string folder;
  std::string name;
  if (!ParseCommandLine(args, {}, line, error) ||
      !ExpectPositionals("rm", line, 1, 1, "exactly 1 argument: <path>", error) ||
      !SplitRemotePath(line.positionals.front(), folder, name, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  return WithCamera(api, line, [&](camera::Camera& device) {
    files::Directory root;
    gphoto::Error failure;
    if (!device.Filesystem(root, failure)) {
      return ReportFailure("failed to open camera filesystem", failure);
    }
    const files::File file = root.Locate(folder).FileNamed(name);
    if (!file.Remove(failure)) {
      return ReportFailure("failed to remove '" + file.path() + "'", failure);
    }
    std::cout << "removed: " << file.path() << '\n';
    return kExitSuccess;
  });
}

void PrintStorageField(std::string_view key, const std::optional<std::string>& value) {
  if (value.has_value()) {
    std::cout << "  " << key << ": " << value.value() << '\n';
  }
}

void PrintStorageField(std::string_view key, const std::optional<std::uint64_t>& value) {
  if (value.has_value()) {
    std::cout << "  " << key << ": " << value.value() << '\n';
  }
}

int CommandStorage(const gphoto::NativeApi& api, const std::vector<std::string_view>& args) {
  CommandLine line;
  std::string error;
  if (!ParseCommandLine(args, {}, line, error) ||
      !ExpectPositionals("storage", line, 0, 0, "no arguments", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  return WithCamera(api, line, [](camera::Camera& device) {
    std::vector<camera::StorageInfo> storages;
    gphoto::Error failure;
    if (!device.ReadStorageInfo(storages, failure)) {
      return ReportFailure("failed to read storage information", failure);
    }
    for (std::size_t i = 0; i < storages.size(); ++i) {
      const camera::StorageInfo& storage = storages[i];
      std::cout << "storage " << i << '\n';
      PrintStorageField("base", storage.base_directory);
      PrintStorageField("label", storage.label);
      PrintStorageField("description", storage.description);
      PrintStorageField("type", storage.type);
      PrintStorageField("access", storage.access);
      PrintStorageField("capacity_kb", storage.capacity_kb);
      PrintStorageField("free_kb", storage.free_kb);
      PrintStorageField("free_images", storage.free_images);
    }
    return kExitSuccess;
  });
}

} // namespace

int Dispatch(int argc, char** argv) {
  return Dispatch(argc, argv, gphoto::DefaultNativeApi());
}

int Dispatch(int argc, char** argv, const gphoto::NativeApi& api) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  using Handler = int (*)(const gphoto::NativeApi&, const std::vector<std::string_view>&);
  static const std::map<std::string_view, Handler> kCommands = {
      {"version", &CommandVersion},
      {"list", &CommandList},
      {"supported", &CommandSupported},
      {"config", &CommandConfig},
      {"get", &CommandGet},
      {"set", &CommandSet},
      {"status", &CommandStatus},
      {"capture", &CommandCapture},
      {"preview", &CommandPreview},
      {"ls", &CommandLs},
      {"download", &CommandDownload},
      {"rm", &CommandRm},
      {"storage", &CommandStorage},
  };

  if (const auto it = kCommands.find(command); it != kCommands.end()) {
    return it->second(api, args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace gpcam::cli
