#pragma once

#include "core/logging/logger.hpp"
#include "gphoto/error_mapper.hpp"
#include "gphoto/native_api.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace gpcam::gphoto {

struct LibraryVersion {
  int major = 0;
  int minor = 0;
  int patch = 0;
  std::string text;
};

// Parses "2.5.27" style version strings; trailing suffixes ("2.5.27.1-dev")
// are ignored past the third component.
bool ParseLibraryVersion(std::string_view text, LibraryVersion& version, std::string& error);

// Translation of libgphoto2 log levels. `GP_LOG_DATA` has no counterpart and
// yields nullopt (the record is dropped).
std::optional<core::logging::LogLevel> TranslateNativeLogLevel(GPLogLevel level);

// Process-wide libgphoto2 handle manager.
//
// Construct one at startup and pass it by reference to every Camera. The first
// `Acquire` reads the library version and registers the log bridge; the
// registration is undone by `Release` or destruction. Initialization is
// guarded by a mutex with an atomic fast path, so concurrent first users
// initialize exactly once.
class Gphoto2Library {
public:
  Gphoto2Library(NativeApi api, core::logging::Logger logger);
  ~Gphoto2Library();

  // The address is handed to libgphoto2 as callback data.
  Gphoto2Library(const Gphoto2Library&) = delete;
  Gphoto2Library& operator=(const Gphoto2Library&) = delete;
  Gphoto2Library(Gphoto2Library&&) = delete;
  Gphoto2Library& operator=(Gphoto2Library&&) = delete;

  // Idempotent.
  bool Acquire(Error& error);

  // Unregisters the log bridge. Safe to call repeatedly.
  void Release();

  bool initialized() const {
    return initialized_.load(std::memory_order_acquire);
  }

  const NativeApi& api() const {
    return api_;
  }

  core::logging::Logger& logger() {
    return logger_;
  }

  // Empty until the first successful Acquire.
  const LibraryVersion& version() const {
    return version_;
  }

  // Entry used by the registered native callback; exposed so the bridge can
  // be exercised without libgphoto2 emitting records.
  void ForwardNativeLog(GPLogLevel level, const char* domain, const char* message);

  struct Snapshot {
    bool initialized = false;
    std::uint64_t init_calls = 0;
    std::uint64_t shutdown_calls = 0;
    std::uint64_t forwarded_records = 0;
    std::uint64_t dropped_records = 0;
  };

  Snapshot DebugSnapshot() const;

private:
  static void NativeLogCallback(GPLogLevel level, const char* domain, const char* message,
                                void* data);

  NativeApi api_;
  core::logging::Logger logger_;

  mutable std::mutex mu_;
  std::atomic<bool> initialized_{false};
  int log_func_id_ = -1;
  LibraryVersion version_;
  std::uint64_t init_calls_ = 0;
  std::uint64_t shutdown_calls_ = 0;
  std::atomic<std::uint64_t> forwarded_records_{0};
  std::atomic<std::uint64_t> dropped_records_{0};
};

} // namespace gpcam::gphoto
