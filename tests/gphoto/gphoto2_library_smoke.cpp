#include "../common/assertions.hpp"
#include "core/logging/logger.hpp"
#include "gphoto/gphoto2_library.hpp"

#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>

namespace {

using gpcam::gphoto::Gphoto2Library;
using gpcam::tests::common::Fail;

void AssertState(const Gphoto2Library::Snapshot& snapshot, bool initialized,
                 std::uint64_t init_calls, std::uint64_t shutdown_calls) {
  if (snapshot.initialized != initialized || snapshot.init_calls != init_calls ||
      snapshot.shutdown_calls != shutdown_calls) {
    std::cerr << "unexpected library state:"
              << " initialized=" << (snapshot.initialized ? "true" : "false")
              << " init_calls=" << snapshot.init_calls
              << " shutdown_calls=" << snapshot.shutdown_calls << '\n';
    std::abort();
  }
}

} // namespace

int main() {
  using gpcam::core::logging::LogLevel;
  using gpcam::core::logging::Logger;
  using gpcam::gphoto::DefaultNativeApi;
  using gpcam::gphoto::Error;
  using gpcam::gphoto::LibraryVersion;
  using gpcam::gphoto::NativeApi;
  using gpcam::gphoto::ParseLibraryVersion;
  using gpcam::gphoto::TranslateNativeLogLevel;
  using gpcam::tests::common::AssertContains;
  using gpcam::tests::common::AssertNotContains;

  {
    LibraryVersion version;
    std::string error;
    if (!ParseLibraryVersion("2.5.31", version, error) || version.major != 2 ||
        version.minor != 5 || version.patch != 31) {
      Fail("plain version should parse");
    }
    if (!ParseLibraryVersion("2.5.27.1-dev", version, error) || version.patch != 27 ||
        version.text != "2.5.27.1-dev") {
      Fail("suffixes past the third component should be ignored");
    }
    if (!ParseLibraryVersion("2.5", version, error) || version.patch != 0) {
      Fail("two-component versions should parse with patch 0");
    }
    if (ParseLibraryVersion("unknown", version, error)) {
      Fail("non-numeric versions should be rejected");
    }
    AssertContains(error, "unknown");
  }

  if (TranslateNativeLogLevel(GP_LOG_ERROR) != LogLevel::kError ||
      TranslateNativeLogLevel(GP_LOG_VERBOSE) != LogLevel::kInfo ||
      TranslateNativeLogLevel(GP_LOG_DEBUG) != LogLevel::kDebug) {
    Fail("unexpected native log level translation");
  }
  if (TranslateNativeLogLevel(GP_LOG_DATA).has_value()) {
    Fail("data records should have no translation");
  }

  NativeApi api = DefaultNativeApi();
  int add_calls = 0;
  int remove_calls = 0;
  static const char* kVersion[] = {"2.5.31", nullptr};
  api.library_version = [](GPVersionVerbosity) { return kVersion; };
  api.log_add_func = [&add_calls](GPLogLevel, GPLogFunc, void*) {
    ++add_calls;
    return 7;
  };
  api.log_remove_func = [&remove_calls](int id) {
    if (id != 7) {
      Fail("log bridge should be removed with the id it was registered under");
    }
    ++remove_calls;
    return GP_OK;
  };

  std::ostringstream log_output;
  {
    Gphoto2Library library(api, Logger(LogLevel::kDebug, log_output));
    AssertState(library.DebugSnapshot(), false, 0U, 0U);

    Error error;
    if (!library.Acquire(error) || !library.Acquire(error)) {
      Fail("acquire should succeed and be idempotent");
    }
    AssertState(library.DebugSnapshot(), true, 1U, 0U);
    if (add_calls != 1 || library.version().minor != 5) {
      Fail("first acquire should register the log bridge once and read the version");
    }

    library.ForwardNativeLog(GP_LOG_DEBUG, "ptp2/usb", "sending 0x1002");
    library.ForwardNativeLog(GP_LOG_DATA, "ptp2/usb", "00 01 02 03");
    const Gphoto2Library::Snapshot snapshot = library.DebugSnapshot();
    if (snapshot.forwarded_records != 1U || snapshot.dropped_records != 1U) {
      Fail("data records should be dropped and the rest forwarded");
    }
    AssertContains(log_output.str(), "component=\"libgphoto2.ptp2/usb\"");
    AssertContains(log_output.str(), "sending 0x1002");
    AssertNotContains(log_output.str(), "00 01 02 03");

    library.Release();
    library.Release();
    AssertState(library.DebugSnapshot(), false, 1U, 1U);
    if (remove_calls != 1) {
      Fail("release should unregister exactly once");
    }

    if (!library.Acquire(error)) {
      Fail("acquire after release should succeed");
    }
    AssertState(library.DebugSnapshot(), true, 2U, 1U);
  }
  if (remove_calls != 2) {
    Fail("destruction should release the bridge");
  }

  {
    NativeApi failing = api;
    failing.log_add_func = [](GPLogLevel, GPLogFunc, void*) { return GP_ERROR_NO_MEMORY; };
    Gphoto2Library library(failing, Logger(LogLevel::kError, log_output));
    Error error;
    if (library.Acquire(error) || library.initialized()) {
      Fail("a failed registration should leave the library uninitialized");
    }
    if (error.native_code != GP_ERROR_NO_MEMORY) {
      Fail("registration failure should keep the native code");
    }
  }

  return 0;
}
