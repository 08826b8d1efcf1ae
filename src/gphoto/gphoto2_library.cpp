#include "gphoto/gphoto2_library.hpp"

#include "gphoto/native_call.hpp"

#include <charconv>
#include <utility>

namespace gpcam::gphoto {

namespace {

bool ParseVersionComponent(std::string_view raw, int& value) {
  if (raw.empty()) {
    return false;
  }
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr != begin;
}

} // namespace

bool ParseLibraryVersion(std::string_view text, LibraryVersion& version, std::string& error) {
  version = LibraryVersion{};
  version.text = std::string(text);

  int* components[] = {&version.major, &version.minor, &version.patch};
  std::size_t parsed = 0;
  std::size_t cursor = 0;
  while (parsed < 3U && cursor <= text.size()) {
    const std::size_t dot = text.find('.', cursor);
    const std::string_view part =
        text.substr(cursor, dot == std::string_view::npos ? std::string_view::npos : dot - cursor);
    if (!ParseVersionComponent(part, *components[parsed])) {
      break;
    }
    ++parsed;
    if (dot == std::string_view::npos) {
      break;
    }
    cursor = dot + 1U;
  }

  // "2.5" is accepted with patch = 0.
  if (parsed < 2U) {
    error = "unparseable libgphoto2 version '" + std::string(text) + "'";
    return false;
  }
  return true;
}

std::optional<core::logging::LogLevel> TranslateNativeLogLevel(const GPLogLevel level) {
  switch (level) {
  case GP_LOG_ERROR:
    return core::logging::LogLevel::kError;
  case GP_LOG_VERBOSE:
    return core::logging::LogLevel::kInfo;
  case GP_LOG_DEBUG:
    return core::logging::LogLevel::kDebug;
  default:
    return std::nullopt;
  }
}

Gphoto2Library::Gphoto2Library(NativeApi api, core::logging::Logger logger)
    : api_(std::move(api)), logger_(std::move(logger)) {}

Gphoto2Library::~Gphoto2Library() {
  Release();
}

bool Gphoto2Library::Acquire(Error& error) {
  error.Clear();
  if (initialized_.load(std::memory_order_acquire)) {
    return true;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (initialized_.load(std::memory_order_relaxed)) {
    return true;
  }

  if (!api_.library_version || !api_.log_add_func || !api_.result_as_string) {
    error = MakeLocalError(ErrorCode::kNotInitialized, "libgphoto2 entry points are not bound");
    return false;
  }

  const char** version_info = api_.library_version(GP_VERSION_SHORT);
  if (version_info != nullptr && version_info[0] != nullptr) {
    std::string parse_error;
    if (!ParseLibraryVersion(version_info[0], version_, parse_error)) {
      logger_.Warn("libgphoto2 version not recognized", {{"detail", parse_error}});
    }
  }

  // The registration id is exempt from status checks; only a negative id is
  // a failure.
  const int log_id = api_.log_add_func(GP_LOG_DEBUG, &Gphoto2Library::NativeLogCallback, this);
  if (log_id < GP_OK) {
    error = TranslateNativeResult(api_, log_id);
    return false;
  }
  log_func_id_ = log_id;

  ++init_calls_;
  initialized_.store(true, std::memory_order_release);
  logger_.Debug("libgphoto2 initialized", {{"version", version_.text}});
  return true;
}

void Gphoto2Library::Release() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_.load(std::memory_order_relaxed)) {
    return;
  }

  if (log_func_id_ >= 0 && api_.log_remove_func) {
    (void)api_.log_remove_func(log_func_id_);
  }
  log_func_id_ = -1;
  ++shutdown_calls_;
  initialized_.store(false, std::memory_order_release);
}

void Gphoto2Library::ForwardNativeLog(const GPLogLevel level, const char* domain,
                                      const char* message) {
  const std::optional<core::logging::LogLevel> translated = TranslateNativeLogLevel(level);
  if (!translated.has_value()) {
    dropped_records_.fetch_add(1U, std::memory_order_relaxed);
    return;
  }

  const std::string_view domain_text = domain == nullptr ? std::string_view() : domain;
  core::logging::Logger domain_logger =
      logger_.WithComponent("libgphoto2").WithComponent(domain_text);
  domain_logger.Log(translated.value(), message == nullptr ? std::string_view() : message);
  forwarded_records_.fetch_add(1U, std::memory_order_relaxed);
}

Gphoto2Library::Snapshot Gphoto2Library::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return Snapshot{
      .initialized = initialized_.load(std::memory_order_relaxed),
      .init_calls = init_calls_,
      .shutdown_calls = shutdown_calls_,
      .forwarded_records = forwarded_records_.load(std::memory_order_relaxed),
      .dropped_records = dropped_records_.load(std::memory_order_relaxed),
  };
}

void Gphoto2Library::NativeLogCallback(const GPLogLevel level, const char* domain,
                                       const char* message, void* data) {
  if (data == nullptr) {
    return;
  }
  static_cast<Gphoto2Library*>(data)->ForwardNativeLog(level, domain, message);
}

} // namespace gpcam::gphoto
