#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace brickfinder::core::log {

/// Levels in increasing severity. Lines below min_level() are dropped.
enum class Level : std::uint8_t { Debug = 0, Info, Warn, Error, Off };

inline std::atomic<Level>& min_level_ref() noexcept {
  static std::atomic<Level> level{Level::Info};
  return level;
}

inline void set_min_level(Level level) noexcept { min_level_ref().store(level); }
[[nodiscard]] inline Level min_level() noexcept { return min_level_ref().load(); }

[[nodiscard]] inline bool enabled(Level level) noexcept {
  return level >= min_level() && level != Level::Off;
}

/// Parses "debug" / "info" / "warn" / "error" / "off"; anything else yields Info.
[[nodiscard]] inline Level parse_level(std::string_view s) noexcept {
  if (s == "debug") return Level::Debug;
  if (s == "warn") return Level::Warn;
  if (s == "error") return Level::Error;
  if (s == "off") return Level::Off;
  return Level::Info;
}

[[nodiscard]] inline const char* level_tag(Level level) noexcept {
  switch (level) {
    case Level::Debug: return "D";
    case Level::Info: return "I";
    case Level::Warn: return "W";
    case Level::Error: return "E";
    case Level::Off: break;
  }
  return "?";
}

// Workers and the control thread log concurrently; one line per lock.
inline std::mutex& sink_mutex() {
  static std::mutex m;
  return m;
}

inline void write_line(Level level, const char* tag, std::string_view msg) {
  std::lock_guard lock(sink_mutex());
  std::fprintf(stderr, "[%s][%s] %.*s\n", level_tag(level), tag,
               static_cast<int>(msg.size()), msg.data());
  std::fflush(stderr);
}

#if defined(BRICKFINDER_LOG_DISABLE)

inline void logf(Level, const char*, const char*, ...) {}

struct StreamGuard {
  std::ostringstream oss;
  StreamGuard(Level, const char*) {}
};

#else

inline void logf(Level level, const char* tag, const char* fmt, ...) {
  if (!enabled(level)) return;
  char buf[1024];
  va_list ap;
  va_start(ap, fmt);
  const int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  if (n < 0) return;
  const std::size_t len =
      static_cast<std::size_t>(n) < sizeof(buf) ? static_cast<std::size_t>(n) : sizeof(buf) - 1;
  write_line(level, tag, std::string_view(buf, len));
}

struct StreamGuard {
  Level level;
  const char* tag;
  std::ostringstream oss;
  StreamGuard(Level lv, const char* tg) : level(lv), tag(tg) {}
  ~StreamGuard() {
    if (enabled(level)) write_line(level, tag, oss.str());
  }
};

#endif  // BRICKFINDER_LOG_DISABLE

}  // namespace brickfinder::core::log

// printf style: BF_LOGI("loader", "loaded %s in %.1fs", path, secs);
#if defined(BRICKFINDER_LOG_DISABLE)
#define BF_LOGD(TAG, FMT, ...) ((void)0)
#define BF_LOGI(TAG, FMT, ...) ((void)0)
#define BF_LOGW(TAG, FMT, ...) ((void)0)
#define BF_LOGE(TAG, FMT, ...) ((void)0)
#else
#define BF_LOGD(TAG, FMT, ...) \
  ::brickfinder::core::log::logf(::brickfinder::core::log::Level::Debug, TAG, FMT, ##__VA_ARGS__)
#define BF_LOGI(TAG, FMT, ...) \
  ::brickfinder::core::log::logf(::brickfinder::core::log::Level::Info, TAG, FMT, ##__VA_ARGS__)
#define BF_LOGW(TAG, FMT, ...) \
  ::brickfinder::core::log::logf(::brickfinder::core::log::Level::Warn, TAG, FMT, ##__VA_ARGS__)
#define BF_LOGE(TAG, FMT, ...) \
  ::brickfinder::core::log::logf(::brickfinder::core::log::Level::Error, TAG, FMT, ##__VA_ARGS__)
#endif

// stream style: BF_LOGIs("state") << from << " -> " << to;
#if defined(BRICKFINDER_LOG_DISABLE)
#define BF_LOG_STREAM(LEVEL, TAG) \
  if (true) {                     \
  } else                          \
    ::brickfinder::core::log::StreamGuard(LEVEL, TAG).oss
#else
#define BF_LOG_STREAM(LEVEL, TAG) ::brickfinder::core::log::StreamGuard(LEVEL, TAG).oss
#endif

#define BF_LOGDs(TAG) BF_LOG_STREAM(::brickfinder::core::log::Level::Debug, TAG)
#define BF_LOGIs(TAG) BF_LOG_STREAM(::brickfinder::core::log::Level::Info, TAG)
#define BF_LOGWs(TAG) BF_LOG_STREAM(::brickfinder::core::log::Level::Warn, TAG)
#define BF_LOGEs(TAG) BF_LOG_STREAM(::brickfinder::core::log::Level::Error, TAG)
