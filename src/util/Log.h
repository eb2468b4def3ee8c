#pragma once

//
// Log breadcrumbs.
// ----------------
// Tiny printf-style logger.  Messages are formatted into a bounded scratch
// buffer and handed to one sink function, so tests can capture them and the
// headless example can leave them on stderr.  The default sink honours
// QUIET_MODE: debug/info are dropped, warnings and errors always print.
//
// The sink is process-wide and swapped from the control thread only.  The
// producer loop may log; it never blocks on anything but stdio.
#include <array>
#include <cstdint>
#include <cstdio>
#include <utility>

namespace flicker {
namespace log {

enum class Level : std::uint8_t { kDebug = 0, kInfo, kWarn, kError };

// Same shape as the other callback seams: plain function pointer plus an
// opaque user pointer.
using Sink = void (*)(Level level, const char *tag, const char *message, void *user_data);

void setSink(Sink sink, void *user_data = nullptr);
void resetSink();

void emit(Level level, const char *tag, const char *message);

const char *levelLabel(Level level);

template <typename... Args>
void write(Level level, const char *tag, const char *fmt, Args &&...args) {
  std::array<char, 192> scratch{};
  const int written = std::snprintf(scratch.data(), scratch.size(), fmt, std::forward<Args>(args)...);
  if (written <= 0) {
    return;
  }
  emit(level, tag, scratch.data());
}

template <typename... Args>
void debug(const char *tag, const char *fmt, Args &&...args) {
  write(Level::kDebug, tag, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(const char *tag, const char *fmt, Args &&...args) {
  write(Level::kInfo, tag, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(const char *tag, const char *fmt, Args &&...args) {
  write(Level::kWarn, tag, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void error(const char *tag, const char *fmt, Args &&...args) {
  write(Level::kError, tag, fmt, std::forward<Args>(args)...);
}

}  // namespace log
}  // namespace flicker
