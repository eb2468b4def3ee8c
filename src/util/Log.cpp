#include "util/Log.h"

#include "FlickerConfig.h"

namespace flicker {
namespace log {

namespace {

void stderrSink(Level level, const char *tag, const char *message, void *) {
  if (FlickerConfig::kQuietMode && level < Level::kWarn) {
    return;
  }
  std::fprintf(stderr, "[%s] %s: %s\n", levelLabel(level), tag ? tag : "-", message);
}

Sink g_sink = &stderrSink;
void *g_user_data = nullptr;

}  // namespace

void setSink(Sink sink, void *user_data) {
  g_sink = sink ? sink : &stderrSink;
  g_user_data = sink ? user_data : nullptr;
}

void resetSink() { setSink(nullptr); }

void emit(Level level, const char *tag, const char *message) {
  if (!message) {
    return;
  }
  g_sink(level, tag, message, g_user_data);
}

const char *levelLabel(Level level) {
  switch (level) {
    case Level::kDebug: return "D";
    case Level::kInfo: return "I";
    case Level::kWarn: return "W";
    case Level::kError:
    default: return "E";
  }
}

}  // namespace log
}  // namespace flicker
