#include <unity.h>

#include <string>
#include <vector>

#include "util/Log.h"

namespace {

struct Captured {
  flicker::log::Level level;
  std::string tag;
  std::string message;
};

void captureSink(flicker::log::Level level, const char* tag, const char* message, void* user) {
  auto* out = static_cast<std::vector<Captured>*>(user);
  out->push_back(Captured{level, tag ? tag : "", message});
}

}  // namespace

void test_log_routes_formatted_messages_to_sink() {
  std::vector<Captured> lines;
  flicker::log::setSink(&captureSink, &lines);

  flicker::log::warn("palette", "rejected %d colors", 7);
  flicker::log::info("session", "seed=%08x", 0xABCDu);

  TEST_ASSERT_EQUAL_size_t(2, lines.size());
  TEST_ASSERT_EQUAL(flicker::log::Level::kWarn, lines[0].level);
  TEST_ASSERT_EQUAL_STRING("palette", lines[0].tag.c_str());
  TEST_ASSERT_EQUAL_STRING("rejected 7 colors", lines[0].message.c_str());
  TEST_ASSERT_EQUAL_STRING("seed=0000abcd", lines[1].message.c_str());
  flicker::log::resetSink();
}

void test_log_truncates_long_messages() {
  std::vector<Captured> lines;
  flicker::log::setSink(&captureSink, &lines);

  const std::string longText(400, 'x');
  flicker::log::error("util", "%s", longText.c_str());
  TEST_ASSERT_EQUAL_size_t(1, lines.size());
  TEST_ASSERT_EQUAL_size_t(191, lines[0].message.size());
  flicker::log::resetSink();
}

void test_log_level_labels() {
  TEST_ASSERT_EQUAL_STRING("D", flicker::log::levelLabel(flicker::log::Level::kDebug));
  TEST_ASSERT_EQUAL_STRING("I", flicker::log::levelLabel(flicker::log::Level::kInfo));
  TEST_ASSERT_EQUAL_STRING("W", flicker::log::levelLabel(flicker::log::Level::kWarn));
  TEST_ASSERT_EQUAL_STRING("E", flicker::log::levelLabel(flicker::log::Level::kError));
}
