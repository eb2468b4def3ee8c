#include <unity.h>

#include <string>
#include <vector>

#include "app/ControlState.h"
#include "app/FrameClock.h"
#include "app/FrameSession.h"
#include "app/Pack.h"

using flicker::Pack;

namespace {

constexpr const char* kNeonPack = R"({
  "id": "neon",
  "name": "Neon Night",
  "settings": {
    "intensity": 0.9,
    "glitchAmount": 0.5,
    "speed": 3,
    "colorShift": 0.4,
    "freqMin": 60,
    "freqMax": 5000,
    "isMonochrome": false,
    "targetFPS": 60
  },
  "palette": ["#FF0080", "#00FFCC", "#1A1A2E"]
})";

// Same manifest with glitchAmount missing.
constexpr const char* kBrokenPack = R"({
  "id": "broken",
  "name": "Broken",
  "settings": {
    "intensity": 0.9,
    "speed": 3,
    "colorShift": 0.4,
    "freqMin": 60,
    "freqMax": 5000,
    "isMonochrome": false,
    "targetFPS": 60
  },
  "palette": ["#FFFFFF"]
})";

}  // namespace

void test_pack_parses_manifest_with_optional_pulse() {
  Pack pack{};
  TEST_ASSERT_TRUE(Pack::deserialize(std::string(kNeonPack), pack));
  TEST_ASSERT_EQUAL_STRING("neon", pack.id.c_str());
  TEST_ASSERT_EQUAL_STRING("Neon Night", pack.name.c_str());
  TEST_ASSERT_EQUAL_FLOAT(0.9f, pack.settings.intensity);
  TEST_ASSERT_EQUAL_INT32(3, pack.settings.speed);
  TEST_ASSERT_EQUAL_FLOAT(0.6f, pack.settings.pulseStrength);
  TEST_ASSERT_EQUAL_INT32(60, pack.settings.targetFps);
  TEST_ASSERT_EQUAL_size_t(3, pack.paletteHex.size());
}

void test_pack_round_trips_through_json() {
  Pack pack{};
  pack.id = "mono";
  pack.name = "Mono Drift";
  pack.settings.intensity = 0.25f;
  pack.settings.pulseStrength = 0.1f;
  pack.settings.isMonochrome = true;
  pack.paletteHex = {"#000000", "#FFFFFF"};

  Pack restored{};
  TEST_ASSERT_TRUE(Pack::deserialize(pack.serialize(), restored));
  TEST_ASSERT_EQUAL_STRING("Mono Drift", restored.name.c_str());
  TEST_ASSERT_EQUAL_FLOAT(0.25f, restored.settings.intensity);
  TEST_ASSERT_EQUAL_FLOAT(0.1f, restored.settings.pulseStrength);
  TEST_ASSERT_TRUE(restored.settings.isMonochrome);
  TEST_ASSERT_EQUAL_STRING("#FFFFFF", restored.paletteHex[1].c_str());
}

void test_pack_rejects_missing_settings_and_bad_json() {
  Pack pack{};
  pack.id = "untouched";
  TEST_ASSERT_FALSE(Pack::deserialize(std::string(kBrokenPack), pack));
  TEST_ASSERT_FALSE(Pack::deserialize(std::string("{\"id\":"), pack));
  TEST_ASSERT_FALSE(Pack::deserialize(std::string("[1,2,3]"), pack));
  TEST_ASSERT_FALSE(Pack::deserialize(std::vector<std::uint8_t>{}, pack));
  TEST_ASSERT_EQUAL_STRING("untouched", pack.id.c_str());
}

void test_hex_colors_parse_to_rgba() {
  flicker::Float4 c{};
  TEST_ASSERT_TRUE(flicker::parseHexColor("#FF8000", c));
  TEST_ASSERT_EQUAL_FLOAT(1.f, c.x);
  TEST_ASSERT_FLOAT_WITHIN(1e-4f, 128.f / 255.f, c.y);
  TEST_ASSERT_EQUAL_FLOAT(0.f, c.z);
  TEST_ASSERT_EQUAL_FLOAT(1.f, c.w);

  TEST_ASSERT_TRUE(flicker::parseHexColor(" 00ff00 ", c));
  TEST_ASSERT_EQUAL_FLOAT(1.f, c.y);

  TEST_ASSERT_FALSE(flicker::parseHexColor("#GG0000", c));
  TEST_ASSERT_FALSE(flicker::parseHexColor("#FFF", c));
  TEST_ASSERT_FALSE(flicker::parseHexColor("", c));
}

void test_pack_palette_keeps_first_six_valid_colors() {
  Pack pack{};
  pack.paletteHex = {"#010101", "oops", "#020202", "#030303", "#040404",
                     "#050505", "#060606", "#070707"};
  std::size_t skipped = 0;
  const auto colors = pack.paletteColors(&skipped);
  TEST_ASSERT_EQUAL_size_t(flicker::kMaxPaletteColors, colors.size());
  TEST_ASSERT_EQUAL_size_t(1, skipped);
  TEST_ASSERT_FLOAT_WITHIN(1e-4f, 6.f / 255.f, colors[5].x);
}

void test_session_loads_and_clears_pack() {
  flicker::ManualFrameClock clock;
  flicker::FrameSession::Config config{};
  config.initialSeed = 9u;
  flicker::FrameSession session(clock, config);
  session.controls().activePattern = 4;

  TEST_ASSERT_TRUE(session.loadPackJson(kNeonPack));
  TEST_ASSERT_EQUAL_STRING("neon", session.activePackId().c_str());
  TEST_ASSERT_EQUAL_FLOAT(0.9f, session.controls().intensity);
  TEST_ASSERT_EQUAL_FLOAT(3.f, session.controls().speed);
  TEST_ASSERT_EQUAL_FLOAT(60.f, session.controls().freqMin);
  TEST_ASSERT_EQUAL_INT32(4, session.controls().activePattern);
  flicker::ColorPalette palette = session.latestPalette();
  TEST_ASSERT_EQUAL_INT32(3, palette.colorCount);
  TEST_ASSERT_EQUAL_FLOAT(1.f, palette.colors[0].x);

  // A broken manifest leaves the loaded look alone.
  TEST_ASSERT_FALSE(session.loadPackJson(kBrokenPack));
  TEST_ASSERT_EQUAL_FLOAT(0.5f, session.controls().glitchAmount);
  TEST_ASSERT_EQUAL_INT32(3, session.latestPalette().colorCount);

  session.clearPack();
  const flicker::ControlState defaults{};
  TEST_ASSERT_EQUAL_FLOAT(defaults.intensity, session.controls().intensity);
  TEST_ASSERT_EQUAL_FLOAT(defaults.colorShift, session.controls().colorShift);
  TEST_ASSERT_EQUAL_INT32(0, session.latestPalette().colorCount);
  TEST_ASSERT_TRUE(session.activePackId().empty());
}

void test_pack_settings_are_clamped_on_apply() {
  flicker::PackSettings s{};
  s.intensity = 3.f;
  s.speed = 9;
  s.freqMax = 90000.f;
  s.targetFps = 240;
  flicker::ControlState controls{};
  flicker::applyPackSettings(s, controls);
  TEST_ASSERT_EQUAL_FLOAT(1.f, controls.intensity);
  TEST_ASSERT_EQUAL_FLOAT(flicker::kSpeedMax, controls.speed);
  TEST_ASSERT_EQUAL_FLOAT(flicker::kFreqCeilingHz, controls.freqMax);
  TEST_ASSERT_EQUAL_INT32(flicker::kTargetFpsMax, controls.targetFps);

  const flicker::PackSettings back = flicker::captureSettings(controls);
  TEST_ASSERT_EQUAL_INT32(4, back.speed);
}
