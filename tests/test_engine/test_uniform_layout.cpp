#include <unity.h>

#include <cstddef>

#include "FrameUniforms.h"
#include "engine/FrameState.h"

using flicker::FrameState;
using flicker::UniformsV1;
using flicker::UniformsV2;

namespace {

FrameState sampleState() {
  FrameState s{};
  s.time = 12.5f;
  s.deltaTime = 0.016f;
  s.audioLevel = 0.4f;
  s.audioPeak = 0.95f;
  s.audioSmooth = 0.3f;
  s.speed = 2.f;
  s.isMonochrome = true;
  s.resolution = flicker::Float2{800.f, 600.f};
  s.randomSeed = 0xDEADBEEFu;
  s.textureCount = 4;
  s.activePattern = 6;
  s.lastGlitchTime = 11.9f;
  s.glitchHoldTime = 0.3f;
  return s;
}

}  // namespace

void test_layout_matches_shader_offsets() {
  TEST_ASSERT_EQUAL_size_t(80, sizeof(UniformsV1));
  TEST_ASSERT_EQUAL_size_t(56, offsetof(UniformsV1, resolution));
  TEST_ASSERT_EQUAL_size_t(72, offsetof(UniformsV1, activePattern));

  TEST_ASSERT_EQUAL_size_t(96, sizeof(UniformsV2));
  TEST_ASSERT_EQUAL_size_t(28, offsetof(UniformsV2, audioPeak));
  TEST_ASSERT_EQUAL_size_t(64, offsetof(UniformsV2, resolution));
  TEST_ASSERT_EQUAL_size_t(84, offsetof(UniformsV2, lastGlitchTime));
  TEST_ASSERT_EQUAL_size_t(88, offsetof(UniformsV2, glitchHoldTime));

  TEST_ASSERT_EQUAL_size_t(112, sizeof(flicker::ColorPalette));
  TEST_ASSERT_EQUAL_size_t(96, offsetof(flicker::ColorPalette, colorCount));
  TEST_ASSERT_EQUAL_size_t(32, sizeof(flicker::VertexOut));
}

void test_pack_v1_keeps_shared_fields() {
  const UniformsV1 u = flicker::packUniforms<1>(sampleState());
  TEST_ASSERT_EQUAL_FLOAT(12.5f, u.time);
  TEST_ASSERT_EQUAL_FLOAT(0.4f, u.audioLevel);
  TEST_ASSERT_EQUAL_INT32(1, u.isMonochrome);
  TEST_ASSERT_EQUAL_FLOAT(800.f, u.resolution.x);
  TEST_ASSERT_EQUAL_HEX32(0xDEADBEEFu, u.randomSeed);
  TEST_ASSERT_EQUAL_INT32(4, u.textureCount);
  TEST_ASSERT_EQUAL_INT32(6, u.activePattern);
  TEST_ASSERT_EQUAL_UINT32(0u, u.pad0_);
  TEST_ASSERT_EQUAL_UINT32(0u, u.pad1_);
}

void test_pack_v2_carries_transients_and_glitch_timing() {
  const UniformsV2 u = flicker::packUniforms<2>(sampleState());
  TEST_ASSERT_EQUAL_FLOAT(0.95f, u.audioPeak);
  TEST_ASSERT_EQUAL_FLOAT(0.3f, u.audioSmooth);
  TEST_ASSERT_EQUAL_FLOAT(11.9f, u.lastGlitchTime);
  TEST_ASSERT_EQUAL_FLOAT(0.3f, u.glitchHoldTime);
  TEST_ASSERT_EQUAL_FLOAT(600.f, u.resolution.y);
  TEST_ASSERT_EQUAL_INT32(6, u.activePattern);
}

void test_active_layout_matches_build_flag() {
  TEST_ASSERT_EQUAL_INT(FLICKER_UNIFORM_LAYOUT, flicker::ActiveLayout::kVersion);
  TEST_ASSERT_EQUAL_size_t(sizeof(flicker::UniformLayout<FLICKER_UNIFORM_LAYOUT>::type),
                           sizeof(flicker::FrameUniforms));
}
