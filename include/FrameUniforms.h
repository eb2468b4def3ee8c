#pragma once

//
// Frame uniform blocks.
// ---------------------
// These structs are the wire format between the CPU producer and the shaders.
// The shader side declares the same fields in the same order, so every byte
// here is load-bearing: field order, explicit padding and alignment are pinned
// by the static_asserts at the bottom of the file.  Change a layout and the
// build breaks until the offsets table is updated on purpose.
//
// Two versions exist.  V1 is the legacy compact block, V2 adds transient/smooth
// audio and glitch timing.  FLICKER_UNIFORM_LAYOUT picks exactly one of them as
// `FrameUniforms` for the whole build.
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "FlickerConfig.h"

namespace flicker {

// Texture slots the composite pass can bind.
constexpr std::int32_t kMaxTextures = 8;
// Procedural generators selectable by `activePattern`.
constexpr std::int32_t kPatternCount = 8;
constexpr std::size_t kMaxPaletteColors = 6;

// Mirrors of the shader vector types.  float2 is 8-byte aligned and float4 is
// 16-byte aligned on the GPU side, so the CPU structs must say so explicitly.
struct alignas(8) Float2 {
  float x{0.f};
  float y{0.f};
};

struct alignas(16) Float4 {
  float x{0.f};
  float y{0.f};
  float z{0.f};
  float w{0.f};
};

// Legacy compact block.
struct UniformsV1 {
  float time{0.f};            // seconds since start
  float deltaTime{0.f};       // seconds since previous frame, never negative

  float audioLevel{0.f};      // overall level
  float audioBass{0.f};       // 20-250 Hz
  float audioMid{0.f};        // 250-2000 Hz
  float audioHigh{0.f};       // 2000-20000 Hz
  float audioFreqBand{0.f};   // user-selected band

  float intensity{0.f};       // 0-1
  float glitchAmount{0.f};    // 0-1
  float speed{1.f};           // 1-4 multiplier
  float colorShift{0.f};      // 0-1
  float pulseStrength{0.f};   // 0-1
  std::int32_t isMonochrome{0};
  std::uint32_t pad0_{0};     // float2 alignment

  Float2 resolution{};
  std::uint32_t randomSeed{0};
  std::int32_t textureCount{0};
  std::int32_t activePattern{0};
  std::uint32_t pad1_{0};     // stride rounds up to 8
};

// Expanded block.
struct UniformsV2 {
  float time{0.f};
  float deltaTime{0.f};

  float audioLevel{0.f};
  float audioBass{0.f};
  float audioMid{0.f};
  float audioHigh{0.f};
  float audioFreqBand{0.f};
  float audioPeak{0.f};       // transient follower, spikes then decays
  float audioSmooth{0.f};     // slow overall level

  float intensity{0.f};
  float glitchAmount{0.f};
  float speed{1.f};
  float colorShift{0.f};
  float pulseStrength{0.f};
  std::int32_t isMonochrome{0};
  std::uint32_t pad0_{0};

  Float2 resolution{};
  std::uint32_t randomSeed{0};
  std::int32_t textureCount{0};
  std::int32_t activePattern{0};

  float lastGlitchTime{0.f};  // timestamp of the last glitch trigger
  float glitchHoldTime{0.f};  // how long that glitch freezes the frame
  std::uint32_t pad1_{0};
};

// Palette handed to the fragment stage next to the uniforms.  Entries at or
// past `colorCount` must not be read by shaders.
struct ColorPalette {
  Float4 colors[kMaxPaletteColors]{};
  std::int32_t colorCount{0};
  std::uint32_t pad_[3]{};
};

// Vertex stage output.  The core never writes one; it only shares the layout
// checks with the other blocks.
struct VertexOut {
  Float4 position{};
  Float2 texCoord{};
  std::uint32_t pad_[2]{};
};

// Build-time layout selection.  Specialisations carry the struct for a version
// number, so the rest of the code can say `UniformLayout<N>::type`.
template <int Version>
struct UniformLayout;

template <>
struct UniformLayout<1> {
  using type = UniformsV1;
  static constexpr int kVersion = 1;
  static constexpr bool kHasTransientAudio = false;
  static constexpr bool kHasGlitchTiming = false;
};

template <>
struct UniformLayout<2> {
  using type = UniformsV2;
  static constexpr int kVersion = 2;
  static constexpr bool kHasTransientAudio = true;
  static constexpr bool kHasGlitchTiming = true;
};

using ActiveLayout = UniformLayout<FlickerConfig::kUniformLayout>;
using FrameUniforms = ActiveLayout::type;

// ABI table ----------------------------------------------------------------

static_assert(sizeof(Float2) == 8 && alignof(Float2) == 8, "float2 mirror drifted");
static_assert(sizeof(Float4) == 16 && alignof(Float4) == 16, "float4 mirror drifted");

static_assert(std::is_standard_layout<UniformsV1>::value, "V1 must stay standard layout");
static_assert(std::is_trivially_copyable<UniformsV1>::value, "V1 must stay memcpy-able");
static_assert(offsetof(UniformsV1, time) == 0, "V1 layout");
static_assert(offsetof(UniformsV1, audioLevel) == 8, "V1 layout");
static_assert(offsetof(UniformsV1, audioFreqBand) == 24, "V1 layout");
static_assert(offsetof(UniformsV1, intensity) == 28, "V1 layout");
static_assert(offsetof(UniformsV1, pulseStrength) == 44, "V1 layout");
static_assert(offsetof(UniformsV1, isMonochrome) == 48, "V1 layout");
static_assert(offsetof(UniformsV1, resolution) == 56, "V1 layout");
static_assert(offsetof(UniformsV1, randomSeed) == 64, "V1 layout");
static_assert(offsetof(UniformsV1, textureCount) == 68, "V1 layout");
static_assert(offsetof(UniformsV1, activePattern) == 72, "V1 layout");
static_assert(sizeof(UniformsV1) == 80, "V1 stride");

static_assert(std::is_standard_layout<UniformsV2>::value, "V2 must stay standard layout");
static_assert(std::is_trivially_copyable<UniformsV2>::value, "V2 must stay memcpy-able");
static_assert(offsetof(UniformsV2, time) == 0, "V2 layout");
static_assert(offsetof(UniformsV2, audioFreqBand) == 24, "V2 layout");
static_assert(offsetof(UniformsV2, audioPeak) == 28, "V2 layout");
static_assert(offsetof(UniformsV2, audioSmooth) == 32, "V2 layout");
static_assert(offsetof(UniformsV2, intensity) == 36, "V2 layout");
static_assert(offsetof(UniformsV2, pulseStrength) == 52, "V2 layout");
static_assert(offsetof(UniformsV2, isMonochrome) == 56, "V2 layout");
static_assert(offsetof(UniformsV2, resolution) == 64, "V2 layout");
static_assert(offsetof(UniformsV2, randomSeed) == 72, "V2 layout");
static_assert(offsetof(UniformsV2, textureCount) == 76, "V2 layout");
static_assert(offsetof(UniformsV2, activePattern) == 80, "V2 layout");
static_assert(offsetof(UniformsV2, lastGlitchTime) == 84, "V2 layout");
static_assert(offsetof(UniformsV2, glitchHoldTime) == 88, "V2 layout");
static_assert(sizeof(UniformsV2) == 96, "V2 stride");

static_assert(std::is_trivially_copyable<ColorPalette>::value, "palette must stay memcpy-able");
static_assert(offsetof(ColorPalette, colorCount) == 96, "palette layout");
static_assert(sizeof(ColorPalette) == 112, "palette stride");

static_assert(offsetof(VertexOut, texCoord) == 16, "vertex layout");
static_assert(sizeof(VertexOut) == 32, "vertex stride");

}  // namespace flicker
