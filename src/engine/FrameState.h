#pragma once

//
// FrameState
// ----------
// The logical snapshot of one frame tick, independent of which uniform layout
// the build ships.  The builder fills one of these; packUniforms<Version>()
// narrows it into the binary block for that layout.  Keeping the logical value
// separate means adding a field to a future layout never touches the builder's
// contract, only the packer.
#include <cstdint>

#include "FrameUniforms.h"
#include "util/Annotations.h"

namespace flicker {

struct FrameState {
  float time{0.f};
  float deltaTime{0.f};

  float audioLevel{0.f};
  float audioBass{0.f};
  float audioMid{0.f};
  float audioHigh{0.f};
  float audioFreqBand{0.f};
  float audioPeak{0.f};
  float audioSmooth{0.f};

  float intensity{0.f};
  float glitchAmount{0.f};
  float speed{1.f};
  float colorShift{0.f};
  float pulseStrength{0.f};
  bool isMonochrome{false};

  Float2 resolution{};
  std::uint32_t randomSeed{0};
  std::int32_t textureCount{0};
  std::int32_t activePattern{0};

  float lastGlitchTime{0.f};
  float glitchHoldTime{0.f};
};

template <int Version>
FLICKER_MAYBE_UNUSED typename UniformLayout<Version>::type packUniforms(const FrameState& s) {
  using Layout = UniformLayout<Version>;
  typename Layout::type out{};
  out.time = s.time;
  out.deltaTime = s.deltaTime;
  out.audioLevel = s.audioLevel;
  out.audioBass = s.audioBass;
  out.audioMid = s.audioMid;
  out.audioHigh = s.audioHigh;
  out.audioFreqBand = s.audioFreqBand;
  if constexpr (Layout::kHasTransientAudio) {
    out.audioPeak = s.audioPeak;
    out.audioSmooth = s.audioSmooth;
  }
  out.intensity = s.intensity;
  out.glitchAmount = s.glitchAmount;
  out.speed = s.speed;
  out.colorShift = s.colorShift;
  out.pulseStrength = s.pulseStrength;
  out.isMonochrome = s.isMonochrome ? 1 : 0;
  out.resolution = s.resolution;
  out.randomSeed = s.randomSeed;
  out.textureCount = s.textureCount;
  out.activePattern = s.activePattern;
  if constexpr (Layout::kHasGlitchTiming) {
    out.lastGlitchTime = s.lastGlitchTime;
    out.glitchHoldTime = s.glitchHoldTime;
  }
  return out;
}

FLICKER_MAYBE_UNUSED inline FrameUniforms packActiveUniforms(const FrameState& s) {
  return packUniforms<ActiveLayout::kVersion>(s);
}

}  // namespace flicker
