#pragma once

//
// ControlState.h
// --------------
// Everything the performer can dial in, in one plain struct.  The control
// router and pack loader write it; the frame builder reads it once per tick.
// Defaults match a fresh session with no pack loaded.
#include <cstdint>

#include "FrameUniforms.h"

namespace flicker {

struct ControlState {
  // Look -------------------
  float intensity{0.72f};      // 0..1, saturation and overall drive
  float glitchAmount{0.35f};   // 0..1, glitch probability and severity
  float speed{2.f};            // 1..4 time multiplier
  float colorShift{0.15f};     // 0..1
  float pulseStrength{0.6f};   // 0..1, how hard visuals follow beats
  bool isMonochrome{false};

  // Selection --------------
  // Both are range-checked by the frame builder, not here, so a malformed
  // value from a controller shows up as an anomaly instead of vanishing.
  std::int32_t activePattern{0};
  std::int32_t textureCount{0};

  // Surface ----------------
  Float2 resolution{1920.f, 1080.f};

  // Analysis band the extractor reports as `band`, in Hz.
  float freqMin{80.f};
  float freqMax{4200.f};

  // Carried for packs; the pipeline itself does not pace frames.
  std::int32_t targetFps{30};
};

// Domain limits shared by the router and the pack loader.
constexpr float kSpeedMin = 1.f;
constexpr float kSpeedMax = 4.f;
constexpr float kFreqFloorHz = 20.f;
constexpr float kFreqCeilingHz = 20000.f;
constexpr std::int32_t kTargetFpsMin = 15;
constexpr std::int32_t kTargetFpsMax = 60;

}  // namespace flicker
