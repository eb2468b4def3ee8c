#pragma once

//
// FrameSession.h
// --------------
// The producer side of the renderer in one object.  It owns the live controls,
// the glitch timer, the palette buffer and the frame builder, and once per
// frame tick it turns them into one published uniform block.  The render
// submission side only ever calls latestUniforms()/latestPalette().
//
// Threads:
//   - control thread: tick(), requestReset(), setResolution(), loadPack(),
//     clearPack(), setPalette(), controls().  These must not overlap.
//   - audio thread:   publishAudio().
//   - render thread:  latestUniforms(), latestPalette().
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "FrameUniforms.h"
#include "app/ControlState.h"
#include "app/FrameClock.h"
#include "app/Pack.h"
#include "audio/AudioFeatureExtractor.h"
#include "engine/FrameState.h"
#include "engine/GlitchTimer.h"
#include "engine/PaletteBuffer.h"
#include "engine/UniformBuilder.h"
#include "util/SnapshotExchange.h"

namespace flicker {

class FrameSession {
public:
  struct Config {
    // 0 asks the seed source for a boot seed.
    std::uint32_t initialSeed{0};
    GlitchPolicyConfig glitch{};
  };

  struct FrameReport {
    std::uint64_t frameIndex{0};
    std::uint8_t anomalies{0};
    bool reseeded{false};
    bool glitchTriggered{false};
    GlitchTimer::State glitchState{GlitchTimer::State::kIdle};
    std::uint32_t seed{0};
  };

  explicit FrameSession(FrameClock& clock);
  // `seeds` and `policy` are optional overrides and must outlive the session.
  FrameSession(FrameClock& clock, const Config& config, SeedSource* seeds = nullptr,
               GlitchPolicy* policy = nullptr);

  // Producer loop ----------------------------------------------------------

  // Build and publish one frame.  A pending reset is applied first: new seed,
  // pattern derived from it, glitch timer back to Idle.
  FrameReport tick();

  // Ask for a visual reset.  Nothing changes until the next tick().
  void requestReset() { resetRequested_ = true; }
  bool resetPending() const { return resetRequested_; }

  // Drawable size in pixels.  Non-positive or non-finite sizes are ignored.
  bool setResolution(float width, float height);

  ControlState& controls() { return controls_; }
  const ControlState& controls() const { return controls_; }

  // Packs ------------------------------------------------------------------

  // Apply settings and up to kMaxPaletteColors palette entries.
  bool loadPack(const Pack& pack);
  // Parse then apply; malformed manifests change nothing.
  bool loadPackJson(std::string_view json);
  // Back to the default look with an empty palette.
  void clearPack();
  const std::string& activePackId() const { return activePackId_; }

  PaletteError setPalette(const std::vector<Float4>& colors) { return palette_.setPalette(colors); }

  // Audio thread -----------------------------------------------------------

  void publishAudio(const AudioSample& sample) { audio_.publish(sample); }

  // Render thread ----------------------------------------------------------
  // All-zero blocks until the first tick() publishes.

  FrameUniforms latestUniforms() { return uniforms_.acquire(); }
  ColorPalette latestPalette() { return palette_.acquire(); }

  // Introspection ----------------------------------------------------------

  const FrameState& lastFrame() const { return lastFrame_; }
  std::uint32_t seed() const { return builder_.seed(); }
  std::uint64_t frameCount() const { return frameCount_; }
  const GlitchTimer& glitchTimer() const { return glitch_; }
  const PaletteBuffer& palette() const { return palette_; }

private:
  void applyReset(double nowSeconds);
  void logNewAnomalies(std::uint8_t anomalies);

  FrameClock& clock_;
  ControlState controls_{};

  SeededGlitchPolicy defaultPolicy_;
  GlitchTimer glitch_;
  UniformStateBuilder builder_;
  PaletteBuffer palette_{};

  SnapshotExchange<AudioSample> audio_{};
  SnapshotExchange<FrameUniforms> uniforms_{};

  FrameState lastFrame_{};
  bool hasPrevious_{false};
  double previousSeconds_{0.0};
  bool resetRequested_{false};
  std::uint8_t lastAnomalies_{0};
  std::uint64_t frameCount_{0};
  std::string activePackId_{};
};

}  // namespace flicker
