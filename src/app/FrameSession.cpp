#include "app/FrameSession.h"

#include <cmath>

#include "util/Log.h"

namespace flicker {

namespace {

std::int32_t patternForSeed(std::uint32_t seed) {
  return static_cast<std::int32_t>(seed % static_cast<std::uint32_t>(kPatternCount));
}

}  // namespace

FrameSession::FrameSession(FrameClock& clock) : FrameSession(clock, Config{}) {}

FrameSession::FrameSession(FrameClock& clock, const Config& config, SeedSource* seeds,
                           GlitchPolicy* policy)
    : clock_(clock),
      defaultPolicy_(config.glitch),
      glitch_(policy ? policy : &defaultPolicy_),
      builder_(config.initialSeed, seeds) {
  if (config.initialSeed == 0) {
    builder_.bootSeed(clock_.nowSeconds());
  }
  controls_.activePattern = patternForSeed(builder_.seed());
  glitch_.policy()->reseed(builder_.seed());
  log::info("session", "boot seed=%08lx pattern=%d layout=v%d",
            static_cast<unsigned long>(builder_.seed()), static_cast<int>(controls_.activePattern),
            ActiveLayout::kVersion);
}

void FrameSession::applyReset(double nowSeconds) {
  const std::uint32_t next = builder_.reseed(nowSeconds);
  controls_.activePattern = patternForSeed(next);
  glitch_.reset();
  glitch_.policy()->reseed(next);
  log::info("session", "reset seed=%08lx pattern=%d", static_cast<unsigned long>(next),
            static_cast<int>(controls_.activePattern));
}

void FrameSession::logNewAnomalies(std::uint8_t anomalies) {
  // Only the rising edge; a stuck clock or controller would otherwise log
  // every frame.
  const std::uint8_t fresh = static_cast<std::uint8_t>(anomalies & ~lastAnomalies_);
  lastAnomalies_ = anomalies;
  if (hasAnomaly(fresh, FrameAnomaly::kClockRegression)) {
    log::warn("session", "clock went backwards at frame %llu, deltaTime held at 0",
              static_cast<unsigned long long>(frameCount_));
  }
  if (hasAnomaly(fresh, FrameAnomaly::kPatternOutOfRange)) {
    log::warn("session", "activePattern %d out of range, clamped",
              static_cast<int>(controls_.activePattern));
  }
  if (hasAnomaly(fresh, FrameAnomaly::kTextureCountOutOfRange)) {
    log::warn("session", "textureCount %d out of range, clamped",
              static_cast<int>(controls_.textureCount));
  }
}

FrameSession::FrameReport FrameSession::tick() {
  const double now = clock_.nowSeconds();
  const float nowF = (now > 0.0) ? static_cast<float>(now) : 0.f;
  const AudioSample audio = audio_.acquire();

  FrameReport report{};
  report.frameIndex = frameCount_;

  if (resetRequested_) {
    resetRequested_ = false;
    applyReset(now);
    report.reseeded = true;
  } else {
    const std::uint32_t before = glitch_.triggerCount();
    glitch_.update(nowF, controls_.glitchAmount, audio.peak);
    report.glitchTriggered = glitch_.triggerCount() != before;
  }

  UniformStateBuilder::Inputs in{};
  in.controls = controls_;
  in.audio = audio;
  in.nowSeconds = now;
  in.hasPrevious = hasPrevious_;
  in.previousSeconds = previousSeconds_;
  in.glitch.lastGlitchTime = glitch_.lastGlitchTime();
  in.glitch.glitchHoldTime = glitch_.holdTime();

  UniformStateBuilder::Report built{};
  lastFrame_ = builder_.build(in, &built);
  uniforms_.publish(packActiveUniforms(lastFrame_));

  report.anomalies = built.anomalies;
  report.glitchState = glitch_.state(nowF);
  report.seed = lastFrame_.randomSeed;
  logNewAnomalies(built.anomalies);

  hasPrevious_ = true;
  previousSeconds_ = now;
  ++frameCount_;
  return report;
}

bool FrameSession::setResolution(float width, float height) {
  if (!(width > 0.f) || !(height > 0.f) || !std::isfinite(width) || !std::isfinite(height)) {
    log::warn("session", "ignoring drawable size %gx%g", static_cast<double>(width),
              static_cast<double>(height));
    return false;
  }
  controls_.resolution = Float2{width, height};
  return true;
}

bool FrameSession::loadPack(const Pack& pack) {
  std::size_t skipped = 0;
  const std::vector<Float4> colors = pack.paletteColors(&skipped);
  if (skipped > 0) {
    log::warn("pack", "%s: skipped %zu malformed palette entries", pack.id.c_str(), skipped);
  }
  const PaletteError err = palette_.setPalette(colors);
  if (err != PaletteError::kNone) {
    log::error("pack", "%s: palette rejected (%s)", pack.id.c_str(), paletteErrorLabel(err));
    return false;
  }
  applyPackSettings(pack.settings, controls_);
  activePackId_ = pack.id;
  log::info("pack", "loaded %s (%zu colors)", pack.id.c_str(), colors.size());
  return true;
}

bool FrameSession::loadPackJson(std::string_view json) {
  Pack pack{};
  if (!Pack::deserialize(json, pack)) {
    log::warn("pack", "rejected malformed manifest (%zu bytes)", json.size());
    return false;
  }
  return loadPack(pack);
}

void FrameSession::clearPack() {
  palette_.clear();
  applyPackSettings(captureSettings(ControlState{}), controls_);
  activePackId_.clear();
}

}  // namespace flicker
