#include "engine/UniformBuilder.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <random>

#include "util/Log.h"

#include "util/RNG.h"

namespace flicker {

std::uint32_t ClockMixedSeedSource::draw(std::uint32_t previous, double nowSeconds) {
  ++draws_;
  // Sessions never run for 1e9 seconds; the cap only keeps the cast defined.
  const double seconds = (nowSeconds > 0.0) ? std::min(nowSeconds, 1.0e9) : 0.0;
  const auto clockBits = static_cast<std::uint64_t>(std::floor(seconds * 1.0e6));
  const std::uint32_t folded = static_cast<std::uint32_t>(clockBits ^ (clockBits >> 32));
  std::uint32_t state = RNG::mix(previous, folded ^ (draws_ * 0x9E3779B9u));
  std::uint32_t next = RNG::xorshift(state);
  if (next == previous) {
    next = RNG::xorshift(state);
  }
  return next;
}

std::uint32_t ClockMixedSeedSource::boot(double nowSeconds) {
  std::uint32_t entropy = 0;
  try {
    std::random_device device;
    entropy = device();
  } catch (const std::exception& e) {
    log::warn("seed", "random_device unavailable (%s), boot seed from wall clock only", e.what());
  }
  const auto wall = std::chrono::system_clock::now().time_since_epoch();
  const auto wallBits = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(wall).count());
  const std::uint32_t folded = static_cast<std::uint32_t>(wallBits ^ (wallBits >> 32));
  return draw(RNG::mix(entropy, folded), nowSeconds);
}

UniformStateBuilder::UniformStateBuilder(std::uint32_t initialSeed, SeedSource* seedSource)
    : seedSource_(seedSource ? seedSource : &defaultSource_), seed_(initialSeed) {}

std::int32_t UniformStateBuilder::clampPattern(std::int32_t pattern, bool* clamped) {
  const std::int32_t out = std::clamp<std::int32_t>(pattern, 0, kPatternCount - 1);
  if (clamped) {
    *clamped = (out != pattern);
  }
  return out;
}

std::int32_t UniformStateBuilder::clampTextureCount(std::int32_t count, bool* clamped) {
  const std::int32_t out = std::clamp<std::int32_t>(count, 0, kMaxTextures);
  if (clamped) {
    *clamped = (out != count);
  }
  return out;
}

float UniformStateBuilder::deltaSeconds(const Inputs& in, bool* regressed) {
  if (regressed) {
    *regressed = false;
  }
  if (!in.hasPrevious) {
    return 0.f;
  }
  const double delta = in.nowSeconds - in.previousSeconds;
  if (delta < 0.0 && regressed) {
    *regressed = true;
  }
  return (delta > 0.0) ? static_cast<float>(delta) : 0.f;
}

std::uint32_t UniformStateBuilder::reseed(double nowSeconds) {
  seed_ = seedSource_->draw(seed_, nowSeconds);
  return seed_;
}

std::uint32_t UniformStateBuilder::bootSeed(double nowSeconds) {
  seed_ = seedSource_->boot(nowSeconds);
  return seed_;
}

FrameState UniformStateBuilder::build(const Inputs& in, Report* report) {
  Report local{};
  if (in.resetRequested) {
    reseed(in.nowSeconds);
    local.reseeded = true;
  }

  FrameState s{};

  bool regressed = false;
  s.time = (in.nowSeconds > 0.0) ? static_cast<float>(in.nowSeconds) : 0.f;
  s.deltaTime = deltaSeconds(in, &regressed);
  if (regressed) {
    local.anomalies |= anomalyMask(FrameAnomaly::kClockRegression);
  }

  s.audioLevel = in.audio.level;
  s.audioBass = in.audio.bass;
  s.audioMid = in.audio.mid;
  s.audioHigh = in.audio.high;
  s.audioFreqBand = in.audio.band;
  s.audioPeak = in.audio.peak;
  s.audioSmooth = in.audio.smooth;

  const ControlState& c = in.controls;
  s.intensity = c.intensity;
  s.glitchAmount = c.glitchAmount;
  s.speed = c.speed;
  s.colorShift = c.colorShift;
  s.pulseStrength = c.pulseStrength;
  s.isMonochrome = c.isMonochrome;
  s.resolution = c.resolution;

  bool clamped = false;
  s.activePattern = clampPattern(c.activePattern, &clamped);
  if (clamped) {
    local.anomalies |= anomalyMask(FrameAnomaly::kPatternOutOfRange);
  }
  s.textureCount = clampTextureCount(c.textureCount, &clamped);
  if (clamped) {
    local.anomalies |= anomalyMask(FrameAnomaly::kTextureCountOutOfRange);
  }

  s.randomSeed = seed_;
  s.lastGlitchTime = in.glitch.lastGlitchTime;
  s.glitchHoldTime = in.glitch.glitchHoldTime;

  if (report) {
    *report = local;
  }
  return s;
}

}  // namespace flicker
