#pragma once

//
// UniformStateBuilder
// -------------------
// Assembles one FrameState from inputs that already exist when the frame
// starts: the control snapshot, the latest audio sample, two timestamps and
// the glitch timer's stamp.  It never waits on anything and never smooths or
// filters; audio and control scalars pass through untouched so each field has
// exactly one source of truth.
//
// The only state the builder owns is the random seed.  Past the boot draw it
// changes in one place (reseed), and only when a reset is asked for.
#include <cstdint>

#include "app/ControlState.h"
#include "audio/AudioFeatureExtractor.h"
#include "engine/FrameState.h"

namespace flicker {

// Non-fatal input problems, recovered locally and reported per frame.
enum class FrameAnomaly : std::uint8_t {
  kClockRegression = 1u << 0,       // now < previous; deltaTime forced to 0
  kPatternOutOfRange = 1u << 1,     // activePattern clamped into [0, kPatternCount)
  kTextureCountOutOfRange = 1u << 2,  // textureCount clamped into [0, kMaxTextures]
};

constexpr std::uint8_t anomalyMask(FrameAnomaly anomaly) {
  return static_cast<std::uint8_t>(anomaly);
}

constexpr bool hasAnomaly(std::uint8_t mask, FrameAnomaly anomaly) {
  return (mask & anomalyMask(anomaly)) != 0;
}

// Where new seeds come from on a reset.
class SeedSource {
public:
  virtual ~SeedSource() = default;
  // Must return something other than `previous`.
  virtual std::uint32_t draw(std::uint32_t previous, double nowSeconds) = 0;
  // Seed for a session that was not handed one.  Session clocks all start at
  // 0, so sources that want a different boot seed per launch override this.
  virtual std::uint32_t boot(double nowSeconds) { return draw(0u, nowSeconds); }
};

// Default source: stir the session clock and a draw counter into the previous
// seed, then step xorshift once.  The boot seed also folds in
// std::random_device and the wall clock.
class ClockMixedSeedSource : public SeedSource {
public:
  std::uint32_t draw(std::uint32_t previous, double nowSeconds) override;
  std::uint32_t boot(double nowSeconds) override;

private:
  std::uint32_t draws_{0};
};

struct GlitchStamp {
  float lastGlitchTime{0.f};
  float glitchHoldTime{0.f};
};

class UniformStateBuilder {
public:
  struct Inputs {
    ControlState controls{};
    AudioSample audio{};
    double nowSeconds{0.0};
    // First frame has no previous timestamp; deltaTime is then 0.
    bool hasPrevious{false};
    double previousSeconds{0.0};
    GlitchStamp glitch{};
    bool resetRequested{false};
  };

  struct Report {
    std::uint8_t anomalies{0};
    bool reseeded{false};
  };

  explicit UniformStateBuilder(std::uint32_t initialSeed = 0, SeedSource* seedSource = nullptr);

  // Produce the frame.  Only mutates the builder when `in.resetRequested`.
  FrameState build(const Inputs& in, Report* report = nullptr);

  // Draw a fresh seed.  This is the one mutation point for `randomSeed`
  // once the session is running.
  std::uint32_t reseed(double nowSeconds);
  // Replace the seed with the source's boot seed.  Only called before the
  // first frame.
  std::uint32_t bootSeed(double nowSeconds);

  std::uint32_t seed() const { return seed_; }
  void attachSeedSource(SeedSource* source) { seedSource_ = source ? source : &defaultSource_; }

  static std::int32_t clampPattern(std::int32_t pattern, bool* clamped = nullptr);
  static std::int32_t clampTextureCount(std::int32_t count, bool* clamped = nullptr);
  static float deltaSeconds(const Inputs& in, bool* regressed = nullptr);

private:
  ClockMixedSeedSource defaultSource_{};
  SeedSource* seedSource_{nullptr};
  std::uint32_t seed_{0};
};

}  // namespace flicker
