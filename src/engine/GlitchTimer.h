#pragma once

//
// Glitch timing.
// --------------
// The stutter effect is a two-state machine:
//
//   Idle --(policy fires)--> Glitching(holdUntil) --(now >= holdUntil)--> Idle
//
// The timer only keeps time.  Whether to fire and how long to hold is asked of
// a GlitchPolicy, and what "holding" looks like on screen is up to the shaders,
// which read `lastGlitchTime` / `glitchHoldTime` out of the uniform block.
#include <cstdint>

namespace flicker {

struct GlitchDecision {
  bool trigger{false};
  float holdSeconds{0.f};
  float probability{0.f};
};

// Pluggable trigger policy.  Implementations must be monotonic non-decreasing
// in both `glitchAmount` and `audioPeak`, and must never fire when
// `glitchAmount` is zero.
class GlitchPolicy {
public:
  virtual ~GlitchPolicy() = default;

  virtual GlitchDecision evaluate(float glitchAmount, float audioPeak, float nowSeconds) = 0;

  // Called on every visual reset so seeded policies replay per seed.
  virtual void reseed(std::uint32_t) {}
};

struct GlitchPolicyConfig {
  // Per-frame chance at glitchAmount = 1 with a silent input.
  float baseChance{0.02f};
  // Extra per-frame chance per unit of audioPeak at glitchAmount = 1.
  float peakGain{0.18f};
  float minHoldSeconds{0.05f};
  float maxHoldSeconds{0.40f};
};

// Default policy: probability = amount * (baseChance + peakGain * peak), rolled
// against a xorshift stream seeded from the frame seed.  Hold time grows
// linearly with amount between the configured bounds.
class SeededGlitchPolicy : public GlitchPolicy {
public:
  explicit SeededGlitchPolicy(GlitchPolicyConfig config = {}, std::uint32_t seed = 0);

  GlitchDecision evaluate(float glitchAmount, float audioPeak, float nowSeconds) override;
  void reseed(std::uint32_t seed) override { state_ = seed; }

  float probability(float glitchAmount, float audioPeak) const;
  float holdFor(float glitchAmount) const;

  const GlitchPolicyConfig& config() const { return config_; }

private:
  GlitchPolicyConfig config_;
  std::uint32_t state_{0};
};

class GlitchTimer {
public:
  enum class State : std::uint8_t { kIdle = 0, kGlitching };

  explicit GlitchTimer(GlitchPolicy* policy = nullptr) : policy_(policy) {}

  void attachPolicy(GlitchPolicy* policy) { policy_ = policy; }
  GlitchPolicy* policy() const { return policy_; }

  // One frame of the state machine: expire a finished hold, then (only when
  // Idle) ask the policy whether to fire.  Returns the state for `now`.
  State update(float nowSeconds, float glitchAmount, float audioPeak);

  // Force a trigger at `now`.  Ignored while a hold is still running.
  bool trigger(float nowSeconds, float holdSeconds);

  // Pure query: Glitching exactly for now in [lastGlitchTime, lastGlitchTime + hold).
  State state(float nowSeconds) const;
  bool glitching(float nowSeconds) const { return state(nowSeconds) == State::kGlitching; }

  float lastGlitchTime() const { return lastGlitchTime_; }
  float holdTime() const { return holdTime_; }
  float holdUntil() const { return lastGlitchTime_ + holdTime_; }
  std::uint32_t triggerCount() const { return triggerCount_; }

  // Back to the initial state: Idle, both timestamps zero.
  void reset();

private:
  GlitchPolicy* policy_{nullptr};
  State state_{State::kIdle};
  float lastGlitchTime_{0.f};
  float holdTime_{0.f};
  std::uint32_t triggerCount_{0};
};

const char* glitchStateLabel(GlitchTimer::State state);

}  // namespace flicker
