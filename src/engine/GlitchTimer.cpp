#include "engine/GlitchTimer.h"

#include <algorithm>

#include "FlickerConfig.h"
#include "util/Log.h"
#include "util/RNG.h"

namespace flicker {

namespace {

// NaN and negatives collapse to 0 so a malformed control can't make the
// probability misbehave.
float clamp01(float v) {
  if (!(v > 0.f)) {
    return 0.f;
  }
  return std::min(v, 1.f);
}

}  // namespace

const char* glitchStateLabel(GlitchTimer::State state) {
  switch (state) {
    case GlitchTimer::State::kGlitching: return "Glitching";
    case GlitchTimer::State::kIdle:
    default: return "Idle";
  }
}

SeededGlitchPolicy::SeededGlitchPolicy(GlitchPolicyConfig config, std::uint32_t seed)
    : config_(config), state_(seed) {}

float SeededGlitchPolicy::probability(float glitchAmount, float audioPeak) const {
  const float amount = clamp01(glitchAmount);
  const float peak = clamp01(audioPeak);
  const float base = std::max(config_.baseChance, 0.f);
  const float gain = std::max(config_.peakGain, 0.f);
  return clamp01(amount * (base + gain * peak));
}

float SeededGlitchPolicy::holdFor(float glitchAmount) const {
  const float lo = std::max(config_.minHoldSeconds, 0.f);
  const float hi = std::max(config_.maxHoldSeconds, lo);
  return lo + clamp01(glitchAmount) * (hi - lo);
}

GlitchDecision SeededGlitchPolicy::evaluate(float glitchAmount, float audioPeak, float) {
  GlitchDecision decision{};
  decision.probability = probability(glitchAmount, audioPeak);
  if (decision.probability <= 0.f) {
    return decision;
  }
  // Only roll when there is a chance at all, so a zero glitch amount leaves the
  // seeded stream untouched.
  const float roll = RNG::uniform01(state_);
  if (roll < decision.probability) {
    decision.trigger = true;
    decision.holdSeconds = holdFor(glitchAmount);
  }
  return decision;
}

GlitchTimer::State GlitchTimer::state(float nowSeconds) const {
  if (state_ != State::kGlitching) {
    return State::kIdle;
  }
  if (nowSeconds >= lastGlitchTime_ && nowSeconds < holdUntil()) {
    return State::kGlitching;
  }
  return State::kIdle;
}

GlitchTimer::State GlitchTimer::update(float nowSeconds, float glitchAmount, float audioPeak) {
  if (state_ == State::kGlitching) {
    // A clock that stepped back before the stamp ends the hold as well.
    if (nowSeconds >= holdUntil() || nowSeconds < lastGlitchTime_) {
      state_ = State::kIdle;
    } else {
      return State::kGlitching;
    }
  }

  if (!policy_) {
    return State::kIdle;
  }

  const GlitchDecision decision = policy_->evaluate(glitchAmount, audioPeak, nowSeconds);
  if (decision.trigger) {
    trigger(nowSeconds, decision.holdSeconds);
    if constexpr (FlickerConfig::kGlitchDebug) {
      log::debug("glitch", "fire t=%.3f p=%.4f hold=%.3f", static_cast<double>(nowSeconds),
                 static_cast<double>(decision.probability), static_cast<double>(holdTime_));
    }
  }
  return state(nowSeconds);
}

bool GlitchTimer::trigger(float nowSeconds, float holdSeconds) {
  if (state(nowSeconds) == State::kGlitching) {
    return false;
  }
  lastGlitchTime_ = nowSeconds;
  holdTime_ = (holdSeconds > 0.f) ? holdSeconds : 0.f;
  state_ = (holdTime_ > 0.f) ? State::kGlitching : State::kIdle;
  ++triggerCount_;
  return true;
}

void GlitchTimer::reset() {
  state_ = State::kIdle;
  lastGlitchTime_ = 0.f;
  holdTime_ = 0.f;
}

}  // namespace flicker
