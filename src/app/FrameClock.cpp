#include "app/FrameClock.h"

namespace flicker {

SteadyFrameClock::SteadyFrameClock() : origin_(std::chrono::steady_clock::now()) {}

double SteadyFrameClock::nowSeconds() const {
  const auto elapsed = std::chrono::steady_clock::now() - origin_;
  return std::chrono::duration<double>(elapsed).count();
}

void SteadyFrameClock::restart() { origin_ = std::chrono::steady_clock::now(); }

}  // namespace flicker
