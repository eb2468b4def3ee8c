#pragma once

//
// Frame clock abstractions.
// -------------------------
// The frame session never reads the wall clock directly.  It asks a FrameClock
// for "seconds since this session started", which lets the live host run off
// std::chrono and lets tests and the headless example step time by hand.
#include <chrono>

namespace flicker {

class FrameClock {
public:
  virtual ~FrameClock() = default;

  // Seconds since the clock's origin.  Implementations should be monotonic;
  // the session copes (and reports it) when they are not.
  virtual double nowSeconds() const = 0;
};

// Live clock: steady_clock, origin at construction or the last restart().
class SteadyFrameClock : public FrameClock {
public:
  SteadyFrameClock();

  double nowSeconds() const override;
  void restart();

private:
  std::chrono::steady_clock::time_point origin_;
};

// Hand-cranked clock for tests, renders-to-disk and the headless example.
class ManualFrameClock : public FrameClock {
public:
  explicit ManualFrameClock(double startSeconds = 0.0) : now_(startSeconds) {}

  double nowSeconds() const override { return now_; }

  void set(double seconds) { now_ = seconds; }
  void advance(double seconds) { now_ += seconds; }

private:
  double now_{0.0};
};

}  // namespace flicker
