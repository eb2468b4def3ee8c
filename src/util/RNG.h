#pragma once
#include <cstdint>

namespace RNG {

//
// xorshift
// --------
// The one pseudo-random generator in the pipeline.  Every seed-derived choice
// (glitch rolls, the next reset seed) walks this generator from a state the
// caller owns, so the same `randomSeed` replays the same visuals.
inline uint32_t xorshift(uint32_t& state) {
  // Zero is a fixed point of xorshift, so swap in Marsaglia's constant.
  uint32_t x = state ? state : 2463534242u;
  x ^= x << 13;
  x ^= x >> 17;
  x ^= x << 5;
  state = x;
  return x;
}

// 0..1 with 24 bits of mantissa.
inline float uniform01(uint32_t& state) {
  return (xorshift(state) >> 8) * (1.0f / 16777216.0f);
}

// Fold two words into one well-mixed word (murmur3 finaliser on a ^ rotated b).
// Used to stir clock bits into a seed without losing the previous seed's
// history.
inline uint32_t mix(uint32_t a, uint32_t b) {
  uint32_t h = a ^ ((b << 16) | (b >> 16));
  h ^= h >> 16;
  h *= 0x85ebca6bu;
  h ^= h >> 13;
  h *= 0xc2b2ae35u;
  h ^= h >> 16;
  return h;
}

} // namespace RNG
