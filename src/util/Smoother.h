#pragma once

//
// Single-pole leaky integrator.
// -----------------------------
// `z` carries the running state between calls and `alpha` is how far it moves
// toward `in` each step: 0 holds, 1 follows immediately.  The audio extractor
// keeps one `z` per band.
inline float smooth(float in, float &z, float alpha) {
  z += alpha * (in - z);
  return z;
}

// Peak follower: jump up to `in` instantly, otherwise decay `z` by `decay`.
inline float peakHold(float in, float &z, float decay) {
  if (in > z) {
    z = in;
  } else {
    z *= decay;
  }
  return z;
}
