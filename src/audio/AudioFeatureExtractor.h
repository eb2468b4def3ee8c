#pragma once

//
// Audio feature extraction.
// -------------------------
// Turns one magnitude spectrum per analysis tick into the seven numbers the
// uniform block carries.  Capture and the FFT itself happen upstream; this
// class only does band averaging, smoothing and peak following, so it can run
// on whatever thread owns the audio callback and hand its result over through
// a snapshot exchange.
//
// Fixed bands: bass 20-250 Hz, mid 250-2000 Hz, high 2-20 kHz.  The fourth,
// user band comes from the controls.
#include <cstddef>
#include <cstdint>

namespace flicker {

struct AudioSample {
  float level{0.f};    // smoothed overall level
  float bass{0.f};
  float mid{0.f};
  float high{0.f};
  float band{0.f};     // user-selected band
  float peak{0.f};     // transient follower
  float smooth{0.f};   // slow overall level
};

// Raw, unsmoothed band levels.  Hosts that already analyse audio elsewhere can
// feed these directly.
struct BandLevels {
  float overall{0.f};
  float bass{0.f};
  float mid{0.f};
  float high{0.f};
  float band{0.f};
};

struct AudioFeatureConfig {
  float sampleRate{44100.f};
  // Magnitude-to-level gain before the 0..1 cap.
  float gain{10.f};
  // One-pole coefficients as "how much of the old value survives".
  float bandRetain{0.7f};
  float smoothRetain{0.7f};
  // Peak follower decay per tick.
  float peakDecay{0.95f};
};

class AudioFeatureExtractor {
public:
  explicit AudioFeatureExtractor(AudioFeatureConfig config = {});

  // `magnitudes` holds `binCount` bins of an FFT of size 2 * binCount.
  const AudioSample& processSpectrum(const float* magnitudes, std::size_t binCount,
                                     float freqMinHz, float freqMaxHz);

  // Skip band analysis and run only the smoothing / peak stages.
  const AudioSample& processLevels(const BandLevels& raw);

  // Mean level of the bins covering [minHz, maxHz], scaled and capped to 1.
  // Ranges that collapse to a single bin or less report 0.
  float bandLevel(const float* magnitudes, std::size_t binCount, float minHz, float maxHz) const;
  float overallLevel(const float* magnitudes, std::size_t binCount) const;

  const AudioSample& latest() const { return sample_; }
  const AudioFeatureConfig& config() const { return config_; }

  void reset();

private:
  AudioFeatureConfig config_;
  BandLevels smoothed_{};
  AudioSample sample_{};
};

}  // namespace flicker
