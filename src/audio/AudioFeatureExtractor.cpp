#include "audio/AudioFeatureExtractor.h"

#include <algorithm>

#include "util/Smoother.h"

namespace flicker {

namespace {

constexpr float kBassLoHz = 20.f;
constexpr float kBassHiHz = 250.f;
constexpr float kMidHiHz = 2000.f;
constexpr float kHighHiHz = 20000.f;

std::size_t binFor(float hz, std::size_t fftSize, float sampleRate) {
  if (!(hz > 0.f) || !(sampleRate > 0.f)) {
    return 0;
  }
  const double bin = static_cast<double>(hz) * static_cast<double>(fftSize) /
                     static_cast<double>(sampleRate);
  return static_cast<std::size_t>(bin);
}

}  // namespace

AudioFeatureExtractor::AudioFeatureExtractor(AudioFeatureConfig config) : config_(config) {}

float AudioFeatureExtractor::overallLevel(const float* magnitudes, std::size_t binCount) const {
  if (!magnitudes || binCount == 0) {
    return 0.f;
  }
  double sum = 0.0;
  for (std::size_t i = 0; i < binCount; ++i) {
    sum += static_cast<double>(magnitudes[i]);
  }
  const float avg = static_cast<float>(sum / static_cast<double>(binCount));
  return std::min(1.f, avg * config_.gain);
}

float AudioFeatureExtractor::bandLevel(const float* magnitudes, std::size_t binCount, float minHz,
                                       float maxHz) const {
  if (!magnitudes || binCount == 0) {
    return 0.f;
  }
  const std::size_t fftSize = binCount * 2;
  const std::size_t last = binCount - 1;
  const std::size_t lo = std::min(binFor(minHz, fftSize, config_.sampleRate), last);
  const std::size_t hi = std::max(lo, std::min(binFor(maxHz, fftSize, config_.sampleRate), last));
  if (lo >= hi) {
    return 0.f;
  }
  double sum = 0.0;
  for (std::size_t i = lo; i <= hi; ++i) {
    sum += static_cast<double>(magnitudes[i]);
  }
  const float avg = static_cast<float>(sum / static_cast<double>(hi - lo + 1));
  return std::min(1.f, avg * config_.gain);
}

const AudioSample& AudioFeatureExtractor::processSpectrum(const float* magnitudes,
                                                          std::size_t binCount, float freqMinHz,
                                                          float freqMaxHz) {
  BandLevels raw{};
  raw.overall = overallLevel(magnitudes, binCount);
  raw.bass = bandLevel(magnitudes, binCount, kBassLoHz, kBassHiHz);
  raw.mid = bandLevel(magnitudes, binCount, kBassHiHz, kMidHiHz);
  raw.high = bandLevel(magnitudes, binCount, kMidHiHz, kHighHiHz);
  raw.band = bandLevel(magnitudes, binCount, freqMinHz, freqMaxHz);
  return processLevels(raw);
}

const AudioSample& AudioFeatureExtractor::processLevels(const BandLevels& raw) {
  const float bandAlpha = 1.f - config_.bandRetain;
  smooth(raw.overall, smoothed_.overall, bandAlpha);
  smooth(raw.bass, smoothed_.bass, bandAlpha);
  smooth(raw.mid, smoothed_.mid, bandAlpha);
  smooth(raw.high, smoothed_.high, bandAlpha);
  smooth(raw.band, smoothed_.band, bandAlpha);

  sample_.level = smoothed_.overall;
  sample_.bass = smoothed_.bass;
  sample_.mid = smoothed_.mid;
  sample_.high = smoothed_.high;
  sample_.band = smoothed_.band;

  // The slow level and the peak both ride on the already-smoothed overall.
  smooth(smoothed_.overall, sample_.smooth, 1.f - config_.smoothRetain);
  peakHold(smoothed_.overall, sample_.peak, config_.peakDecay);
  return sample_;
}

void AudioFeatureExtractor::reset() {
  smoothed_ = BandLevels{};
  sample_ = AudioSample{};
}

}  // namespace flicker
