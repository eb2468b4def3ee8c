#ifndef QUIET_MODE
#define QUIET_MODE 1
#endif

// Headless run of the frame pipeline: a scripted clock, a synthetic kick-drum
// spectrum and a few controller moves, one CSV row per frame on stdout.

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <vector>

#include "FlickerConfig.h"
#include "app/FrameClock.h"
#include "app/FrameSession.h"
#include "audio/AudioFeatureExtractor.h"
#include "io/ControlRouter.h"

namespace {

constexpr const char* kDemoPack = R"({
  "id": "demo",
  "name": "Demo Sunset",
  "settings": {
    "intensity": 0.8, "glitchAmount": 0.6, "speed": 2, "colorShift": 0.3,
    "pulseStrength": 0.7, "freqMin": 60, "freqMax": 3000,
    "isMonochrome": false, "targetFPS": 60
  },
  "palette": ["#FF6B35", "#F7C59F", "#EFEFD0", "#004E89", "#1A659E"]
})";

// Energy in the low bins on every beat, decaying between beats.
void fillSpectrum(std::vector<float>& bins, double t, double bpm) {
  const double beat = 60.0 / bpm;
  const double phase = std::fmod(t, beat) / beat;
  const float kick = static_cast<float>(std::exp(-phase * 8.0));
  for (std::size_t i = 0; i < bins.size(); ++i) {
    const float tilt = 1.f / (1.f + static_cast<float>(i) * 0.05f);
    bins[i] = 0.01f * tilt + (i < 6 ? 0.12f * kick : 0.f);
  }
}

}  // namespace

int main() {
  constexpr double kFps = 60.0;
  constexpr int kFrames = 360;
  constexpr double kBpm = 124.0;

  flicker::ManualFrameClock clock;
  flicker::FrameSession::Config config{};
  config.initialSeed = 0x5EED0001u;
  flicker::FrameSession session(clock, config);

  flicker::ControlRouter router(session.controls());
  router.setResetHandler([&session] { session.requestReset(); });

  if (!session.loadPackJson(kDemoPack)) {
    std::fprintf(stderr, "demo pack failed to load\n");
    return 1;
  }
  if (!session.setResolution(1280.f, 720.f)) {
    return 1;
  }

  flicker::AudioFeatureExtractor extractor;
  std::vector<float> bins(512, 0.f);

  std::printf("frame,time,dt,level,bass,peak,pattern,seed,glitch,last_glitch,hold\n");
  for (int frame = 0; frame < kFrames; ++frame) {
    const double t = clock.nowSeconds();

    bool routed = true;
    if (frame == 120) {
      routed = router.applyOscText("/flicker/glitch 0.95");
    } else if (frame == 180) {
      routed = router.applyControlChange(flicker::interop::cc::kReset, 127);
    } else if (frame == 240) {
      routed = router.applyControlChange(flicker::interop::cc::kGlitchAmount, 0);
    }
    if (!routed) {
      std::fprintf(stderr, "control message dropped at frame %d\n", frame);
    }

    fillSpectrum(bins, t, kBpm);
    const flicker::ControlState& c = session.controls();
    session.publishAudio(extractor.processSpectrum(bins.data(), bins.size(), c.freqMin, c.freqMax));

    const flicker::FrameSession::FrameReport report = session.tick();
    const flicker::FrameState& s = session.lastFrame();
    std::printf("%llu,%.4f,%.4f,%.3f,%.3f,%.3f,%d,%08lx,%s,%.3f,%.3f\n",
                static_cast<unsigned long long>(report.frameIndex), static_cast<double>(s.time),
                static_cast<double>(s.deltaTime), static_cast<double>(s.audioLevel),
                static_cast<double>(s.audioBass), static_cast<double>(s.audioPeak),
                static_cast<int>(s.activePattern), static_cast<unsigned long>(s.randomSeed),
                flicker::glitchStateLabel(report.glitchState),
                static_cast<double>(s.lastGlitchTime), static_cast<double>(s.glitchHoldTime));

    clock.advance(1.0 / kFps);
  }

  std::fprintf(stderr, "layout v%d, %u glitches over %d frames\n", FlickerConfig::kUniformLayout,
               static_cast<unsigned>(session.glitchTimer().triggerCount()), kFrames);
  return 0;
}
