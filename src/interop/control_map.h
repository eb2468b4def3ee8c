#pragma once

//
// External control map.
// ---------------------
// One table that says which MIDI CC and which OSC address drive which control,
// and how the raw value is scaled.  The router, the docs and the tests all read
// this table, so a remap happens here and nowhere else.

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace flicker::interop {

enum class ControlId : std::uint8_t {
  kIntensity = 0,
  kGlitchAmount,
  kSpeed,
  kColorShift,
  kPulseStrength,
  kFreqMin,
  kFreqMax,
  kMonochrome,
  kReset,
};

namespace cc {
constexpr std::uint8_t kIntensity = 71;      // 0..127 → 0..1
constexpr std::uint8_t kGlitchAmount = 72;   // 0..127 → 0..1
constexpr std::uint8_t kSpeed = 73;          // value / 32 + 1, clamped 1..4
constexpr std::uint8_t kColorShift = 74;     // 0..127 → 0..1
constexpr std::uint8_t kFreqMin = 75;        // log sweep 20 Hz..20 kHz
constexpr std::uint8_t kFreqMax = 76;        // log sweep 20 Hz..20 kHz
constexpr std::uint8_t kMonochrome = 77;     // > 64 = on
constexpr std::uint8_t kReset = 78;          // any value fires
constexpr std::uint8_t kPulseStrength = 79;  // 0..127 → 0..1
}  // namespace cc

struct ControlDescriptor {
  ControlId id = ControlId::kIntensity;
  std::uint8_t controller = 0;
  std::string_view oscAddress{};
  std::string_view label{};
};

struct OscAlias {
  std::string_view address{};
  ControlId id = ControlId::kIntensity;
};

struct ControlMap {
  std::array<ControlDescriptor, 16> entries{};
  std::size_t size = 0;
  std::array<OscAlias, 16> aliases{};
  std::size_t aliasCount = 0;

  const ControlDescriptor* findController(std::uint8_t controller) const {
    for (std::size_t i = 0; i < size; ++i) {
      if (entries[i].controller == controller) {
        return &entries[i];
      }
    }
    return nullptr;
  }

  const ControlDescriptor* findId(ControlId id) const {
    for (std::size_t i = 0; i < size; ++i) {
      if (entries[i].id == id) {
        return &entries[i];
      }
    }
    return nullptr;
  }

  // Case-insensitive; canonical addresses first, then aliases.
  const ControlDescriptor* findAddress(std::string_view address) const {
    for (std::size_t i = 0; i < size; ++i) {
      if (equalsIgnoreCase(entries[i].oscAddress, address)) {
        return &entries[i];
      }
    }
    for (std::size_t i = 0; i < aliasCount; ++i) {
      if (equalsIgnoreCase(aliases[i].address, address)) {
        return findId(aliases[i].id);
      }
    }
    return nullptr;
  }

  static bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
      return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
      const auto ca = static_cast<unsigned char>(a[i]);
      const auto cb = static_cast<unsigned char>(b[i]);
      if (std::tolower(ca) != std::tolower(cb)) {
        return false;
      }
    }
    return true;
  }
};

inline ControlMap BuildDefaultControlMap() {
  ControlMap map{};
  map.entries[0] = {ControlId::kIntensity, cc::kIntensity, "/flicker/intensity", "Intensity"};
  map.entries[1] = {ControlId::kGlitchAmount, cc::kGlitchAmount, "/flicker/glitch", "Glitch"};
  map.entries[2] = {ControlId::kSpeed, cc::kSpeed, "/flicker/speed", "Speed"};
  map.entries[3] = {ControlId::kColorShift, cc::kColorShift, "/flicker/colorshift", "Color shift"};
  map.entries[4] = {ControlId::kPulseStrength, cc::kPulseStrength, "/flicker/pulse", "Pulse"};
  map.entries[5] = {ControlId::kFreqMin, cc::kFreqMin, "/flicker/freqmin", "Band low"};
  map.entries[6] = {ControlId::kFreqMax, cc::kFreqMax, "/flicker/freqmax", "Band high"};
  map.entries[7] = {ControlId::kMonochrome, cc::kMonochrome, "/flicker/monochrome", "Mono"};
  map.entries[8] = {ControlId::kReset, cc::kReset, "/flicker/reset", "Reset"};
  map.size = 9;

  map.aliases[0] = {"/flicker/glitchamount", ControlId::kGlitchAmount};
  map.aliases[1] = {"/flicker/color", ControlId::kColorShift};
  map.aliases[2] = {"/flicker/color_shift", ControlId::kColorShift};
  map.aliases[3] = {"/flicker/freq_min", ControlId::kFreqMin};
  map.aliases[4] = {"/flicker/freq_max", ControlId::kFreqMax};
  map.aliases[5] = {"/flicker/mono", ControlId::kMonochrome};
  map.aliases[6] = {"/flicker/pulsestrength", ControlId::kPulseStrength};
  map.aliasCount = 7;
  return map;
}

inline const ControlMap& GetControlMap() {
  static const ControlMap map = BuildDefaultControlMap();
  return map;
}

}  // namespace flicker::interop
