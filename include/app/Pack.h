#pragma once

//
// Pack.h
// ------
// A pack is a named look: control settings plus up to six palette colors,
// stored as JSON next to whatever media the host ships with it.  Only the
// JSON side lives here; loading textures and videos is the host's problem.
// Serialization helpers live in the matching .cpp so ArduinoJson stays out of
// most translation units.
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "FrameUniforms.h"

namespace flicker {

struct ControlState;

struct PackSettings {
  float intensity{0.72f};
  float glitchAmount{0.35f};
  std::int32_t speed{2};
  float colorShift{0.72f};
  float pulseStrength{0.6f};
  float freqMin{80.f};
  float freqMax{4200.f};
  bool isMonochrome{false};
  std::int32_t targetFps{30};

  static PackSettings defaults() { return PackSettings{}; }
};

struct Pack {
  std::string id;
  std::string name;
  PackSettings settings{};
  std::vector<std::string> paletteHex{};  // "#RRGGBB", first six are used

  // Serialize to JSON (UTF-8).
  std::vector<std::uint8_t> serialize() const;

  // Hydrate from JSON.  Returns false when parsing fails or a required setting
  // is missing or has the wrong type; `out` is untouched in that case.
  static bool deserialize(const std::vector<std::uint8_t>& bytes, Pack& out);
  static bool deserialize(std::string_view json, Pack& out);

  // Parsed palette, at most kMaxPaletteColors entries.  Malformed entries are
  // skipped; `skipped` (optional) reports how many.
  std::vector<Float4> paletteColors(std::size_t* skipped = nullptr) const;
};

// "#RRGGBB" or "RRGGBB" (surrounding blanks allowed) → RGBA with alpha 1.
bool parseHexColor(std::string_view text, Float4& out);

// Write pack settings into the live controls.  Pattern, texture count and
// resolution belong to the session and are left alone.
void applyPackSettings(const PackSettings& settings, ControlState& controls);

// Inverse of applyPackSettings, used when saving the current look as a pack.
PackSettings captureSettings(const ControlState& controls);

}  // namespace flicker
