#include "app/Pack.h"
#include <algorithm>
#include <cmath>
#include <string>
#include <string_view>
#include <utility>
#include "app/ControlState.h"

#include <ArduinoJson.h>

namespace {

template <typename T>
T clampValue(T v, T lo, T hi) {
  return std::max(lo, std::min(hi, v));
}

int hexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// NaN from a hand-edited file collapses to the low bound.
float clampUnit(float v) {
  if (!(v > 0.f)) {
    return 0.f;
  }
  return std::min(v, 1.f);
}

float clampFrequency(float hz) {
  if (!(hz > flicker::kFreqFloorHz)) {
    return flicker::kFreqFloorHz;
  }
  return std::min(hz, flicker::kFreqCeilingHz);
}

template <typename T>
bool readRequired(JsonObjectConst obj, const char* key, T& out) {
  JsonVariantConst v = obj[key];
  if (!v.is<T>()) {
    return false;
  }
  out = v.as<T>();
  return true;
}

}  // namespace

namespace flicker {

bool parseHexColor(std::string_view text, Float4& out) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  if (!text.empty() && text.front() == '#') {
    text.remove_prefix(1);
  }
  if (text.size() != 6) {
    return false;
  }
  float channels[3]{};
  for (std::size_t i = 0; i < 3; ++i) {
    const int hi = hexNibble(text[i * 2]);
    const int lo = hexNibble(text[i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    channels[i] = static_cast<float>(hi * 16 + lo) / 255.f;
  }
  out = Float4{channels[0], channels[1], channels[2], 1.f};
  return true;
}

std::vector<Float4> Pack::paletteColors(std::size_t* skipped) const {
  std::vector<Float4> colors;
  std::size_t bad = 0;
  for (const std::string& hex : paletteHex) {
    if (colors.size() >= kMaxPaletteColors) {
      break;
    }
    Float4 c{};
    if (parseHexColor(hex, c)) {
      colors.push_back(c);
    } else {
      ++bad;
    }
  }
  if (skipped) {
    *skipped = bad;
  }
  return colors;
}

void applyPackSettings(const PackSettings& settings, ControlState& controls) {
  controls.intensity = clampUnit(settings.intensity);
  controls.glitchAmount = clampUnit(settings.glitchAmount);
  controls.speed = clampValue(static_cast<float>(settings.speed), kSpeedMin, kSpeedMax);
  controls.colorShift = clampUnit(settings.colorShift);
  controls.pulseStrength = clampUnit(settings.pulseStrength);
  controls.freqMin = clampFrequency(settings.freqMin);
  controls.freqMax = clampFrequency(settings.freqMax);
  controls.isMonochrome = settings.isMonochrome;
  controls.targetFps = clampValue(settings.targetFps, kTargetFpsMin, kTargetFpsMax);
}

PackSettings captureSettings(const ControlState& controls) {
  PackSettings s{};
  s.intensity = controls.intensity;
  s.glitchAmount = controls.glitchAmount;
  s.speed = static_cast<std::int32_t>(std::lround(controls.speed));
  s.colorShift = controls.colorShift;
  s.pulseStrength = controls.pulseStrength;
  s.freqMin = controls.freqMin;
  s.freqMax = controls.freqMax;
  s.isMonochrome = controls.isMonochrome;
  s.targetFps = controls.targetFps;
  return s;
}

std::vector<std::uint8_t> Pack::serialize() const {
  JsonDocument doc;
  doc["id"] = id;
  doc["name"] = name;
  JsonObject settingsObj = doc["settings"].to<JsonObject>();
  settingsObj["intensity"] = settings.intensity;
  settingsObj["glitchAmount"] = settings.glitchAmount;
  settingsObj["speed"] = settings.speed;
  settingsObj["colorShift"] = settings.colorShift;
  settingsObj["pulseStrength"] = settings.pulseStrength;
  settingsObj["freqMin"] = settings.freqMin;
  settingsObj["freqMax"] = settings.freqMax;
  settingsObj["isMonochrome"] = settings.isMonochrome;
  settingsObj["targetFPS"] = settings.targetFps;

  JsonArray paletteArr = doc["palette"].to<JsonArray>();
  for (const std::string& hex : paletteHex) {
    paletteArr.add(hex);
  }

  std::string json;
  serializeJson(doc, json);
  return std::vector<std::uint8_t>(json.begin(), json.end());
}

bool Pack::deserialize(const std::vector<std::uint8_t>& bytes, Pack& out) {
  if (bytes.empty()) {
    return false;
  }
  return deserialize(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()),
                     out);
}

bool Pack::deserialize(std::string_view json, Pack& out) {
  if (json.empty()) {
    return false;
  }
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, json.data(), json.size());
  if (err) {
    return false;
  }
  JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) {
    return false;
  }

  Pack next{};
  if (!readRequired(root, "id", next.id) || !readRequired(root, "name", next.name)) {
    return false;
  }

  JsonObjectConst settingsObj = root["settings"].as<JsonObjectConst>();
  if (settingsObj.isNull()) {
    return false;
  }
  PackSettings& s = next.settings;
  if (!readRequired(settingsObj, "intensity", s.intensity) ||
      !readRequired(settingsObj, "glitchAmount", s.glitchAmount) ||
      !readRequired(settingsObj, "speed", s.speed) ||
      !readRequired(settingsObj, "colorShift", s.colorShift) ||
      !readRequired(settingsObj, "freqMin", s.freqMin) ||
      !readRequired(settingsObj, "freqMax", s.freqMax) ||
      !readRequired(settingsObj, "isMonochrome", s.isMonochrome) ||
      !readRequired(settingsObj, "targetFPS", s.targetFps)) {
    return false;
  }
  // Older packs predate pulse strength.
  if (settingsObj["pulseStrength"].is<float>()) {
    s.pulseStrength = settingsObj["pulseStrength"].as<float>();
  }

  JsonArrayConst paletteArr = root["palette"].as<JsonArrayConst>();
  if (!paletteArr.isNull()) {
    for (JsonVariantConst v : paletteArr) {
      if (v.is<const char*>()) {
        next.paletteHex.emplace_back(v.as<const char*>());
      }
    }
  }

  out = std::move(next);
  return true;
}

}  // namespace flicker
