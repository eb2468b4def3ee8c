#include "io/ControlRouter.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

#include "util/Log.h"

namespace flicker {

namespace {

constexpr float kControllerMax = 127.f;

float unitFromController(std::uint8_t value) {
  return std::min(static_cast<float>(value), kControllerMax) / kControllerMax;
}

float clampUnit(float v) {
  if (!(v > 0.f)) {
    return 0.f;
  }
  return std::min(v, 1.f);
}

float clampFrequency(float hz) {
  if (!(hz > kFreqFloorHz)) {
    return kFreqFloorHz;
  }
  return std::min(hz, kFreqCeilingHz);
}

std::string_view trim(std::string_view text) {
  const auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!text.empty() && isSpace(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && isSpace(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

float ControlRouter::controllerToFrequency(std::uint8_t value) {
  const float t = unitFromController(value);
  const float logLo = std::log10(kFreqFloorHz);
  const float logHi = std::log10(kFreqCeilingHz);
  return std::pow(10.f, logLo + t * (logHi - logLo));
}

float ControlRouter::controllerToSpeed(std::uint8_t value) {
  const float speed = static_cast<float>(value) / 32.f + 1.f;
  return std::clamp(speed, kSpeedMin, kSpeedMax);
}

bool ControlRouter::applyControlChange(std::uint8_t controller, std::uint8_t value) {
  const auto* entry = interop::GetControlMap().findController(controller);
  if (!entry) {
    ++rejected_;
    return false;
  }

  float mapped = 0.f;
  switch (entry->id) {
    case interop::ControlId::kSpeed: mapped = controllerToSpeed(value); break;
    case interop::ControlId::kFreqMin:
    case interop::ControlId::kFreqMax: mapped = controllerToFrequency(value); break;
    case interop::ControlId::kMonochrome: mapped = value > 64 ? 1.f : 0.f; break;
    case interop::ControlId::kReset: mapped = 1.f; break;
    default: mapped = unitFromController(value); break;
  }
  apply(entry->id, mapped);
  return true;
}

bool ControlRouter::applyOsc(std::string_view address, float value) {
  const auto* entry = interop::GetControlMap().findAddress(trim(address));
  if (!entry) {
    ++rejected_;
    log::debug("control", "unknown address %.*s", static_cast<int>(address.size()),
               address.data());
    return false;
  }
  apply(entry->id, value);
  return true;
}

bool ControlRouter::applyOscText(std::string_view message) {
  message = trim(message);
  const auto split = message.find_first_of(" \t");
  if (split == std::string_view::npos) {
    const auto* entry = interop::GetControlMap().findAddress(message);
    if (entry && entry->id == interop::ControlId::kReset) {
      apply(entry->id, 1.f);
      return true;
    }
    ++rejected_;
    return false;
  }

  const std::string_view address = message.substr(0, split);
  const std::string valueText(trim(message.substr(split)));
  char* end = nullptr;
  const float value = std::strtof(valueText.c_str(), &end);
  if (valueText.empty() || end != valueText.c_str() + valueText.size()) {
    ++rejected_;
    log::debug("control", "bad value in '%.*s'", static_cast<int>(message.size()),
               message.data());
    return false;
  }
  return applyOsc(address, value);
}

void ControlRouter::apply(interop::ControlId id, float value) {
  using interop::ControlId;
  switch (id) {
    case ControlId::kIntensity: controls_.intensity = clampUnit(value); break;
    case ControlId::kGlitchAmount: controls_.glitchAmount = clampUnit(value); break;
    case ControlId::kSpeed:
      controls_.speed = (value > kSpeedMin) ? std::min(value, kSpeedMax) : kSpeedMin;
      break;
    case ControlId::kColorShift: controls_.colorShift = clampUnit(value); break;
    case ControlId::kPulseStrength: controls_.pulseStrength = clampUnit(value); break;
    case ControlId::kFreqMin: controls_.freqMin = clampFrequency(value); break;
    case ControlId::kFreqMax: controls_.freqMax = clampFrequency(value); break;
    case ControlId::kMonochrome: controls_.isMonochrome = value > 0.5f; break;
    case ControlId::kReset:
      if (onReset_) {
        onReset_();
      }
      break;
  }
}

}  // namespace flicker
