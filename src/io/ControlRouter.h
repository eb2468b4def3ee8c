#pragma once

//
// ControlRouter
// -------------
// Front door for external controllers.  MIDI CC bytes and OSC messages are
// looked up in the control map, scaled into each control's domain and written
// into the bound ControlState.  The transports themselves (ports, sockets)
// live outside; they hand the router already-decoded values.
//
// The router and the frame session share one thread: it writes ControlState
// between ticks and the session reads it at the start of the next tick.
#include <cstdint>
#include <functional>
#include <string_view>
#include <utility>

#include "app/ControlState.h"
#include "interop/control_map.h"

namespace flicker {

class ControlRouter {
public:
  using ResetHandler = std::function<void()>;

  explicit ControlRouter(ControlState& controls) : controls_(controls) {}

  void setResetHandler(ResetHandler handler) { onReset_ = std::move(handler); }

  // Returns false when the controller number is not mapped.
  bool applyControlChange(std::uint8_t controller, std::uint8_t value);

  // Normalised OSC path: `value` in the control's own units (0..1, 1..4, Hz,
  // or >0.5 for toggles).  Unknown addresses return false.
  bool applyOsc(std::string_view address, float value);

  // Text form sent by patchers that pack address and value into one string,
  // e.g. "/flicker/intensity 0.5".  A bare address (reset) is accepted.
  bool applyOscText(std::string_view message);

  // 0..127 → Hz on a log scale between 20 Hz and 20 kHz.
  static float controllerToFrequency(std::uint8_t value);
  static float controllerToSpeed(std::uint8_t value);

  std::uint32_t rejectedCount() const { return rejected_; }

private:
  void apply(interop::ControlId id, float value);

  ControlState& controls_;
  ResetHandler onReset_{};
  std::uint32_t rejected_{0};
};

}  // namespace flicker
