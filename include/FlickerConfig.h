#pragma once

//
// Build-time switches.
// --------------------
// Every `-D` toggle the pipeline understands lives here, with a one-line story
// in the flag matrix below.  Producer code, shader mirrors and tests all read
// the same values, so add new switches here and nowhere else.

// Uniform layout version.  1 = legacy compact block (no peak/smooth audio and
// no glitch timing), 2 = expanded block.  The producer and the shaders must be
// built against the same value; nothing negotiates this at run time.
#ifndef FLICKER_UNIFORM_LAYOUT
#define FLICKER_UNIFORM_LAYOUT 2
#endif

// Quiet mode mutes the default log sink for debug/info chatter.  Warnings and
// errors still reach stderr.
#ifndef QUIET_MODE
#define QUIET_MODE 1
#endif

// Glitch breadcrumbs.  When enabled every trigger decision that fires is
// logged with its probability and hold time.
#ifndef FLICKER_DEBUG_GLITCH
#define FLICKER_DEBUG_GLITCH 0
#endif

namespace FlickerConfig {

constexpr int kUniformLayout = FLICKER_UNIFORM_LAYOUT;
constexpr bool kQuietMode = (QUIET_MODE != 0);
constexpr bool kGlitchDebug = (FLICKER_DEBUG_GLITCH != 0);

static_assert(FLICKER_UNIFORM_LAYOUT == 1 || FLICKER_UNIFORM_LAYOUT == 2,
              "FLICKER_UNIFORM_LAYOUT must be 1 or 2");
static_assert(QUIET_MODE == 0 || QUIET_MODE == 1,
              "QUIET_MODE must be 0 or 1");
static_assert(FLICKER_DEBUG_GLITCH == 0 || FLICKER_DEBUG_GLITCH == 1,
              "FLICKER_DEBUG_GLITCH must be 0 or 1");

struct FlagSummary {
    const char *name;
    bool enabled;
    const char *story;
};

inline constexpr FlagSummary kFlagMatrix[] = {
    {"FLICKER_UNIFORM_LAYOUT", kUniformLayout == 2,
     "Expanded uniform block (V2) when true, legacy compact block (V1) otherwise."},
    {"QUIET_MODE", kQuietMode,
     "Mute debug/info logs. Warnings and errors still print."},
    {"FLICKER_DEBUG_GLITCH", kGlitchDebug,
     "Log every glitch trigger with its probability and hold."},
};

}  // namespace FlickerConfig
