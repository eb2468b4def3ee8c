#pragma once

//
// PaletteBuffer
// -------------
// Owns the palette block that rides next to the uniforms.  The pack-selection
// path is the only writer; the render submission path is the only reader.
// Every accepted update is staged in full and then published as one snapshot,
// so the reader never sees new colors with an old count (or the reverse).
#include <cstddef>
#include <cstdint>
#include <vector>

#include "FrameUniforms.h"
#include "util/SnapshotExchange.h"

namespace flicker {

enum class PaletteError : std::uint8_t {
  kNone = 0,
  kInvalidPalette,  // more than kMaxPaletteColors supplied
};

const char* paletteErrorLabel(PaletteError error);

class PaletteBuffer {
public:
  PaletteBuffer();

  // Replace the active colors.  Fails with kInvalidPalette (and keeps the
  // previous palette) when `count` exceeds kMaxPaletteColors.  Slots past
  // `count` are zero-filled.
  PaletteError setPalette(const Float4* colors, std::size_t count);
  PaletteError setPalette(const std::vector<Float4>& colors) {
    return setPalette(colors.data(), colors.size());
  }

  // Drop to zero active colors.
  void clear();

  // Writer-side view of the last accepted palette.
  const ColorPalette& staged() const { return staged_; }
  std::int32_t colorCount() const { return staged_.colorCount; }

  // Reader side: newest complete palette.
  const ColorPalette& acquire() { return exchange_.acquire(); }

  std::uint64_t revision() const { return exchange_.publishedCount(); }

private:
  ColorPalette staged_{};
  SnapshotExchange<ColorPalette> exchange_{};
};

}  // namespace flicker
