#include "engine/PaletteBuffer.h"

#include "util/Log.h"

namespace flicker {

const char* paletteErrorLabel(PaletteError error) {
  switch (error) {
    case PaletteError::kInvalidPalette: return "InvalidPalette";
    case PaletteError::kNone:
    default: return "None";
  }
}

PaletteBuffer::PaletteBuffer() {
  exchange_.publish(staged_);
}

PaletteError PaletteBuffer::setPalette(const Float4* colors, std::size_t count) {
  if (count > kMaxPaletteColors) {
    log::warn("palette", "rejected %zu colors (max %zu), keeping %d", count, kMaxPaletteColors,
              static_cast<int>(staged_.colorCount));
    return PaletteError::kInvalidPalette;
  }
  if (count > 0 && !colors) {
    return PaletteError::kInvalidPalette;
  }

  ColorPalette next{};
  for (std::size_t i = 0; i < count; ++i) {
    next.colors[i] = colors[i];
  }
  next.colorCount = static_cast<std::int32_t>(count);

  staged_ = next;
  exchange_.publish(staged_);
  return PaletteError::kNone;
}

void PaletteBuffer::clear() {
  staged_.colorCount = 0;
  exchange_.publish(staged_);
}

}  // namespace flicker
