#include "wayland/OverlayGeometry.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "wlr-layer-shell-unstable-v1-client-protocol.h"

using namespace std;

int
OutputInfo::width() const
{
  if (logicalWidth > 0) {
    return logicalWidth;
  }
  return modeWidth / max(scale, 1);
}

int
OutputInfo::height() const
{
  if (logicalHeight > 0) {
    return logicalHeight;
  }
  return modeHeight / max(scale, 1);
}

static uint32_t
roundPixels(double value)
{
  return value > 0.0 ? static_cast<uint32_t>(lround(value)) : 0;
}

static uint32_t
resolveDimension(const optional<SizeDimension>& dimension, int screen)
{
  if (!dimension.has_value()) {
    return 0;
  }
  if (dimension->kind == SizeDimension::Kind::Pixels) {
    return static_cast<uint32_t>(dimension->value);
  }
  return roundPixels(screen * dimension->value);
}

OverlaySize
computeOverlaySize(const OverlaySettings& settings,
                   double layoutWidth,
                   double layoutHeight,
                   int screenWidth,
                   int screenHeight)
{
  if (screenWidth <= 0 || screenHeight <= 0) {
    screenWidth = FALLBACK_SCREEN_WIDTH;
    screenHeight = FALLBACK_SCREEN_HEIGHT;
  }
  double aspect = (layoutWidth > 0.0 && layoutHeight > 0.0)
                    ? layoutWidth / layoutHeight
                    : 16.0 / 9.0;

  uint32_t w = resolveDimension(settings.width, screenWidth);
  uint32_t h = resolveDimension(settings.height, screenHeight);

  if (w > 0 && h == 0) {
    h = roundPixels(w / aspect);
  } else if (h > 0 && w == 0) {
    w = roundPixels(h * aspect);
  } else if (w == 0 && h == 0) {
    h = roundPixels(screenHeight * 0.3);
    w = roundPixels(h * aspect);
  }

  if (w > uint32_t(screenWidth)) {
    w = screenWidth;
    h = roundPixels(w / aspect);
  }
  if (h > uint32_t(screenHeight)) {
    h = screenHeight;
    w = roundPixels(h * aspect);
  }

  if (w == 0) {
    w = max<uint32_t>(roundPixels(screenWidth * 0.1), 1);
  }
  if (h == 0) {
    h = max<uint32_t>(roundPixels(screenHeight * 0.1), 1);
  }
  return { w, h };
}

uint32_t
anchorFor(OverlayPosition position)
{
  const uint32_t top = ZWLR_LAYER_SURFACE_V1_ANCHOR_TOP;
  const uint32_t bottom = ZWLR_LAYER_SURFACE_V1_ANCHOR_BOTTOM;
  const uint32_t left = ZWLR_LAYER_SURFACE_V1_ANCHOR_LEFT;
  const uint32_t right = ZWLR_LAYER_SURFACE_V1_ANCHOR_RIGHT;

  switch (position) {
    case OverlayPosition::Top:
    case OverlayPosition::TopCenter:
      return top | left | right;
    case OverlayPosition::Bottom:
    case OverlayPosition::BottomCenter:
      return bottom | left | right;
    case OverlayPosition::Left:
    case OverlayPosition::CenterLeft:
      return left;
    case OverlayPosition::Right:
    case OverlayPosition::CenterRight:
      return right;
    case OverlayPosition::Center:
      return top | bottom | left | right;
    case OverlayPosition::TopLeft:
      return top | left;
    case OverlayPosition::TopRight:
      return top | right;
    case OverlayPosition::BottomLeft:
      return bottom | left;
    case OverlayPosition::BottomRight:
      return bottom | right;
  }
  return bottom | left | right;
}

optional<size_t>
selectOutput(const vector<OutputInfo>& outputs, const optional<string>& screen)
{
  if (!screen.has_value() || screen->empty()) {
    return nullopt;
  }
  bool numeric = screen->size() < 10 &&
                 all_of(screen->begin(), screen->end(), [](unsigned char c) {
                   return isdigit(c);
                 });
  if (numeric) {
    size_t index = stoul(*screen);
    if (index < outputs.size()) {
      return index;
    }
    return nullopt;
  }
  for (size_t i = 0; i < outputs.size(); i++) {
    if (outputs[i].name == *screen || outputs[i].description == *screen) {
      return i;
    }
  }
  return nullopt;
}
