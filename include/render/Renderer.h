#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "Layout.h"
#include "input/KeyState.h"
#include "logger.h"
#include "render/FontFace.h"

// A premultiplied ARGB32 frame owned by the caller.
struct RenderTarget
{
  uint8_t* data = nullptr;
  int width = 0;
  int height = 0;
  int stride = 0;
};

struct LayoutTransform
{
  double scale = 1.0;
  double offsetX = 0.0;
  double offsetY = 0.0;
};

// Fits the layout bounds into a width x height surface, centred.
LayoutTransform computeTransform(const LayoutModel& layout, int width, int height);

class DrawingCache
{
  int width = 0;
  int height = 0;
  LayoutTransform transform;
  bool valid = false;

public:
  std::optional<LayoutTransform> lookup(int width, int height) const;
  void store(int width, int height, const LayoutTransform& transform);
  void invalidate() { valid = false; }
};

class Renderer
{
  std::shared_ptr<spdlog::logger> logger;
  std::shared_ptr<FontFace> font;
  std::optional<Color> background;
  DrawingCache cache;

  void drawKey(cairo_t* cr,
               const KeySpec& key,
               const OverlaySettings& overlay,
               const LayoutTransform& transform,
               bool pressed);
  void drawFallbackBox(cairo_t* cr, double width, double height, double fontSize);

public:
  // background replaces overlay.backgroundInactive when set (window mode).
  Renderer(std::shared_ptr<FontFace> font, std::optional<Color> background);

  // The layout must stay the same between calls; only the target size keys
  // the cached transform. Never touches keyState or layout.
  void render(const RenderTarget& target,
              const LayoutModel& layout,
              const KeyState& keyState);
};
