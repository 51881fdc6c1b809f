#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Layout.h"

constexpr int FALLBACK_SCREEN_WIDTH = 320;
constexpr int FALLBACK_SCREEN_HEIGHT = 240;

struct OutputInfo
{
  uint32_t globalName = 0;
  std::string name;
  std::string description;
  // From xdg-output; zero until reported.
  int logicalWidth = 0;
  int logicalHeight = 0;
  int modeWidth = 0;
  int modeHeight = 0;
  int scale = 1;

  // Logical size, else the current mode divided by the output scale. Zero
  // when the output has not reported either yet.
  int width() const;
  int height() const;
  bool hasSize() const { return width() > 0 && height() > 0; }
};

struct OverlaySize
{
  uint32_t width = 0;
  uint32_t height = 0;
};

OverlaySize computeOverlaySize(const OverlaySettings& settings,
                               double layoutWidth,
                               double layoutHeight,
                               int screenWidth,
                               int screenHeight);

// zwlr_layer_surface_v1 anchor bits for an overlay position.
uint32_t anchorFor(OverlayPosition position);

// Index into outputs for overlay.screen: a numeric index, else an exact name
// or description match. nullopt leaves the choice to the compositor.
std::optional<size_t> selectOutput(const std::vector<OutputInfo>& outputs,
                                   const std::optional<std::string>& screen);
