#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <cairo.h>

struct FittedLabel
{
  std::string text;
  double fontSize = 0.0;
  size_t truncatedChars = 0;
};

constexpr double LABEL_PADDING_FACTOR = 0.1;
constexpr double LABEL_MIN_PADDING = 2.0;
constexpr double LABEL_MIN_FONT_FACTOR = 0.5;
constexpr double LABEL_MIN_FONT_SIZE = 6.0;
constexpr double LABEL_SHRINK_STEP = 0.9;

// Shrinks the font toward max(size * 0.5, 6), then drops trailing characters
// until the label fits inside the key minus its padding. No ellipsis is added.
// The font face must already be set on cr; the font size is left unchanged.
FittedLabel fitLabel(cairo_t* cr,
                     const std::string& text,
                     double keyWidth,
                     double keyHeight,
                     double fontSize);

// Codepoints of a UTF-8 string, or nullopt for malformed input.
std::optional<std::vector<uint32_t>> decodeUtf8(const std::string& text);
