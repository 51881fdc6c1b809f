#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class Config;
class KeycodeTable;

struct Color
{
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;
  double a = 1.0;

  bool operator==(const Color&) const = default;
};

// #RGB, #RGBA, #RRGGBB or #RRGGBBAA. Throws std::invalid_argument.
Color parseColor(const std::string& text);

struct SizeDimension
{
  enum class Kind
  {
    Pixels,
    Ratio
  };
  Kind kind = Kind::Pixels;
  double value = 0.0;

  static SizeDimension pixels(uint32_t px) { return { Kind::Pixels, double(px) }; }
  static SizeDimension ratio(double r) { return { Kind::Ratio, r }; }
};

enum class OverlayPosition
{
  Top,
  Bottom,
  Left,
  Right,
  Center,
  TopLeft,
  TopCenter,
  TopRight,
  BottomLeft,
  BottomCenter,
  BottomRight,
  CenterLeft,
  CenterRight
};

OverlayPosition parsePosition(const std::string& text);
std::string positionName(OverlayPosition position);

constexpr double DEFAULT_CORNER_RADIUS = 8.0;
constexpr double DEFAULT_BORDER_THICKNESS = 2.0;
constexpr double DEFAULT_TEXT_SIZE = 18.0;
constexpr double DEFAULT_ROTATION_DEGREES = 0.0;

struct Rect
{
  double left = 0.0;
  double top = 0.0;
  double width = 0.0;
  double height = 0.0;

  double right() const { return left + width; }
  double bottom() const { return top + height; }
  bool overlaps(const Rect& other) const
  {
    return left < other.right() && right() > other.left &&
           top < other.bottom() && bottom() > other.top;
  }
};

struct KeyStyle
{
  double cornerRadius = DEFAULT_CORNER_RADIUS;
  double borderThickness = DEFAULT_BORDER_THICKNESS;
  double textSize = DEFAULT_TEXT_SIZE;
  double rotationDegrees = DEFAULT_ROTATION_DEGREES;
  std::optional<Color> background;
};

struct KeySpec
{
  // Symbolic name from the keycode table. Empty for an unmapped key, which is
  // drawn but never highlighted.
  std::string name;
  std::string label;
  uint32_t keycode = 0;
  Rect bounds;
  KeyStyle style;

  bool mapped() const { return !name.empty(); }
};

struct OverlaySettings
{
  std::optional<std::string> screen;
  OverlayPosition position = OverlayPosition::BottomCenter;
  std::optional<SizeDimension> width;
  std::optional<SizeDimension> height = SizeDimension::ratio(0.3);
  int marginTop = 0;
  int marginRight = 0;
  int marginBottom = 0;
  int marginLeft = 0;
  std::optional<std::string> fontPath;

  Color backgroundInactive = parseColor("#00000000");
  Color backgroundActive = parseColor("#A0A0A0D0");
  Color keyBackground = parseColor("#4D4D4D80");
  Color keyText = parseColor("#B3B3B3CC");
  Color keyOutline = parseColor("#B3B3B3CC");
  Color activeKeyBackground = parseColor("#A0A0F0FF");
  Color activeKeyText = parseColor("#B3B3B3CC");

  bool sizeConfigured() const { return width.has_value() || height.has_value(); }
};

struct LayoutBounds
{
  double minX = 0.0;
  double minY = 0.0;
  double width = 0.0;
  double height = 0.0;
};

struct LayoutModel
{
  std::vector<KeySpec> keys;
  OverlaySettings overlay;

  LayoutBounds bounds() const;
};

class LayoutError : public std::runtime_error
{
public:
  explicit LayoutError(const std::string& what)
    : std::runtime_error(what)
  {
  }
};

// Both throw LayoutError listing every problem found.
LayoutModel loadLayout(const Config& config, const KeycodeTable& keycodes);
LayoutModel loadLayout(const std::string& path, const KeycodeTable& keycodes);

// Overlaps, duplicate keycodes and out-of-range values. Empty when clean.
std::vector<std::string> validateLayout(const LayoutModel& layout);
