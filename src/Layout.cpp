#include "Layout.h"
#include "Config.h"
#include "KeycodeTable.h"
#include "logger.h"

#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <sstream>

using namespace std;

static shared_ptr<spdlog::logger>
layoutLogger()
{
  static auto logger = makeLogger("Layout");
  return logger;
}

static int
hexDigit(char c)
{
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

Color
parseColor(const string& text)
{
  string hex = text;
  if (!hex.empty() && hex[0] == '#') {
    hex.erase(0, 1);
  }
  if (hex.size() != 3 && hex.size() != 4 && hex.size() != 6 && hex.size() != 8) {
    throw invalid_argument("Invalid color string format for '" + text +
                           "'. Expected #RRGGBB, #RRGGBBAA, #RGB, or #RGBA.");
  }

  vector<int> components;
  bool shortForm = hex.size() <= 4;
  size_t width = shortForm ? 1 : 2;
  for (size_t i = 0; i < hex.size(); i += width) {
    int hi = hexDigit(hex[i]);
    int lo = shortForm ? hi : hexDigit(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw invalid_argument("Invalid hexadecimal value in color string '" +
                             text + "'");
    }
    components.push_back(hi * 16 + lo);
  }

  Color color;
  color.r = components[0] / 255.0;
  color.g = components[1] / 255.0;
  color.b = components[2] / 255.0;
  color.a = components.size() == 4 ? components[3] / 255.0 : 1.0;
  return color;
}

static const map<string, OverlayPosition> positions = {
  { "top", OverlayPosition::Top },
  { "bottom", OverlayPosition::Bottom },
  { "left", OverlayPosition::Left },
  { "right", OverlayPosition::Right },
  { "center", OverlayPosition::Center },
  { "top-left", OverlayPosition::TopLeft },
  { "top-center", OverlayPosition::TopCenter },
  { "top-right", OverlayPosition::TopRight },
  { "bottom-left", OverlayPosition::BottomLeft },
  { "bottom-center", OverlayPosition::BottomCenter },
  { "bottom-right", OverlayPosition::BottomRight },
  { "center-left", OverlayPosition::CenterLeft },
  { "center-right", OverlayPosition::CenterRight },
};

OverlayPosition
parsePosition(const string& text)
{
  auto it = positions.find(text);
  if (it == positions.end()) {
    throw invalid_argument("Unknown overlay position '" + text + "'");
  }
  return it->second;
}

string
positionName(OverlayPosition position)
{
  for (const auto& [name, value] : positions) {
    if (value == position) {
      return name;
    }
  }
  return "unknown";
}

LayoutBounds
LayoutModel::bounds() const
{
  LayoutBounds result;
  if (keys.empty()) {
    return result;
  }
  double minX = numeric_limits<double>::max();
  double minY = numeric_limits<double>::max();
  double maxX = numeric_limits<double>::lowest();
  double maxY = numeric_limits<double>::lowest();
  for (const auto& key : keys) {
    minX = min(minX, key.bounds.left);
    minY = min(minY, key.bounds.top);
    maxX = max(maxX, key.bounds.right());
    maxY = max(maxY, key.bounds.bottom());
  }
  result.minX = minX;
  result.minY = minY;
  result.width = max(maxX - minX, 0.0);
  result.height = max(maxY - minY, 0.0);
  return result;
}

namespace {

class LayoutReader
{
  const Config& config;
  const KeycodeTable& keycodes;
  vector<string> errors;

public:
  LayoutReader(const Config& config, const KeycodeTable& keycodes)
    : config(config)
    , keycodes(keycodes)
  {
  }

  LayoutModel read()
  {
    LayoutModel layout;
    readOverlay(layout.overlay);
    if (config.has("keys")) {
      const auto& keys = config.node("keys");
      if (!keys.is_sequence()) {
        errors.push_back("'keys' must be a list of key definitions");
      } else {
        size_t index = 0;
        for (const auto& item : keys) {
          readKey(item, index++, layout);
        }
      }
    }

    if (!errors.empty()) {
      stringstream ss;
      ss << "Errors found in configuration '" << config.path() << "':";
      for (const auto& error : errors) {
        ss << "\n- " << error;
      }
      throw LayoutError(ss.str());
    }
    return layout;
  }

private:
  optional<SizeDimension> readSize(const string& path)
  {
    if (!config.has(path)) {
      return nullopt;
    }
    const auto& node = config.node(path);
    if (node.is_integer()) {
      auto px = node.get_value<int64_t>();
      if (px < 0) {
        errors.push_back(path + " must not be negative");
        return nullopt;
      }
      return SizeDimension::pixels(static_cast<uint32_t>(px));
    }
    if (node.is_float_number()) {
      auto ratio = node.get_value<double>();
      if (ratio < 0.0) {
        errors.push_back(path + " must not be negative");
        return nullopt;
      }
      return SizeDimension::ratio(ratio);
    }
    errors.push_back(path + " must be an integer (pixels) or a float (ratio)");
    return nullopt;
  }

  void readColor(const string& path, Color& target)
  {
    if (!config.has(path)) {
      return;
    }
    try {
      target = parseColor(config.get<string>(path));
    } catch (const exception& e) {
      errors.push_back(path + ": " + e.what());
    }
  }

  void readMargin(const string& path, int& target)
  {
    if (!config.has(path)) {
      return;
    }
    try {
      target = static_cast<int>(numberValue(config.node(path)));
    } catch (const exception& e) {
      errors.push_back(path + ": " + e.what());
    }
  }

  void readOverlay(OverlaySettings& overlay)
  {
    if (!config.has("overlay")) {
      return;
    }
    overlay.height.reset();

    static const set<string> known = {
      "screen",
      "position",
      "font_path",
      "size_width",
      "size_height",
      "margin_top",
      "margin_right",
      "margin_bottom",
      "margin_left",
      "background_color_inactive",
      "background_color_active",
      "default_key_background_color",
      "default_key_text_color",
      "default_key_outline_color",
      "active_key_background_color",
      "active_key_text_color",
    };
    for (const auto& key : config.get_keys("overlay")) {
      if (!known.contains(key)) {
        layoutLogger()->warn("ignoring unknown overlay setting '{}'", key);
      }
    }

    try {
      if (config.has("overlay.screen")) {
        const auto& screen = config.node("overlay.screen");
        overlay.screen = screen.is_integer()
                           ? to_string(screen.get_value<int64_t>())
                           : screen.get_value<string>();
      }
      if (config.has("overlay.position")) {
        overlay.position = parsePosition(config.get<string>("overlay.position"));
      }
      if (config.has("overlay.font_path")) {
        overlay.fontPath = config.get<string>("overlay.font_path");
      }
    } catch (const exception& e) {
      errors.push_back(string("overlay: ") + e.what());
    }

    overlay.width = readSize("overlay.size_width");
    overlay.height = readSize("overlay.size_height");
    readMargin("overlay.margin_top", overlay.marginTop);
    readMargin("overlay.margin_right", overlay.marginRight);
    readMargin("overlay.margin_bottom", overlay.marginBottom);
    readMargin("overlay.margin_left", overlay.marginLeft);

    readColor("overlay.background_color_inactive", overlay.backgroundInactive);
    readColor("overlay.background_color_active", overlay.backgroundActive);
    readColor("overlay.default_key_background_color", overlay.keyBackground);
    readColor("overlay.default_key_text_color", overlay.keyText);
    readColor("overlay.default_key_outline_color", overlay.keyOutline);
    readColor("overlay.active_key_background_color", overlay.activeKeyBackground);
    overlay.activeKeyText = overlay.keyText;
    readColor("overlay.active_key_text_color", overlay.activeKeyText);
  }

  optional<double> optionalNumber(const fkyaml::node& item,
                                  const string& field,
                                  const string& keyName)
  {
    if (!item.contains(field) || item.at(field).is_null()) {
      return nullopt;
    }
    try {
      return numberValue(item.at(field));
    } catch (const exception& e) {
      errors.push_back("Key '" + keyName + "' field '" + field + "': " + e.what());
      return nullopt;
    }
  }

  void readKey(const fkyaml::node& item, size_t index, LayoutModel& layout)
  {
    if (!item.is_mapping() || !item.contains("name") ||
        !item.at("name").is_string()) {
      errors.push_back("Key #" + to_string(index) + " needs a string 'name'");
      return;
    }

    KeySpec key;
    string name = item.at("name").get_value<string>();
    key.label = name;
    if (item.contains("label") && item.at("label").is_string()) {
      key.label = item.at("label").get_value<string>();
    }

    double* geometry[] = { &key.bounds.left,
                           &key.bounds.top,
                           &key.bounds.width,
                           &key.bounds.height };
    const char* fields[] = { "left", "top", "width", "height" };
    for (int i = 0; i < 4; i++) {
      auto value = optionalNumber(item, fields[i], name);
      if (!value.has_value()) {
        errors.push_back("Key '" + name + "' is missing '" + fields[i] + "'");
        continue;
      }
      *geometry[i] = *value;
    }
    if (key.bounds.width <= 0.0) {
      errors.push_back("Key '" + name + "' has invalid width: " +
                       to_string(key.bounds.width) + ". Width must be positive.");
    }
    if (key.bounds.height <= 0.0) {
      errors.push_back("Key '" + name + "' has invalid height: " +
                       to_string(key.bounds.height) + ". Height must be positive.");
    }

    if (auto v = optionalNumber(item, "rotation_degrees", name)) {
      key.style.rotationDegrees = *v;
    }
    if (auto v = optionalNumber(item, "text_size", name)) {
      if (*v <= 0.0) {
        errors.push_back("Key '" + name + "' has non-positive text_size");
      }
      key.style.textSize = *v;
    }
    if (auto v = optionalNumber(item, "corner_radius", name)) {
      if (*v < 0.0) {
        errors.push_back("Key '" + name + "' has negative corner_radius");
      }
      key.style.cornerRadius = *v;
    }
    if (auto v = optionalNumber(item, "border_thickness", name)) {
      if (*v < 0.0) {
        errors.push_back("Key '" + name + "' has negative border_thickness");
      }
      key.style.borderThickness = *v;
    }
    if (item.contains("background_color") && item.at("background_color").is_string()) {
      try {
        key.style.background =
          parseColor(item.at("background_color").get_value<string>());
      } catch (const exception& e) {
        errors.push_back("Key '" + name + "' background_color: " + e.what());
      }
    }

    resolveKeycode(item, name, key);
    layout.keys.push_back(key);
  }

  void resolveKeycode(const fkyaml::node& item, const string& name, KeySpec& key)
  {
    bool explicitCode = item.contains("keycode") && !item.at("keycode").is_null();
    try {
      if (explicitCode && item.at("keycode").is_integer()) {
        key.keycode = static_cast<uint32_t>(item.at("keycode").get_value<int64_t>());
        auto symbolic = keycodes.resolve(key.keycode);
        if (!symbolic.has_value()) {
          layoutLogger()->warn("key '{}' uses keycode {} which has no name; it "
                               "will be drawn but never highlighted",
                               name,
                               key.keycode);
          return;
        }
        key.name = *symbolic;
        return;
      }
      string codeName = explicitCode ? item.at("keycode").get_value<string>() : name;
      key.keycode = keycodes.lookup(codeName);
      key.name = keycodes.resolve(key.keycode).value_or("");
    } catch (const exception& e) {
      if (explicitCode) {
        errors.push_back("Error processing keycode for key '" + name + "': " +
                         e.what());
      } else {
        errors.push_back("Error processing key '" + name +
                         "': Could not resolve default keycode from name ('" +
                         name + "'). Please specify a 'keycode' field. Details: " +
                         e.what());
      }
    }
  }
};

}

LayoutModel
loadLayout(const Config& config, const KeycodeTable& keycodes)
{
  LayoutReader reader(config, keycodes);
  auto layout = reader.read();
  layoutLogger()->info("loaded {} keys from '{}'", layout.keys.size(), config.path());
  return layout;
}

LayoutModel
loadLayout(const string& path, const KeycodeTable& keycodes)
{
  try {
    Config config(path);
    return loadLayout(config, keycodes);
  } catch (const LayoutError&) {
    throw;
  } catch (const exception& e) {
    throw LayoutError(e.what());
  }
}

static string
describe(const KeySpec& key)
{
  stringstream ss;
  ss.setf(ios::fixed);
  ss.precision(1);
  ss << "'" << key.label << "' (at " << key.bounds.left << "," << key.bounds.top
     << " size " << key.bounds.width << "x" << key.bounds.height << ")";
  return ss.str();
}

vector<string>
validateLayout(const LayoutModel& layout)
{
  vector<string> problems;
  const auto& keys = layout.keys;

  for (size_t i = 0; i < keys.size(); i++) {
    for (size_t j = i + 1; j < keys.size(); j++) {
      if (keys[i].bounds.overlaps(keys[j].bounds)) {
        problems.push_back("Key " + describe(keys[i]) + " overlaps with key " +
                           describe(keys[j]));
      }
    }
  }

  map<uint32_t, string> seen;
  for (const auto& key : keys) {
    auto [it, inserted] = seen.emplace(key.keycode, key.label);
    if (!inserted) {
      problems.push_back("Duplicate keycode " + to_string(key.keycode) +
                         " detected. Used by key '" + it->second + "' and key '" +
                         key.label + "'.");
    }
  }

  for (const auto& key : keys) {
    if (key.bounds.width <= 0.0 || key.bounds.height <= 0.0) {
      problems.push_back("Key " + describe(key) + " has a non-positive size");
    }
    if (key.style.textSize <= 0.0) {
      problems.push_back("Key '" + key.label + "' has non-positive text_size");
    }
    if (key.style.cornerRadius < 0.0) {
      problems.push_back("Key '" + key.label + "' has negative corner_radius");
    }
    if (key.style.borderThickness < 0.0) {
      problems.push_back("Key '" + key.label + "' has negative border_thickness");
    }
  }
  return problems;
}
