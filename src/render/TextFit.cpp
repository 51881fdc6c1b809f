#include "render/TextFit.h"

#include <algorithm>

using namespace std;

optional<vector<uint32_t>>
decodeUtf8(const string& text)
{
  vector<uint32_t> codepoints;
  size_t i = 0;
  while (i < text.size()) {
    auto lead = static_cast<unsigned char>(text[i]);
    uint32_t cp;
    size_t extra;
    if (lead < 0x80) {
      cp = lead;
      extra = 0;
    } else if ((lead & 0xE0) == 0xC0) {
      cp = lead & 0x1F;
      extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
      cp = lead & 0x0F;
      extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
      cp = lead & 0x07;
      extra = 3;
    } else {
      return nullopt;
    }
    if (i + extra >= text.size()) {
      return nullopt;
    }
    for (size_t k = 1; k <= extra; k++) {
      auto next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0) != 0x80) {
        return nullopt;
      }
      cp = (cp << 6) | (next & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    static const uint32_t minimum[] = { 0, 0x80, 0x800, 0x10000 };
    if (cp < minimum[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return nullopt;
    }
    codepoints.push_back(cp);
    i += extra + 1;
  }
  return codepoints;
}

static void
popCodepoint(string& text)
{
  while (!text.empty()) {
    auto last = static_cast<unsigned char>(text.back());
    text.pop_back();
    if ((last & 0xC0) != 0x80) {
      return;
    }
  }
}

static double
measure(cairo_t* cr, const string& text, double fontSize)
{
  if (text.empty()) {
    return 0.0;
  }
  cairo_text_extents_t extents;
  cairo_save(cr);
  cairo_set_font_size(cr, fontSize);
  cairo_text_extents(cr, text.c_str(), &extents);
  cairo_restore(cr);
  return extents.width;
}

FittedLabel
fitLabel(cairo_t* cr,
         const string& text,
         double keyWidth,
         double keyHeight,
         double fontSize)
{
  FittedLabel result{ text, fontSize, 0 };
  auto codepoints = decodeUtf8(text);
  if (!codepoints.has_value()) {
    return result;
  }

  double padding = max(min(keyWidth, keyHeight) * LABEL_PADDING_FACTOR,
                       LABEL_MIN_PADDING);
  double maxWidth = max(keyWidth - 2.0 * padding, 0.0);
  double minFont = max(fontSize * LABEL_MIN_FONT_FACTOR, LABEL_MIN_FONT_SIZE);

  double width = measure(cr, result.text, result.fontSize);
  while (width > maxWidth && result.fontSize > minFont) {
    result.fontSize = max(result.fontSize * LABEL_SHRINK_STEP, minFont);
    width = measure(cr, result.text, result.fontSize);
  }

  while (width > maxWidth && !result.text.empty()) {
    popCodepoint(result.text);
    result.truncatedChars++;
    width = measure(cr, result.text, result.fontSize);
  }
  return result;
}
