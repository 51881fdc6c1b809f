#pragma once

#include <memory>
#include <optional>
#include <string>

#include <cairo.h>
#include <ft2build.h>
#include FT_FREETYPE_H

#include "logger.h"

// The face every label is drawn with: a FreeType face bridged to cairo when a
// font file is configured and loads, otherwise cairo's toy "monospace".
class FontFace
{
  std::shared_ptr<spdlog::logger> logger;
  FT_Face face = nullptr;
  cairo_font_face_t* cairoFace = nullptr;

  bool loadFile(const std::string& path);

public:
  explicit FontFace(const std::optional<std::string>& path);
  ~FontFace();
  FontFace(const FontFace&) = delete;
  FontFace& operator=(const FontFace&) = delete;

  cairo_font_face_t* get() const { return cairoFace; }
  bool isFreeType() const { return face != nullptr; }

  // False for malformed UTF-8 or, with a FreeType face, any codepoint the
  // face has no glyph for.
  bool canRender(const std::string& text) const;
};
