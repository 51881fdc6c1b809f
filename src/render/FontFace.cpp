#include "render/FontFace.h"
#include "render/TextFit.h"

#include <cairo-ft.h>

using namespace std;

static const cairo_user_data_key_t ftFaceKey = {};

// Faces created from it may outlive any single FontFace inside cairo's font
// cache, so the library is never released.
static FT_Library
freetypeLibrary()
{
  static FT_Library library = [] {
    FT_Library lib = nullptr;
    if (FT_Init_FreeType(&lib) != 0) {
      return static_cast<FT_Library>(nullptr);
    }
    return lib;
  }();
  return library;
}

static void
destroyFtFace(void* data)
{
  FT_Done_Face(static_cast<FT_Face>(data));
}

FontFace::FontFace(const optional<string>& path)
{
  logger = makeLogger("Renderer");
  if (path.has_value() && loadFile(*path)) {
    logger->info("using font {}", *path);
    return;
  }
  if (path.has_value()) {
    logger->warn("falling back to the monospace toy font");
  } else {
    logger->info("no font_path configured; using the monospace toy font");
  }
  cairoFace = cairo_toy_font_face_create(
    "monospace", CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);
}

FontFace::~FontFace()
{
  if (cairoFace != nullptr) {
    cairo_font_face_destroy(cairoFace);
  }
}

bool
FontFace::loadFile(const string& path)
{
  auto library = freetypeLibrary();
  if (library == nullptr) {
    logger->error("FreeType could not be initialised");
    return false;
  }
  FT_Face loaded = nullptr;
  FT_Error err = FT_New_Face(library, path.c_str(), 0, &loaded);
  if (err != 0) {
    logger->error("failed to load font '{}' (FreeType error {})", path, err);
    return false;
  }

  auto created = cairo_ft_font_face_create_for_ft_face(loaded, 0);
  if (cairo_font_face_status(created) != CAIRO_STATUS_SUCCESS) {
    logger->error("cairo rejected font '{}': {}",
                  path,
                  cairo_status_to_string(cairo_font_face_status(created)));
    cairo_font_face_destroy(created);
    FT_Done_Face(loaded);
    return false;
  }
  // The FT_Face is released together with the last cairo reference.
  auto status =
    cairo_font_face_set_user_data(created, &ftFaceKey, loaded, destroyFtFace);
  if (status != CAIRO_STATUS_SUCCESS) {
    cairo_font_face_destroy(created);
    FT_Done_Face(loaded);
    return false;
  }
  face = loaded;
  cairoFace = created;
  return true;
}

bool
FontFace::canRender(const string& text) const
{
  auto codepoints = decodeUtf8(text);
  if (!codepoints.has_value()) {
    return false;
  }
  if (face == nullptr) {
    return true;
  }
  for (auto cp : *codepoints) {
    if (FT_Get_Char_Index(face, cp) == 0) {
      return false;
    }
  }
  return true;
}
