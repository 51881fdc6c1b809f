#include "Check.h"
#include "render/FontFace.h"
#include "render/TextFit.h"

#include <cairo.h>
#include <spdlog/fmt/fmt.h>

using namespace std;

static string
describeSize(const optional<SizeDimension>& size, const string& derivedFrom)
{
  if (!size.has_value()) {
    return "Derived from " + derivedFrom;
  }
  if (size->kind == SizeDimension::Kind::Pixels) {
    return fmt::format("{}px", static_cast<uint32_t>(size->value));
  }
  return fmt::format("{:.0f}% screen", size->value * 100.0);
}

static string
describeColor(const Color& color)
{
  auto channel = [](double v) { return static_cast<int>(v * 255.0 + 0.5); };
  return fmt::format("#{:02X}{:02X}{:02X}{:02X} (R:{:.2f} G:{:.2f} B:{:.2f} A:{:.2f})",
                     channel(color.r),
                     channel(color.g),
                     channel(color.b),
                     channel(color.a),
                     color.r,
                     color.g,
                     color.b,
                     color.a);
}

static void
printOverlay(const OverlaySettings& overlay, ostream& out)
{
  out << "\nOverlay Configuration:\n";
  out << fmt::format("  Screen:               {}\n",
                     overlay.screen.value_or("Compositor default"));
  out << fmt::format("  Position:             {}\n", positionName(overlay.position));
  out << fmt::format("  Size Width:           {}\n",
                     describeSize(overlay.width, "height/layout"));
  out << fmt::format("  Size Height:          {}\n",
                     describeSize(overlay.height, "width/layout"));
  out << fmt::format("  Margins (T,R,B,L):    {}, {}, {}, {}\n",
                     overlay.marginTop,
                     overlay.marginRight,
                     overlay.marginBottom,
                     overlay.marginLeft);
  out << fmt::format("  Font:                 {}\n",
                     overlay.fontPath.value_or("monospace (built-in)"));
  out << fmt::format("  Background Inactive:  {}\n",
                     describeColor(overlay.backgroundInactive));
  out << fmt::format("  Background Active:    {}\n",
                     describeColor(overlay.backgroundActive));
  out << fmt::format("  Default Key BG:       {}\n", describeColor(overlay.keyBackground));
  out << fmt::format("  Default Key Text:     {}\n", describeColor(overlay.keyText));
  out << fmt::format("  Default Key Outline:  {}\n", describeColor(overlay.keyOutline));
  out << fmt::format("  Active Key BG:        {}\n",
                     describeColor(overlay.activeKeyBackground));
  out << fmt::format("  Active Key Text:      {}\n", describeColor(overlay.activeKeyText));
}

int
runCheck(const string& configPath, const LayoutModel& layout, ostream& out)
{
  out << fmt::format("Performing configuration check for '{}'...\n", configPath);

  auto problems = validateLayout(layout);
  if (!problems.empty()) {
    out << "Configuration validation failed:\n";
    for (const auto& problem : problems) {
      out << "  - " << problem << "\n";
    }
    return 1;
  }
  out << "Basic validation (overlaps, duplicates, positive dimensions) passed.\n";

  auto surface = cairo_image_surface_create(CAIRO_FORMAT_A1, 1, 1);
  cairo_t* cr = cairo_create(surface);
  if (cairo_status(cr) != CAIRO_STATUS_SUCCESS) {
    out << "Failed to create a cairo context for text measurement: "
        << cairo_status_to_string(cairo_status(cr)) << "\n";
    cairo_destroy(cr);
    cairo_surface_destroy(surface);
    return 1;
  }
  FontFace font(layout.overlay.fontPath);
  cairo_set_font_face(cr, font.get());

  out << "\nKey Information (text metrics simulated with cairo):\n";
  out << fmt::format("{:<20} | {:<25} | {:<10} | {:<10} | {:<20}\n",
                     "Label (Name)",
                     "Bounding Box (L,T,R,B)",
                     "Keycode",
                     "Font Scale",
                     "Truncated Label");
  out << fmt::format("{:-<20}-+-{:-<25}-+-{:-<10}-+-{:-<10}-+-{:-<20}\n", "", "", "", "", "");

  for (const auto& key : layout.keys) {
    auto bbox = fmt::format("{:.1f},{:.1f}, {:.1f},{:.1f}",
                            key.bounds.left,
                            key.bounds.top,
                            key.bounds.right(),
                            key.bounds.bottom());
    string keycode = key.mapped() ? to_string(key.keycode)
                                  : to_string(key.keycode) + "?";
    if (!font.canRender(key.label)) {
      out << fmt::format("{:<20} | {:<25} | {:<10} | {:<10.2f} | {:<20}\n",
                         key.label,
                         bbox,
                         keycode,
                         1.0,
                         "(drawn as a box)");
      continue;
    }
    auto fitted = fitLabel(
      cr, key.label, key.bounds.width, key.bounds.height, key.style.textSize);
    double fontScale =
      key.style.textSize > 0.0 ? fitted.fontSize / key.style.textSize : 1.0;
    string truncated = fitted.truncatedChars > 0 ? fitted.text : "";
    out << fmt::format("{:<20} | {:<25} | {:<10} | {:<10.2f} | {:<20}\n",
                       key.label,
                       bbox,
                       keycode,
                       fontScale,
                       truncated);
  }

  cairo_destroy(cr);
  cairo_surface_destroy(surface);

  printOverlay(layout.overlay, out);
  out << "\nConfiguration check finished.\n";
  return 0;
}
