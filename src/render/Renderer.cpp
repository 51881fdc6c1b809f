#include "render/Renderer.h"
#include "render/TextFit.h"

#include <algorithm>
#include <cmath>

using namespace std;

LayoutTransform
computeTransform(const LayoutModel& layout, int width, int height)
{
  auto bounds = layout.bounds();
  double padding = layout.overlay.sizeConfigured()
                     ? 2.0
                     : max(min(width, height) * 0.05, 5.0);
  double drawW = max(width - 2.0 * padding, 0.0);
  double drawH = max(height - 2.0 * padding, 0.0);
  double scaleX = bounds.width > 0.0 ? drawW / bounds.width : 1.0;
  double scaleY = bounds.height > 0.0 ? drawH / bounds.height : 1.0;

  LayoutTransform transform;
  transform.scale = max(min(scaleX, scaleY), 0.01);
  transform.offsetX = padding + (drawW - bounds.width * transform.scale) / 2.0 -
                      bounds.minX * transform.scale;
  transform.offsetY = padding + (drawH - bounds.height * transform.scale) / 2.0 -
                      bounds.minY * transform.scale;
  return transform;
}

optional<LayoutTransform>
DrawingCache::lookup(int width, int height) const
{
  if (valid && this->width == width && this->height == height) {
    return transform;
  }
  return nullopt;
}

void
DrawingCache::store(int width, int height, const LayoutTransform& transform)
{
  this->width = width;
  this->height = height;
  this->transform = transform;
  valid = true;
}

Renderer::Renderer(shared_ptr<FontFace> font, optional<Color> background)
  : font(std::move(font))
  , background(background)
{
  logger = makeLogger("Renderer");
}

static void
setColor(cairo_t* cr, const Color& color)
{
  cairo_set_source_rgba(cr, color.r, color.g, color.b, color.a);
}

static void
roundedRect(cairo_t* cr, double width, double height, double radius)
{
  cairo_new_sub_path(cr);
  cairo_arc(cr, width - radius, radius, radius, -M_PI / 2.0, 0.0);
  cairo_arc(cr, width - radius, height - radius, radius, 0.0, M_PI / 2.0);
  cairo_arc(cr, radius, height - radius, radius, M_PI / 2.0, M_PI);
  cairo_arc(cr, radius, radius, radius, M_PI, 3.0 * M_PI / 2.0);
  cairo_close_path(cr);
}

void
Renderer::drawFallbackBox(cairo_t* cr, double width, double height, double fontSize)
{
  double boxW = fontSize * 0.6;
  double boxH = fontSize * 0.8;
  cairo_set_line_width(cr, max(fontSize / 12.0, 1.0));
  cairo_rectangle(cr, (width - boxW) / 2.0, (height - boxH) / 2.0, boxW, boxH);
  cairo_stroke(cr);
}

void
Renderer::drawKey(cairo_t* cr,
                  const KeySpec& key,
                  const OverlaySettings& overlay,
                  const LayoutTransform& transform,
                  bool pressed)
{
  double scale = transform.scale;
  double width = key.bounds.width * scale;
  double height = key.bounds.height * scale;
  double centerX = (key.bounds.left + key.bounds.width / 2.0) * scale + transform.offsetX;
  double centerY = (key.bounds.top + key.bounds.height / 2.0) * scale + transform.offsetY;

  const Color& fill = pressed ? overlay.activeKeyBackground
                              : key.style.background.value_or(overlay.keyBackground);
  const Color& text = pressed ? overlay.activeKeyText : overlay.keyText;

  cairo_save(cr);
  cairo_translate(cr, centerX, centerY);
  cairo_rotate(cr, key.style.rotationDegrees * M_PI / 180.0);
  cairo_translate(cr, -width / 2.0, -height / 2.0);

  roundedRect(cr, width, height, key.style.cornerRadius * scale);
  setColor(cr, fill);
  cairo_fill_preserve(cr);
  setColor(cr, overlay.keyOutline);
  cairo_set_line_width(cr, key.style.borderThickness * scale);
  cairo_stroke(cr);

  setColor(cr, text);
  double fontSize = key.style.textSize * scale;
  if (!font->canRender(key.label)) {
    logger->debug("label of key '{}' cannot be drawn with this font", key.name);
    drawFallbackBox(cr, width, height, fontSize);
    cairo_restore(cr);
    return;
  }

  auto fitted = fitLabel(cr, key.label, width, height, fontSize);
  cairo_set_font_size(cr, fitted.fontSize);
  cairo_text_extents_t extents;
  cairo_text_extents(cr, fitted.text.c_str(), &extents);
  cairo_move_to(cr,
                (width - extents.width) / 2.0 - extents.x_bearing,
                (height - extents.height) / 2.0 - extents.y_bearing);
  cairo_show_text(cr, fitted.text.c_str());
  cairo_restore(cr);
}

void
Renderer::render(const RenderTarget& target,
                 const LayoutModel& layout,
                 const KeyState& keyState)
{
  auto surface = cairo_image_surface_create_for_data(
    target.data, CAIRO_FORMAT_ARGB32, target.width, target.height, target.stride);
  if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) {
    logger->error("cannot wrap {}x{} buffer: {}",
                  target.width,
                  target.height,
                  cairo_status_to_string(cairo_surface_status(surface)));
    cairo_surface_destroy(surface);
    return;
  }
  cairo_t* cr = cairo_create(surface);

  cairo_save(cr);
  setColor(cr, background.value_or(layout.overlay.backgroundInactive));
  cairo_set_operator(cr, CAIRO_OPERATOR_SOURCE);
  cairo_paint(cr);
  cairo_restore(cr);

  auto transform = cache.lookup(target.width, target.height);
  if (!transform.has_value()) {
    transform = computeTransform(layout, target.width, target.height);
    cache.store(target.width, target.height, *transform);
    logger->debug("layout scale {:.3f} offset {:.1f},{:.1f} for {}x{}",
                  transform->scale,
                  transform->offsetX,
                  transform->offsetY,
                  target.width,
                  target.height);
  }

  cairo_set_font_face(cr, font->get());
  for (const auto& key : layout.keys) {
    bool pressed = key.mapped() && keyState.isPressed(key.name);
    drawKey(cr, key, layout.overlay, *transform, pressed);
  }

  if (cairo_status(cr) != CAIRO_STATUS_SUCCESS) {
    logger->error("drawing failed: {}", cairo_status_to_string(cairo_status(cr)));
  }
  cairo_destroy(cr);
  cairo_surface_flush(surface);
  cairo_surface_destroy(surface);
}
