#include <gtest/gtest.h>
#include <cstring>
#include <linux/input-event-codes.h>
#include <memory>
#include <vector>

#include "KeycodeTable.h"
#include "render/Renderer.h"
#include "render/TextFit.h"

namespace {

constexpr int SIZE = 100;

LayoutModel
singleKey()
{
  LayoutModel layout;
  // No overlay size: the renderer pads by max(5% of the short side, 5).
  layout.overlay.height.reset();
  KeySpec a;
  a.name = "a";
  a.label = "A";
  a.keycode = KEY_A;
  a.bounds = { 0, 0, 40, 40 };
  layout.keys.push_back(a);
  return layout;
}

struct Frame
{
  std::vector<uint32_t> pixels = std::vector<uint32_t>(SIZE * SIZE, 0xDEADBEEF);

  RenderTarget target()
  {
    return { reinterpret_cast<uint8_t*>(pixels.data()), SIZE, SIZE, SIZE * 4 };
  }
  uint32_t at(int x, int y) const { return pixels[y * SIZE + x]; }
};

KeyState
stateWithPressed(const LayoutModel& layout, uint32_t code)
{
  KeyStateTracker tracker(KeycodeTable::instance(), layout);
  RawEvent press;
  press.deviceId = 1;
  press.code = code;
  press.value = KeyValue::Pressed;
  tracker.apply(press);
  return tracker.current();
}

}

TEST(RenderSpec, TransformCentresTheLayout)
{
  auto layout = singleKey();
  auto transform = computeTransform(layout, SIZE, SIZE);
  ASSERT_DOUBLE_EQ(transform.scale, 2.25);
  ASSERT_DOUBLE_EQ(transform.offsetX, 5.0);
  ASSERT_DOUBLE_EQ(transform.offsetY, 5.0);

  // A wide surface letterboxes horizontally.
  transform = computeTransform(layout, 200, SIZE);
  ASSERT_DOUBLE_EQ(transform.scale, 2.25);
  ASSERT_DOUBLE_EQ(transform.offsetX, 55.0);
}

TEST(RenderSpec, ConfiguredSizeUsesTightPadding)
{
  auto layout = singleKey();
  layout.overlay.height = SizeDimension::ratio(0.3);
  auto transform = computeTransform(layout, SIZE, SIZE);
  ASSERT_DOUBLE_EQ(transform.scale, 96.0 / 40.0);
  ASSERT_DOUBLE_EQ(transform.offsetX, 2.0);
}

TEST(RenderSpec, CacheIsKeyedBySize)
{
  DrawingCache cache;
  ASSERT_FALSE(cache.lookup(10, 10).has_value());
  cache.store(10, 10, LayoutTransform{ 2.0, 1.0, 1.0 });
  ASSERT_DOUBLE_EQ(cache.lookup(10, 10)->scale, 2.0);
  ASSERT_FALSE(cache.lookup(10, 11).has_value());
  cache.invalidate();
  ASSERT_FALSE(cache.lookup(10, 10).has_value());
}

TEST(RenderSpec, PressedKeyUsesActiveBackground)
{
  auto layout = singleKey();
  Renderer renderer(std::make_shared<FontFace>(std::nullopt), std::nullopt);
  Frame frame;
  renderer.render(frame.target(), layout, stateWithPressed(layout, KEY_A));

  ASSERT_EQ(frame.at(20, 20), 0xFFA0A0F0u);
  // Outside every key only the inactive background remains.
  ASSERT_EQ(frame.at(97, 97), 0x00000000u);
}

TEST(RenderSpec, ReleasedKeyUsesDefaultBackground)
{
  auto layout = singleKey();
  Renderer renderer(std::make_shared<FontFace>(std::nullopt), std::nullopt);
  Frame frame;
  KeyStateTracker tracker(KeycodeTable::instance(), layout);
  renderer.render(frame.target(), layout, tracker.current());

  ASSERT_EQ(frame.at(20, 20) >> 24, 0x80u);
  ASSERT_NE(frame.at(20, 20), 0xFFA0A0F0u);
}

TEST(RenderSpec, WindowBackgroundReplacesTheOverlayBackground)
{
  auto layout = singleKey();
  Renderer renderer(std::make_shared<FontFace>(std::nullopt), parseColor("#000000FF"));
  Frame frame;
  KeyStateTracker tracker(KeycodeTable::instance(), layout);
  renderer.render(frame.target(), layout, tracker.current());

  ASSERT_EQ(frame.at(1, 1), 0xFF000000u);
}

TEST(RenderSpec, RenderingIsDeterministic)
{
  auto layout = singleKey();
  auto state = stateWithPressed(layout, KEY_A);
  Renderer renderer(std::make_shared<FontFace>(std::nullopt), std::nullopt);

  Frame first;
  Frame second;
  renderer.render(first.target(), layout, state);
  renderer.render(second.target(), layout, state);
  ASSERT_EQ(std::memcmp(first.pixels.data(),
                        second.pixels.data(),
                        first.pixels.size() * sizeof(uint32_t)),
            0);
}

TEST(RenderSpec, UndrawableLabelGetsABoxAndTheFrameCarriesOn)
{
  LayoutModel layout;
  layout.overlay.height.reset();
  KeySpec bad;
  bad.name = "a";
  bad.label = "\xFF";
  bad.keycode = KEY_A;
  bad.bounds = { 0, 0, 40, 40 };
  KeySpec good;
  good.name = "b";
  good.label = "B";
  good.keycode = KEY_B;
  good.bounds = { 50, 0, 40, 40 };
  layout.keys = { bad, good };

  Renderer renderer(std::make_shared<FontFace>(std::nullopt), std::nullopt);
  Frame frame;
  KeyStateTracker tracker(KeycodeTable::instance(), layout);
  renderer.render(frame.target(), layout, tracker.current());

  // Scale 1, so the keys land at x 5..45 and 55..95, y 30..70.
  ASSERT_EQ(frame.at(35, 50) >> 24, 0x80u);
  ASSERT_EQ(frame.at(60, 50) >> 24, 0x80u);
  ASSERT_EQ(frame.at(50, 50), 0x00000000u);
  // Left edge of the 10.8x14.4 box centred on the bad key.
  ASSERT_NE(frame.at(19, 50), frame.at(35, 50));
}

class TextFitSpec : public ::testing::Test
{
protected:
  cairo_surface_t* surface = nullptr;
  cairo_t* cr = nullptr;

  void SetUp() override
  {
    surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, 16, 16);
    cr = cairo_create(surface);
    font = std::make_unique<FontFace>(std::nullopt);
    cairo_set_font_face(cr, font->get());
  }

  void TearDown() override
  {
    cairo_destroy(cr);
    cairo_surface_destroy(surface);
  }

  std::unique_ptr<FontFace> font;
};

TEST_F(TextFitSpec, ShortLabelsAreUntouched)
{
  auto fitted = fitLabel(cr, "A", 100, 100, 18);
  ASSERT_EQ(fitted.text, "A");
  ASSERT_DOUBLE_EQ(fitted.fontSize, 18);
  ASSERT_EQ(fitted.truncatedChars, 0u);
}

TEST_F(TextFitSpec, LongLabelsShrinkThenTruncate)
{
  std::string label = "ABCDEFGHIJKLMNOP";
  auto fitted = fitLabel(cr, label, 30, 30, 18);
  ASSERT_DOUBLE_EQ(fitted.fontSize, 9);
  ASSERT_GT(fitted.truncatedChars, 0u);
  ASSERT_EQ(fitted.text.size() + fitted.truncatedChars, label.size());
  ASSERT_EQ(label.rfind(fitted.text, 0), 0u);
}

TEST_F(TextFitSpec, TruncationDropsWholeCodepoints)
{
  std::string label = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";
  auto fitted = fitLabel(cr, label, 20, 20, 18);
  ASSERT_TRUE(decodeUtf8(fitted.text).has_value());
  ASSERT_EQ(fitted.text.size() % 2, 0u);
}

TEST_F(TextFitSpec, MalformedTextIsReturnedAsIs)
{
  std::string label = "\xFF\xFE";
  auto fitted = fitLabel(cr, label, 1, 1, 18);
  ASSERT_EQ(fitted.text, label);
  ASSERT_EQ(fitted.truncatedChars, 0u);
}

TEST(RenderSpec, DecodesUtf8)
{
  auto decoded = decodeUtf8("a\xE2\x86\x90");
  ASSERT_TRUE(decoded.has_value());
  ASSERT_EQ(*decoded, (std::vector<uint32_t>{ 'a', 0x2190 }));

  ASSERT_FALSE(decodeUtf8("\xC0\x80").has_value());
  ASSERT_FALSE(decodeUtf8("\xED\xA0\x80").has_value());
  ASSERT_FALSE(decodeUtf8("\xE2\x86").has_value());
}
